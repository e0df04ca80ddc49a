#include <doctest/doctest.h>
#include <tagden/tagden.hpp>
#include <lodepng.h>

#include "helpers/fixtures.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using row_words = std::optional<std::vector<std::uint16_t>>;

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return {text.begin(), text.end()};
}

std::vector<std::uint8_t> slurp(const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    REQUIRE(tagden::read_file(path, data).ok);
    return data;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::map<std::string, std::vector<std::uint8_t>> snapshot(const std::filesystem::path& root) {
    std::map<std::string, std::vector<std::uint8_t>> tree;
    for (const auto& item : std::filesystem::recursive_directory_iterator(root)) {
        const auto rel = std::filesystem::relative(item.path(), root).generic_string();
        if (item.is_regular_file()) {
            tree[rel] = slurp(item.path());
        } else {
            tree[rel + "/"] = {};
        }
    }
    return tree;
}

std::vector<std::uint8_t> sample_archive() {
    const std::uint16_t red = 0x7C00;
    const auto image = fixtures::make_packed_image(3, 2, {
        row_words{{1, 2, red, 0xFFFF, 0}},
        std::nullopt,
    });

    return fixtures::make_archive({
        {"l:\\scorpc\\game\\readme.txt", bytes_of("hello")},
        {"l:\\scorpc\\game\\data\\empty.dat", {}},
        {"l:\\scorpc\\game\\gfx\\title.TPK", image},
        {"l:\\scorpc\\game\\data\\level1\\map.bin", {1, 2, 3, 4}},
    });
}

} // namespace

TEST_CASE("Extractor: read_file") {
    fixtures::temp_dir dir;
    std::vector<std::uint8_t> data;

    SUBCASE("Regular file") {
        write_file(dir.path() / "a.bin", {1, 2, 3});
        REQUIRE(tagden::read_file(dir.path() / "a.bin", data).ok);
        CHECK(data == std::vector<std::uint8_t>{1, 2, 3});
    }

    SUBCASE("Empty file") {
        write_file(dir.path() / "empty.bin", {});
        REQUIRE(tagden::read_file(dir.path() / "empty.bin", data).ok);
        CHECK(data.empty());
    }

    SUBCASE("Directory") {
        write_file(dir.path() / "inside.txt", bytes_of("x"));
        auto result = tagden::read_file(dir.path(), data);
        CHECK_FALSE(result.ok);
        CHECK(result.error == tagden::error_code::io_error);
    }

    SUBCASE("Missing file") {
        auto result = tagden::read_file(dir.path() / "missing.bin", data);
        CHECK(result.error == tagden::error_code::io_error);
    }
}

TEST_CASE("Extractor: extract_all writes every entry") {
    fixtures::temp_dir dir;
    const auto archive = sample_archive();

    tagden::extract_options options;
    options.output_dir = dir.path() / "out";

    fixtures::recording_reporter log;
    std::vector<tagden::extracted_file> files;
    auto result = tagden::extract_all(archive, options, files, log);
    REQUIRE(result.ok);

    REQUIRE(files.size() == 4);
    CHECK(files[0].destination == options.output_dir / "readme.txt");
    CHECK(files[1].destination == options.output_dir / "data" / "empty.dat");
    CHECK(files[2].destination == options.output_dir / "gfx" / "title.TPK");
    CHECK(files[3].destination == options.output_dir / "data" / "level1" / "map.bin");
    CHECK(files[2].entry.internal_path == "l:\\scorpc\\game\\gfx\\title.TPK");

    CHECK(slurp(files[0].destination) == bytes_of("hello"));
    CHECK(std::filesystem::file_size(files[1].destination) == 0);
    CHECK(slurp(files[3].destination) == std::vector<std::uint8_t>{1, 2, 3, 4});

    CHECK(log.contains("Found 4 files, extracting..."));
    CHECK(log.contains("for extraction"));
    CHECK(log.contains("Extracted file"));
}

TEST_CASE("Extractor: existing files are replaced") {
    fixtures::temp_dir dir;
    const auto archive = fixtures::make_archive({
        {"l:\\scorpc\\game\\a.txt", bytes_of("new")},
    });

    tagden::extract_options options;
    options.output_dir = dir.path();
    write_file(dir.path() / "a.txt", bytes_of("much longer old contents"));

    tagden::null_reporter log;
    std::vector<tagden::extracted_file> files;
    REQUIRE(tagden::extract_all(archive, options, files, log).ok);
    CHECK(slurp(dir.path() / "a.txt") == bytes_of("new"));
}

TEST_CASE("Extractor: failures") {
    fixtures::temp_dir dir;
    tagden::extract_options options;
    options.output_dir = dir.path();
    tagden::null_reporter log;
    std::vector<tagden::extracted_file> files;

    SUBCASE("Payload beyond the archive") {
        auto archive = fixtures::make_archive({
            {"l:\\scorpc\\game\\a.txt", bytes_of("abcdef")},
        });
        archive.resize(archive.size() - 2);

        auto result = tagden::extract_all(archive, options, files, log);
        CHECK_FALSE(result.ok);
        CHECK(result.error == tagden::error_code::truncated_archive);
        CHECK_FALSE(std::filesystem::exists(dir.path() / "a.txt"));
    }

    SUBCASE("Unexpected path prefix") {
        const auto archive = fixtures::make_archive({
            {"c:\\elsewhere\\game\\a.txt", bytes_of("x")},
        });
        auto result = tagden::extract_all(archive, options, files, log);
        CHECK(result.error == tagden::error_code::invalid_path);
    }

    SUBCASE("First failure stops the run") {
        const auto archive = fixtures::make_archive({
            {"l:\\scorpc\\game\\ok.txt", bytes_of("x")},
            {"l:\\scorpc\\game\\..\\escape.txt", bytes_of("y")},
            {"l:\\scorpc\\game\\never.txt", bytes_of("z")},
        });
        auto result = tagden::extract_all(archive, options, files, log);
        CHECK(result.error == tagden::error_code::invalid_path);
        CHECK(std::filesystem::exists(dir.path() / "ok.txt"));
        CHECK_FALSE(std::filesystem::exists(dir.path() / "never.txt"));
    }

    SUBCASE("Destination directory blocked by a file") {
        write_file(dir.path() / "data", bytes_of("not a directory"));
        const auto archive = fixtures::make_archive({
            {"l:\\scorpc\\game\\data\\a.txt", bytes_of("x")},
        });
        auto result = tagden::extract_all(archive, options, files, log);
        CHECK(result.error == tagden::error_code::io_error);
    }
}

TEST_CASE("Extractor: convert_images writes PNG siblings") {
    fixtures::temp_dir dir;
    const auto archive = sample_archive();

    tagden::extract_options options;
    options.output_dir = dir.path();

    fixtures::recording_reporter log;
    std::vector<tagden::extracted_file> files;
    REQUIRE(tagden::extract_all(archive, options, files, log).ok);

    std::size_t converted = 0;
    REQUIRE(tagden::convert_images(archive, files, options, converted, log).ok);
    CHECK(converted == 1);

    const auto png_path = dir.path() / "gfx" / "title.png";
    REQUIRE(std::filesystem::exists(png_path));
    CHECK(std::filesystem::exists(dir.path() / "gfx" / "title.TPK"));
    CHECK(log.contains("(3x2)"));

    std::vector<unsigned char> pixels;
    unsigned w = 0;
    unsigned h = 0;
    REQUIRE(lodepng::decode(pixels, w, h, png_path.string(), LCT_RGB, 8) == 0);
    REQUIRE(w == 3);
    REQUIRE(h == 2);
    const std::vector<unsigned char> expected = {
        0, 0, 0,   248, 0, 0,   248, 248, 248,
        0, 0, 0,   0, 0, 0,     0, 0, 0,
    };
    CHECK(pixels == expected);
}

TEST_CASE("Extractor: convert_images keeps extracted files that share the PNG name") {
    fixtures::temp_dir dir;
    const auto image = fixtures::make_packed_image(1, 1, {row_words{{0, 1, 0xFFFF, 0}}});
    const auto archive = fixtures::make_archive({
        {"l:\\scorpc\\game\\gfx\\title.tpk", image},
        {"l:\\scorpc\\game\\gfx\\title.png", bytes_of("stored png")},
        {"l:\\scorpc\\game\\gfx\\logo.tpk", image},
    });

    tagden::extract_options options;
    options.output_dir = dir.path();

    fixtures::recording_reporter log;
    std::vector<tagden::extracted_file> files;
    REQUIRE(tagden::extract_all(archive, options, files, log).ok);

    std::size_t converted = 0;
    REQUIRE(tagden::convert_images(archive, files, options, converted, log).ok);
    CHECK(converted == 1);
    CHECK(slurp(dir.path() / "gfx" / "title.png") == bytes_of("stored png"));
    CHECK(std::filesystem::exists(dir.path() / "gfx" / "logo.png"));

    bool warned = false;
    for (const auto& [level, message] : log.messages) {
        if (level == tagden::severity::warning && message.find("title.png") != std::string::npos) {
            warned = true;
        }
    }
    CHECK(warned);
}

TEST_CASE("Extractor: convert_images reports decode failures") {
    fixtures::temp_dir dir;
    auto image = fixtures::make_packed_image(2, 1, {row_words{{0, 2, 0xFFFF}}});
    const auto archive = fixtures::make_archive({
        {"l:\\scorpc\\game\\broken.tpk", image},
    });

    tagden::extract_options options;
    options.output_dir = dir.path();
    tagden::null_reporter log;

    std::vector<tagden::extracted_file> files;
    REQUIRE(tagden::extract_all(archive, options, files, log).ok);

    std::size_t converted = 0;
    auto result = tagden::convert_images(archive, files, options, converted, log);
    CHECK_FALSE(result.ok);
    CHECK(result.error == tagden::error_code::truncated_image);
    CHECK(result.message.find("broken.tpk") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "broken.png"));
}

TEST_CASE("Extractor: run") {
    fixtures::temp_dir dir;
    const auto archive_path = dir.path() / "TAGDEN.BIN";
    write_file(archive_path, sample_archive());

    tagden::extract_options options;
    options.output_dir = dir.path() / "output";

    SUBCASE("Extracts and converts") {
        fixtures::recording_reporter log;
        REQUIRE(tagden::run(archive_path, options, log).ok);
        CHECK(std::filesystem::exists(options.output_dir / "readme.txt"));
        CHECK(std::filesystem::exists(options.output_dir / "gfx" / "title.png"));
        CHECK(log.contains("Extracting assets from file"));
        CHECK(log.contains("Created output directory"));
        CHECK(log.contains("All files extracted"));
    }

    SUBCASE("Image conversion can be disabled") {
        options.convert_images = false;
        tagden::null_reporter log;
        REQUIRE(tagden::run(archive_path, options, log).ok);
        CHECK(std::filesystem::exists(options.output_dir / "gfx" / "title.TPK"));
        CHECK_FALSE(std::filesystem::exists(options.output_dir / "gfx" / "title.png"));
    }

    SUBCASE("Running twice gives an identical tree") {
        tagden::null_reporter log;
        REQUIRE(tagden::run(archive_path, options, log).ok);
        const auto first = snapshot(options.output_dir);
        REQUIRE(tagden::run(archive_path, options, log).ok);
        const auto second = snapshot(options.output_dir);
        CHECK(first.size() == 8);
        CHECK(first == second);
    }

    SUBCASE("Archive path is a directory") {
        const auto not_a_file = dir.path() / "folder.bin";
        std::filesystem::create_directories(not_a_file);
        for (int i = 0; i < 50; ++i) {
            write_file(not_a_file / ("f" + std::to_string(i)), bytes_of("x"));
        }

        tagden::null_reporter log;
        auto result = tagden::run(not_a_file, options, log);
        CHECK_FALSE(result.ok);
        CHECK(result.error == tagden::error_code::io_error);
        CHECK(result.message.find("folder.bin") != std::string::npos);
        CHECK_FALSE(std::filesystem::exists(options.output_dir));
    }

    SUBCASE("Missing archive") {
        tagden::null_reporter log;
        auto result = tagden::run(dir.path() / "nope.bin", options, log);
        CHECK_FALSE(result.ok);
        CHECK(result.error == tagden::error_code::archive_not_found);
        CHECK(result.message.find("nope.bin") != std::string::npos);
        CHECK_FALSE(std::filesystem::exists(options.output_dir));
    }
}
