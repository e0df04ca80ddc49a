#include <tagden/extractor.hpp>
#include <tagden/codecs/packed_image.hpp>
#include <tagden/codecs/png.hpp>

#include <fstream>
#include <new>
#include <set>
#include <string>
#include <system_error>

namespace tagden {

namespace {

std::string quoted(const std::filesystem::path& path) {
    return "'" + path.string() + "'";
}

result ensure_directory(const std::filesystem::path& dir, bool& created) {
    created = false;
    if (dir.empty()) {
        return result::success();
    }
    std::error_code ec;
    created = std::filesystem::create_directories(dir, ec);
    if (ec) {
        return result::failure(error_code::io_error,
            "Failed to create directory " + quoted(dir) + ": " + ec.message());
    }
    return result::success();
}

} // namespace

result read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& data) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return result::failure(error_code::io_error, quoted(path) + " is not a regular file");
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return result::failure(error_code::io_error,
            "Failed to size " + quoted(path) + ": " + ec.message());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return result::failure(error_code::io_error, "Failed to open " + quoted(path));
    }

    try {
        data.resize(static_cast<std::size_t>(size));
    } catch (const std::bad_alloc&) {
        return result::failure(error_code::io_error,
            "Not enough memory to load " + quoted(path) + " (" + std::to_string(size) + " bytes)");
    }

    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return result::failure(error_code::io_error, "Failed to read " + quoted(path));
    }

    return result::success();
}

result extract_entry(std::span<const std::uint8_t> archive,
                     const directory_entry& entry,
                     const extract_options& options,
                     std::filesystem::path& destination,
                     reporter& log) {
    std::filesystem::path relative;
    auto res = normalize_path(entry.internal_path, relative, options.path_prefix);
    if (!res) return res;

    if (!payload_in_bounds(entry, archive.size())) {
        return result::failure(error_code::truncated_archive,
            "Payload of '" + entry.internal_path + "' (offset " +
            std::to_string(entry.payload_offset) + ", size " + std::to_string(entry.payload_size) +
            ") exceeds archive size " + std::to_string(archive.size()));
    }

    const auto put_path = options.output_dir / relative;
    const auto put_dir = put_path.parent_path();

    bool created = false;
    res = ensure_directory(put_dir, created);
    if (!res) return res;
    if (created) {
        log.debug("Creating directory " + quoted(put_dir) + " for extraction");
    }

    std::ofstream file(put_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return result::failure(error_code::io_error, "Failed to open " + quoted(put_path) + " for writing");
    }

    const auto payload = archive.subspan(entry.payload_offset, entry.payload_size);
    file.write(reinterpret_cast<const char*>(payload.data()),
               static_cast<std::streamsize>(payload.size()));
    file.close();
    if (!file) {
        return result::failure(error_code::io_error, "Failed to write " + quoted(put_path));
    }

    log.debug("Extracted file " + quoted(put_path));
    destination = put_path;
    return result::success();
}

result extract_all(std::span<const std::uint8_t> archive,
                   const extract_options& options,
                   std::vector<extracted_file>& files,
                   reporter& log) {
    files.clear();

    std::vector<directory_entry> entries;
    auto res = read_directory(archive, entries, log);
    if (!res) return res;

    log.info("Found " + std::to_string(entries.size()) + " files, extracting...");

    files.reserve(entries.size());
    for (auto& entry : entries) {
        std::filesystem::path destination;
        res = extract_entry(archive, entry, options, destination, log);
        if (!res) return res;
        files.push_back({std::move(entry), std::move(destination)});
    }

    return result::success();
}

result convert_images(std::span<const std::uint8_t> archive,
                      const std::vector<extracted_file>& files,
                      const extract_options& options,
                      std::size_t& converted,
                      reporter& log) {
    converted = 0;

    std::set<std::filesystem::path> destinations;
    for (const auto& file : files) {
        destinations.insert(file.destination);
    }

    for (const auto& file : files) {
        if (!packed_image_decoder::matches_extension(file.entry.internal_path)) {
            continue;
        }

        auto png_path = file.destination;
        png_path.replace_extension(PNG_EXTENSION);
        if (destinations.count(png_path) != 0) {
            log.warning("Not converting " + quoted(file.destination) + ": " + quoted(png_path) +
                        " is an extracted file");
            continue;
        }

        // Entries reaching this point were bounds checked by extract_entry
        const auto data = archive.subspan(file.entry.payload_offset, file.entry.payload_size);

        png_surface surface;
        auto res = packed_image_decoder::decode(data, surface, options.image_options);
        if (!res) {
            return result::failure(res.error,
                "Failed to decode " + quoted(file.destination) + ": " + res.message);
        }

        res = surface.save(png_path);
        if (!res) return res;

        log.debug("Decoded image " + quoted(png_path) + " (" + std::to_string(surface.width()) +
                  "x" + std::to_string(surface.height()) + ")");
        ++converted;
    }

    return result::success();
}

result run(const std::filesystem::path& archive_path,
           const extract_options& options,
           reporter& log) {
    log.info("Extracting assets from file " + quoted(archive_path));

    std::error_code ec;
    if (!std::filesystem::exists(archive_path, ec)) {
        return result::failure(error_code::archive_not_found,
            "Failed to find file " + quoted(archive_path));
    }

    std::vector<std::uint8_t> archive;
    auto res = read_file(archive_path, archive);
    if (!res) return res;

    bool created = false;
    res = ensure_directory(options.output_dir, created);
    if (!res) return res;
    if (created) {
        log.info("Created output directory " + quoted(options.output_dir));
    }

    std::vector<extracted_file> files;
    res = extract_all(archive, options, files, log);
    if (!res) return res;

    if (options.convert_images) {
        std::size_t converted = 0;
        res = convert_images(archive, files, options, converted, log);
        if (!res) return res;
        log.info("Converted " + std::to_string(converted) + " images");
    }

    log.info("All files extracted");
    return result::success();
}

} // namespace tagden
