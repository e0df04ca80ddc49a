#include <tagden/tagden.hpp>

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    tagden::stream_reporter log(std::cerr, tagden::severity::info);

    if (argc != 2) {
        log.error("Please specify path to '" + std::string(tagden::DEFAULT_ARCHIVE_NAME) +
                  "' as argument");
        std::cerr << "Usage: " << argv[0] << " <archive>\n";
        return 1;
    }

    const std::filesystem::path archive_path(argv[1]);
    tagden::extract_options options;

    auto result = tagden::run(archive_path, options, log);
    if (!result) {
        log.error(result.message);
        return 1;
    }

    return 0;
}
