#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "inc/config.hpp"
#include "inc/fileSeeker.hpp"

// run with ./seeker -i cpp
int main(int argc, const char* argv[]) {
    std::string usage_prompt = seeker_usage(argv[0]);

    SeekerConfig config;
    try {
        config = parse_seeker_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR, " << e.what() << "\r\n" << usage_prompt;
        return -1;
    }
    if (config.show_help) {
        std::cerr << usage_prompt;
        return -1;
    }

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "ERROR: cannot read current directory: " << ec.message() << "\r\n";
        return -1;
    }

    std::size_t file_count = write_found_files(std::cout, cwd, sanitize_extension(config.extension), config.index);
    if (file_count == 0) {
        std::cerr << "Error: No Files Found with extension ." << config.extension;
        std::cerr.flush();
        return 1;
    }
    return 0;
}
