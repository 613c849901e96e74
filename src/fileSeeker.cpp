#include "../inc/fileSeeker.hpp"

#include <system_error>

std::string sanitize_extension(const std::string& extension) {
    std::size_t first = extension.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    return extension.substr(first);
}

std::vector<std::filesystem::path> search_for_files(const std::filesystem::path& root, const std::string& extension) {
    namespace fs = std::filesystem;
    std::vector<fs::path> found;
    const std::string suffix = "." + extension;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return found;
    }
    fs::recursive_directory_iterator end;
    while (it != end) {
        std::string name = it->path().filename().string();
        if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            found.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    return found;
}

std::string format_found(std::size_t index, const std::filesystem::path& file_path, bool with_index) {
    if (with_index) {
        return std::to_string(index) + ": " + file_path.string() + " ";
    }
    return file_path.string() + " ";
}

std::size_t write_found_files(std::ostream& out, const std::filesystem::path& root, const std::string& extension,
                              bool with_index) {
    std::size_t file_count{0};
    for (const auto& file_path : search_for_files(root, extension)) {
        ++file_count;
        out << format_found(file_count, file_path, with_index) << '\n';
        out.flush();
    }
    return file_count;
}
