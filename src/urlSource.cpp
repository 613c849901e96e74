#include "../inc/urlSource.hpp"

#include <filesystem>
#include <fstream>

namespace {
const char* const g_whitespace = " \t\r\n\f\v";
}

UrlSourceError::UrlSourceError(const std::string& filename)
    : std::runtime_error("cannot open input file: " + filename), m_filename(filename) {}

std::string trim(const std::string& str) {
    std::size_t first = str.find_first_not_of(g_whitespace);
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = str.find_last_not_of(g_whitespace);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> load_urls(std::istream& in) {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        urls.push_back(trim(line));
    }
    return urls;
}

std::vector<std::string> load_urls(const std::string& filename) {
    std::error_code ec;
    if (std::filesystem::is_directory(filename, ec)) {
        throw UrlSourceError(filename);
    }
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw UrlSourceError(filename);
    }
    std::vector<std::string> urls = load_urls(file);
    if (file.bad()) {
        throw UrlSourceError(filename);
    }
    return urls;
}

void fill_queue(WorkQueue& queue, const std::vector<std::string>& urls) {
    for (const auto& url : urls) {
        queue.enqueue(url);
    }
}
