#pragma once

#include <string>

struct CheckerConfig {
    std::string input_file{"urls.txt"};
    int verbose{1};  // 1 - status lines only, 2 - plus worker pool logs
    bool show_help{false};
};

struct SeekerConfig {
    std::string extension{""};
    bool index{false};
    bool show_help{false};
};

std::string checker_usage(const std::string& program);
std::string seeker_usage(const std::string& program);

// both throw std::invalid_argument naming the offending argument
CheckerConfig parse_checker_args(int argc, const char* argv[]);
SeekerConfig parse_seeker_args(int argc, const char* argv[]);
