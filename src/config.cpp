#include "../inc/config.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {
bool matches(const std::string& arg, const std::pair<std::string, std::string>& flag) {
    return arg == flag.first || arg == flag.second;
}
}  // namespace

std::string checker_usage(const std::string& program) {
    return "usage:" + program +
           " [options]\r\n\r\n"
           "OPTIONS\r\n"
           "-h, --help\t\t\t show list of command-line options\r\n"
           "-i, --input FILE\t\t file with one url per line (default urls.txt)\r\n"
           "-vb, --verbose VERBOSE\t\t 1 - status lines only, 2 - log internal worker pool\r\n";
}

std::string seeker_usage(const std::string& program) {
    return "usage:" + program +
           " [options] EXTENSION\r\n\r\n"
           "OPTIONS\r\n"
           "-h, --help\t\t\t show list of command-line options\r\n"
           "-i, --index\t\t\t print the index of each file found\r\n";
}

CheckerConfig parse_checker_args(int argc, const char* argv[]) {
    std::vector<std::pair<std::string, std::string>> flags = {{"-h", "--help"}, {"-i", "--input"}, {"-vb", "--verbose"}};
    CheckerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (matches(flag, flags.at(0))) {  // help
            config.show_help = true;
            return config;
        }
        if (!matches(flag, flags.at(1)) && !matches(flag, flags.at(2))) {
            throw std::invalid_argument("unknown option: " + flag);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing argument for: " + flag);
        }
        std::string argument = argv[++i];
        if (matches(flag, flags.at(1))) {  // input
            config.input_file = argument;
        } else {  // verbose
            std::size_t parsed{0};
            int level{0};
            try {
                level = std::stoi(argument, &parsed);
            } catch (const std::exception&) {
                throw std::invalid_argument("wrong argument: " + argument);
            }
            if (parsed != argument.size() || level < 1 || level > 2) {
                throw std::invalid_argument("wrong argument: " + argument);
            }
            config.verbose = level;
        }
    }
    return config;
}

SeekerConfig parse_seeker_args(int argc, const char* argv[]) {
    std::vector<std::pair<std::string, std::string>> flags = {{"-h", "--help"}, {"-i", "--index"}};
    SeekerConfig config;
    bool have_extension{false};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (matches(arg, flags.at(0))) {  // help
            config.show_help = true;
            return config;
        } else if (matches(arg, flags.at(1))) {  // index
            config.index = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '.') {
            throw std::invalid_argument("unknown option: " + arg);
        } else if (have_extension) {
            throw std::invalid_argument("unexpected argument: " + arg);
        } else {
            config.extension = arg;
            have_extension = true;
        }
    }
    if (!have_extension) {
        throw std::invalid_argument("missing EXTENSION");
    }
    return config;
}
