#include <stdexcept>
#include <string>
#include <vector>

#include "../inc/config.hpp"
#include "testSuite.hpp"

namespace {
CheckerConfig checker(std::vector<const char*> args) {
    args.insert(args.begin(), "sitestatus");
    return parse_checker_args(static_cast<int>(args.size()), args.data());
}

SeekerConfig seeker(std::vector<const char*> args) {
    args.insert(args.begin(), "seeker");
    return parse_seeker_args(static_cast<int>(args.size()), args.data());
}
}  // namespace

class ConfigTests {
   public:
    static void register_all(TestSuite& suite) {
        suite.add("checker defaults to urls.txt and verbose 1", checker_defaults);
        suite.add("checker accepts short and long input flags", checker_input_flags);
        suite.add("checker verbose level is validated", checker_verbose);
        suite.add("checker rejects unknown flags and missing arguments", checker_rejects);
        suite.add("checker help flag", checker_help);
        suite.add("seeker takes extension and index flag", seeker_flags);
        suite.add("seeker requires exactly one extension", seeker_rejects);
    }

   private:
    static void checker_defaults() {
        CheckerConfig config = checker({});
        expect_str(config.input_file, "urls.txt", "default input");
        expect_eq(config.verbose, 1, "default verbose");
        expect_true(!config.show_help, "no help");
    }

    static void checker_input_flags() {
        expect_str(checker({"-i", "list.txt"}).input_file, "list.txt", "short flag");
        expect_str(checker({"--input", "other.txt"}).input_file, "other.txt", "long flag");
    }

    static void checker_verbose() {
        expect_eq(checker({"-vb", "2"}).verbose, 2, "short verbose");
        expect_eq(checker({"--verbose", "1", "-i", "x"}).verbose, 1, "long verbose");
        expect_throws<std::invalid_argument>([] { checker({"-vb", "abc"}); }, "non numeric verbose");
        expect_throws<std::invalid_argument>([] { checker({"-vb", "3"}); }, "verbose out of range");
        expect_throws<std::invalid_argument>([] { checker({"-vb", "2x"}); }, "trailing garbage");
    }

    static void checker_rejects() {
        expect_throws<std::invalid_argument>([] { checker({"--workers", "8"}); }, "unknown flag");
        expect_throws<std::invalid_argument>([] { checker({"-i"}); }, "missing input argument");
        expect_throws<std::invalid_argument>([] { checker({"urls.txt"}); }, "positional argument");
    }

    static void checker_help() {
        expect_true(checker({"-h"}).show_help, "short help");
        expect_true(checker({"-i", "x", "--help"}).show_help, "long help");
    }

    static void seeker_flags() {
        SeekerConfig plain = seeker({"py"});
        expect_str(plain.extension, "py", "extension");
        expect_true(!plain.index, "no index");

        SeekerConfig indexed = seeker({".cpp", "--index"});
        expect_str(indexed.extension, ".cpp", "extension kept as typed");
        expect_true(indexed.index, "index");
        expect_true(seeker({"-i", "txt"}).index, "short index");
    }

    static void seeker_rejects() {
        expect_throws<std::invalid_argument>([] { seeker({}); }, "missing extension");
        expect_throws<std::invalid_argument>([] { seeker({"-i"}); }, "index only");
        expect_throws<std::invalid_argument>([] { seeker({"py", "txt"}); }, "two extensions");
        expect_throws<std::invalid_argument>([] { seeker({"-x", "py"}); }, "unknown flag");
    }
};

int main() {
    TestSuite suite;
    ConfigTests::register_all(suite);
    return suite.run();
}
