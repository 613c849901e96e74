#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

class TestSuite {
   public:
    using TestFn = std::function<void()>;

    void add(std::string name, TestFn fn) { m_tests.push_back({std::move(name), std::move(fn)}); }

    int run() const {
        int failures = 0;
        for (const auto& t : m_tests) {
            try {
                t.second();
                std::cout << "[PASS] " << t.first << "\n";
            } catch (const std::exception& ex) {
                ++failures;
                std::cout << "[FAIL] " << t.first << ": " << ex.what() << "\n";
            }
        }
        std::cout << "Summary: " << (m_tests.size() - static_cast<size_t>(failures)) << "/" << m_tests.size()
                  << " passed\n";
        return failures == 0 ? 0 : 1;
    }

   private:
    std::vector<std::pair<std::string, TestFn>> m_tests;
};

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) {
        throw std::runtime_error(msg);
    }
}

inline void expect_eq(long long got, long long expected, const std::string& msg) {
    if (got != expected) {
        throw std::runtime_error(msg + " (got=" + std::to_string(got) + ", expected=" + std::to_string(expected) + ")");
    }
}

inline void expect_str(const std::string& got, const std::string& expected, const std::string& msg) {
    if (got != expected) {
        throw std::runtime_error(msg + " (got=\"" + got + "\", expected=\"" + expected + "\")");
    }
}

template <typename Exception>
void expect_throws(const std::function<void()>& fn, const std::string& msg) {
    bool threw = false;
    try {
        fn();
    } catch (const Exception&) {
        threw = true;
    }
    expect_true(threw, msg);
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// splits captured stream output into lines, the trailing newline yields no empty entry
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}
