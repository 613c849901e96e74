#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "dataStructs.hpp"

// Writes the one-line result of each check. Every line is written and flushed
// while holding the log mutex, so lines from different workers never mix.
class StatusReporter {
   public:
    StatusReporter(std::ostream& success_out, std::ostream& error_out);

    // success lines go to success_out, everything else to error_out
    void report(const UrlCheck& check);
    // diagnostic line on the error stream, only used with verbose logging
    void log(const std::string& message, const char* color);
    // colored diagnostic form of a finished check
    void log(const UrlCheck& check);

   private:
    std::ostream& m_success_out;
    std::ostream& m_error_out;
    std::mutex m_log_mut;
};
