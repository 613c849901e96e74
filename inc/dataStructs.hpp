#pragma once

#include <iostream>
#include <string>

enum class Outcome { Success, HttpError, OtherError };

struct ProbeResult {
    Outcome outcome{Outcome::OtherError};
    long status_code{0};  // final http status, 0 if no response arrived
    std::string detail{""};
};

struct UrlCheck {
    std::string url;
    ProbeResult result;
    friend std::ostream& operator<<(std::ostream& out, const UrlCheck& check);
};

// the exact line reported for a finished check, without the trailing newline
std::string status_line(const UrlCheck& check);
// true if the check is reported on the success stream
bool is_success(const UrlCheck& check);

// colored diagnostic form, used by verbose logging only
std::ostream& operator<<(std::ostream& out, const UrlCheck& check);
