#include "../inc/dataStructs.hpp"

#include "../inc/defines.hpp"

std::string status_line(const UrlCheck& check) {
    switch (check.result.outcome) {
        case Outcome::Success:
            return "Successfully connected to " + check.url;
        case Outcome::HttpError:
            return "HTTP error occurred for " + check.url;
        case Outcome::OtherError:
            break;
    }
    return "Error occurred for " + check.url;
}

bool is_success(const UrlCheck& check) { return check.result.outcome == Outcome::Success; }

std::ostream& operator<<(std::ostream& out, const UrlCheck& check) {
    if (is_success(check)) {
        out << ANSI_GREEN << "{status:" << check.result.status_code << " url:" << check.url << "}\r\n" << ANSI_RESET;
    } else {
        out << ANSI_RED << "{status:" << check.result.status_code << " url:" << check.url
            << " reason:" << check.result.detail << "}\r\n"
            << ANSI_RESET;
    }
    return out;
}
