#include "../inc/statusReporter.hpp"

#include "../inc/defines.hpp"

StatusReporter::StatusReporter(std::ostream& success_out, std::ostream& error_out)
    : m_success_out(success_out), m_error_out(error_out) {}

void StatusReporter::report(const UrlCheck& check) {
    std::ostream& out = is_success(check) ? m_success_out : m_error_out;
    std::lock_guard<std::mutex> log_lock(m_log_mut);
    out << status_line(check) << '\n';
    out.flush();
}

void StatusReporter::log(const std::string& message, const char* color) {
    std::lock_guard<std::mutex> log_lock(m_log_mut);
    m_error_out << color << message << "\r\n" << ANSI_RESET;
    m_error_out.flush();
}

void StatusReporter::log(const UrlCheck& check) {
    std::lock_guard<std::mutex> log_lock(m_log_mut);
    m_error_out << check;
    m_error_out.flush();
}
