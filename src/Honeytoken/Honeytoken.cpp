#include "Honeytoken.hpp"
#include "Logger.hpp"
#include <ctime>
#include <utility>

SimpleHoneytokenHandler::SimpleHoneytokenHandler(const std::vector<std::string>& honeytokens,
                                                 AlertCallback callback,
                                                 int log_fd)
    : tokens_(honeytokens.begin(), honeytokens.end()),
      callback_(std::move(callback)),
      log_fd_(log_fd) {}

bool SimpleHoneytokenHandler::is_honeytoken(const std::string& value) const {
    return tokens_.count(value) != 0;
}

void SimpleHoneytokenHandler::on_detected(const AlertEvent& event) {
    log_line(log_fd_, "Honeytoken", format_alert(event));
    if (callback_) callback_(event);
}

// Desc: one-line description of an alert for the log
// In: const AlertEvent& event
// Out: std::string
std::string format_alert(const AlertEvent& event) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(event.timestamp);
    return "ALERT: honeytoken detected: " + event.value +
           " (category=" + event.category + ", ts=" + std::to_string(static_cast<long long>(ts)) + ")";
}
