#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

// Emitted once per honeytoken occurrence; handlers only observe it.
struct AlertEvent {
    const std::string value;
    const std::string category;
    const std::chrono::system_clock::time_point timestamp;
};

using AlertCallback = std::function<void(const AlertEvent&)>;

// Bait-value lookup plus alert sink (in-memory set, database, SIEM bridge, ...).
class HoneytokenHandler {
public:
    virtual ~HoneytokenHandler() = default;
    virtual bool is_honeytoken(const std::string& value) const = 0;
    virtual void on_detected(const AlertEvent& event) = 0;
};

// In-memory bait set. Alerts go to log_fd and to the optional callback.
class SimpleHoneytokenHandler : public HoneytokenHandler {
public:
    explicit SimpleHoneytokenHandler(const std::vector<std::string>& honeytokens,
                                     AlertCallback callback = nullptr,
                                     int log_fd = 2);

    bool is_honeytoken(const std::string& value) const override;
    void on_detected(const AlertEvent& event) override;

    size_t size() const { return tokens_.size(); }

private:
    std::unordered_set<std::string> tokens_;
    AlertCallback callback_;
    int log_fd_;
};

std::string format_alert(const AlertEvent& event);
