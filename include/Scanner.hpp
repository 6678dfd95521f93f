#pragma once
#include "CircuitBreaker.hpp"
#include "Obfuscator.hpp"
#include "ScannerConfig.hpp"

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

class HoneytokenHandler;

extern const char* const kFloodSentinel;
extern const char* const kHoneytokenMarker;

// Per-category flood accounting starts above this many candidates in one call.
const std::size_t kFloodCandidateLimit = 10;

// Scan -> validate -> obfuscate pipeline for one logical log stream.
// Owns its breaker state; use one instance per thread.
class Scanner {
public:
    // [start, end) of tokens written during one sanitize() call
    using SpanList = std::vector<std::pair<std::size_t, std::size_t>>;

    explicit Scanner(ScannerConfig config);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    std::string sanitize(const std::string& text);

    // Objects per value, arrays per element, strings through sanitize().
    // Keys and non-string scalars are returned unchanged.
    nlohmann::json process_structure(const nlohmann::json& value);

    bool isEnabled(Category c) const { return enabled_[category_index(c)]; }
    ObfuscationMethod method() const { return config_.method; }
    const CircuitBreakerState& breakerState() const { return breaker_.state(); }

private:
    void honeytokenPass_(std::string& text, SpanList& replaced);
    void emitDiagnostic_(const Diagnostic& d) const;

    ScannerConfig config_;
    std::array<bool, kCategoryCount> enabled_{};
    std::unique_ptr<ObfuscationStrategy> strategy_;
    std::shared_ptr<HoneytokenHandler> honeytokens_;
    CircuitBreaker breaker_;
};
