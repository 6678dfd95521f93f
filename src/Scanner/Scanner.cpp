#include "Scanner.hpp"
#include "Honeytoken.hpp"
#include "Logger.hpp"
#include "PatternMatcherHS.hpp"
#include "PatternRegistry.hpp"
#include "ValidatorRegistry.hpp"

#include <algorithm>
#include <utility>

namespace {

bool overlaps_any(const Scanner::SpanList& spans, const Candidate& cand) {
    for (const auto& span : spans) {
        if (cand.start < span.second && span.first < cand.end) return true;
    }
    return false;
}

// Desc: note that [start, old_end) became a token of new_len bytes; spans to
//       the right move by the size difference
// In/Out: Scanner::SpanList& spans
// In: std::size_t start, std::size_t old_end, std::size_t new_len
void record_splice(Scanner::SpanList& spans, std::size_t start, std::size_t old_end, std::size_t new_len) {
    for (auto& span : spans) {
        if (span.first >= old_end) {
            span.first = span.first - old_end + start + new_len;
            span.second = span.second - old_end + start + new_len;
        }
    }
    spans.emplace_back(start, start + new_len);
}

} // namespace

const char* const kFloodSentinel = "[OPAQUE: LOG FLOOD PROTECTION ACTIVATED - DATA DISCARDED]";
const char* const kHoneytokenMarker = "[HONEYTOKEN TRIGGERED]";

Scanner::Scanner(ScannerConfig config)
    : config_(std::move(config)),
      breaker_(config_.circuit_threshold, config_.cooldown, config_.breaker_clock) {
    for (Category c : config_.rules) enabled_[category_index(c)] = true;

    strategy_ = make_obfuscation_strategy(config_);

    honeytokens_ = config_.honeytoken_handler;
    if (!honeytokens_ && !config_.honeytokens.empty()) {
        honeytokens_ = std::make_shared<SimpleHoneytokenHandler>(config_.honeytokens, nullptr,
                                                                 config_.log_fd);
    }
}

// Desc: redact every validated candidate of the enabled categories
// In: const std::string& text
// Out: std::string (redacted text, or the flood sentinel)
std::string Scanner::sanitize(const std::string& text) {
    if (!breaker_.allow()) return kFloodSentinel;
    if (text.empty()) return text;

    // [Fast path] nothing shaped like any category
    if (config_.use_prefilter && !PatternMatcherHS::shared().matches(text)) return text;

    std::string out = text;
    SpanList replaced;
    if (honeytokens_) honeytokenPass_(out, replaced);

    const PatternRegistry& registry = PatternRegistry::instance();
    for (Category c : all_categories()) {
        std::vector<Candidate> candidates = registry.findCandidates(c, out);
        // tokens spliced in by this call are not input data
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const Candidate& cand) { return overlaps_any(replaced, cand); }),
                         candidates.end());
        if (candidates.empty()) continue;

        if (candidates.size() > kFloodCandidateLimit && breaker_.record(candidates.size())) {
            log_line(config_.log_fd, "Scanner",
                     "circuit breaker tripped at " + std::string(category_name(c)) + " (" +
                         std::to_string(breaker_.state().error_count) + " matches)");
            return kFloodSentinel;
        }
        if (!isEnabled(c)) continue;

        // Right to left so earlier offsets survive the splice.
        for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
            if (!validate(c, it->text)) {
                emitDiagnostic_(Diagnostic{c, it->text});
                continue;
            }
            const std::string token = strategy_->obfuscate(*it);
            out.replace(it->start, it->end - it->start, token);
            record_splice(replaced, it->start, it->end, token.size());
        }
    }
    return out;
}

// Desc: replace bait values with the honeytoken marker and raise one alert each
// In/Out: std::string& text, SpanList& replaced
void Scanner::honeytokenPass_(std::string& text, SpanList& replaced) {
    const PatternRegistry& registry = PatternRegistry::instance();
    const std::string marker = kHoneytokenMarker;
    for (Category c : all_categories()) {
        std::vector<Candidate> candidates = registry.findCandidates(c, text);
        for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
            if (overlaps_any(replaced, *it)) continue;
            if (!honeytokens_->is_honeytoken(it->text)) continue;
            honeytokens_->on_detected(
                AlertEvent{it->text, category_name(c), std::chrono::system_clock::now()});
            text.replace(it->start, it->end - it->start, marker);
            record_splice(replaced, it->start, it->end, marker.size());
        }
    }
}

// Desc: report a pattern hit that failed validation; never re-enters sanitize()
// In: const Diagnostic& d
// Out: void
void Scanner::emitDiagnostic_(const Diagnostic& d) const {
    if (config_.diagnostic_handler) {
        config_.diagnostic_handler(d);
        return;
    }
    log_line(config_.log_fd, "Scanner",
             std::string("pattern matched but validation failed for ") + category_name(d.category) +
                 " (" + std::to_string(d.candidate.size()) + " chars, possible fake/test data)");
}

nlohmann::json Scanner::process_structure(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object: {
            nlohmann::json out = nlohmann::json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = process_structure(it.value());
            }
            return out;
        }
        case nlohmann::json::value_t::array: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& el : value) out.push_back(process_structure(el));
            return out;
        }
        case nlohmann::json::value_t::string:
            return sanitize(value.get<std::string>());
        default:
            return value;
    }
}
