#ifndef PATTERN_REGISTRY_HPP
#define PATTERN_REGISTRY_HPP

#include "Category.hpp"
#include <cstddef>
#include <regex>
#include <string>
#include <vector>

struct PatternEntry {
    Category category;
    const char* expression;   // ECMAScript and Hyperscan compatible
    bool caseless;
};

// Longest PEM body searched for an END marker.
static const std::size_t kMaxPemBody = 16384;

// Lexical shapes, one compiled regex per category.
// Built once on first use and read-only afterwards.
class PatternRegistry {
public:
    static const PatternRegistry& instance();

    const std::vector<PatternEntry>& entries() const { return entries_; }
    const PatternEntry& entry(Category c) const { return entries_[category_index(c)]; }
    bool isCompiled(Category c) const { return compiled_ok_[category_index(c)]; }

    // All non-overlapping hits, left to right.
    std::vector<Candidate> findCandidates(Category c, const std::string& text) const;

private:
    PatternRegistry();
    static std::size_t pemBlockEnd_(const std::string& text, std::size_t from);

    std::vector<PatternEntry> entries_;
    std::vector<std::regex> patterns_;
    std::vector<bool> compiled_ok_;
};

#endif // PATTERN_REGISTRY_HPP
