#include "PatternMatcherHS.hpp"
#include "PatternRegistry.hpp"
#include <iostream>
#include <vector>

thread_local PatternMatcherHS::ThreadScratch PatternMatcherHS::tls_;
std::atomic<std::uint64_t> PatternMatcherHS::next_build_id_{1};

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

const PatternMatcherHS& PatternMatcherHS::shared() {
    static PatternMatcherHS matcher;
    static const bool built = matcher.buildFromRegistry(PatternRegistry::instance());
    (void)built;
    return matcher;
}

void PatternMatcherHS::freeAll_() noexcept {
    if (base_scratch_) { hs_free_scratch(base_scratch_); base_scratch_ = nullptr; }
    if (db_)           { hs_free_database(db_);           db_           = nullptr; }
    ready_ = false;
    count_ = 0;
}

// Desc: compile every category expression into one block-mode database
// In: const PatternRegistry& registry
// Out: bool (false if Hyperscan rejected the set)
bool PatternMatcherHS::buildFromRegistry(const PatternRegistry& registry) {
    freeAll_();

    const auto& entries = registry.entries();
    if (entries.empty()) {
        // No patterns: treat as ready but trivially false on matches()
        ready_ = true;
        return true;
    }

    std::vector<const char*> cpat;
    std::vector<unsigned> flags;
    std::vector<unsigned> ids;
    cpat.reserve(entries.size());
    flags.reserve(entries.size());
    ids.reserve(entries.size());
    for (const auto& e : entries) {
        cpat.push_back(e.expression);
        unsigned f = HS_FLAG_SINGLEMATCH;
        if (e.caseless) f |= HS_FLAG_CASELESS;
        flags.push_back(f);
        ids.push_back(static_cast<unsigned>(category_index(e.category)));
    }

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        flags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        if (ce) {
            std::cerr << "[PatternMatcherHS] compile failed: " << ce->message
                      << " (pattern " << ce->expression << ")\n";
            hs_free_compile_error(ce);
        } else {
            std::cerr << "[PatternMatcherHS] compile failed (unknown)\n";
        }
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    rc = hs_alloc_scratch(db_, &base_scratch_);
    if (rc != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_alloc_scratch failed: " << rc << "\n";
        freeAll_();
        return false;
    }

    count_ = entries.size();
    build_id_ = next_build_id_.fetch_add(1);
    ready_ = true;
    return true;
}

// Desc: single-pass check over all category patterns
// In: const std::string& text
// Out: bool (false only when no pattern can match; errors report true so the
//      caller falls through to the full regex pass)
bool PatternMatcherHS::matches(const std::string& text) const {
    if (!ready_) return true;
    if (count_ == 0) return false;

    // One scratch per thread, grown to fit every database it has scanned.
    if (tls_.build_id != build_id_) {
        if (hs_alloc_scratch(db_, &tls_.scratch) != HS_SUCCESS) {
            std::cerr << "[PatternMatcherHS] per-thread hs_alloc_scratch failed\n";
            return true;
        }
        tls_.build_id = build_id_;
    }

    bool matched = false;
    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return 1; // stop scanning
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        tls_.scratch,
        on_match,
        &matched
    );

    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        std::cerr << "[PatternMatcherHS] hs_scan error: " << rc << "\n";
        return true;
    }
    return matched;
}
