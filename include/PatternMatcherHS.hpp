#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <hs/hs.h>

class PatternRegistry;

// Multi-regex prefilter built on Hyperscan: answers "does any registered
// category pattern occur in this text" in a single pass.
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();
    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Process-wide matcher over PatternRegistry::instance().
    static const PatternMatcherHS& shared();

    // Build (or rebuild) from the registry's expressions.
    // Returns false if compilation fails.
    bool buildFromRegistry(const PatternRegistry& registry);

    // Fast boolean check: does any pattern match 'text'?
    bool matches(const std::string& text) const;

    size_t patternCount() const { return count_; }
    bool   isReady()      const { return ready_; }

private:
    hs_database_t* db_{nullptr};
    hs_scratch_t*  base_scratch_{nullptr};
    bool           ready_{false};
    size_t         count_{0};

    std::uint64_t  build_id_{0};

    // For safe per-thread scanning each thread owns a scratch region,
    // released when the thread exits.
    struct ThreadScratch {
        hs_scratch_t* scratch{nullptr};
        std::uint64_t build_id{0};
        ~ThreadScratch() {
            if (scratch) hs_free_scratch(scratch);
        }
    };
    static thread_local ThreadScratch tls_;
    static std::atomic<std::uint64_t> next_build_id_;

    void freeAll_() noexcept;
};
