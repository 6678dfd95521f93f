#pragma once
#include "Category.hpp"
#include "CircuitBreaker.hpp"
#include "Obfuscator.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

class HoneytokenHandler;
class VaultInterface;

// Pattern matched but the checksum/format check rejected it.
struct Diagnostic {
    Category category;
    std::string candidate;
};

using DiagnosticHandler = std::function<void(const Diagnostic&)>;

// Everything one Scanner needs, fixed at construction time.
struct ScannerConfig {
    // Categories eligible for redaction; the rest are only counted.
    std::vector<Category> rules;

    ObfuscationMethod method{ObfuscationMethod::Hash};
    std::string vault_key;     // empty -> LOGGUARD_MASTER_KEY
    std::string hash_salt;     // empty -> LOGGUARD_SALT

    // Builds a SimpleHoneytokenHandler when no handler is injected.
    std::vector<std::string> honeytokens;
    std::shared_ptr<HoneytokenHandler> honeytoken_handler;

    // Optional overrides for the configured method.
    std::shared_ptr<HashFunction> hash_function;
    std::shared_ptr<VaultInterface> vault;
    std::shared_ptr<AnonymizationStrategy> anonymization_strategy;

    std::uint64_t circuit_threshold{1000};
    std::chrono::milliseconds cooldown{5000};
    CircuitBreaker::Clock breaker_clock;   // null -> steady_clock

    DiagnosticHandler diagnostic_handler;
    int log_fd{STDERR_FILENO};

    bool use_prefilter{true};
};
