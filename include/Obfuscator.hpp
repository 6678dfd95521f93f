#pragma once
#include "Category.hpp"
#include <memory>
#include <string>

struct ScannerConfig;
class VaultInterface;

enum class ObfuscationMethod { Hash, Vault, Anonymize, Mask };

bool parse_obfuscation_method(const std::string& name, ObfuscationMethod& out);
const char* obfuscation_method_name(ObfuscationMethod m);

// Injectable hash: the candidate goes in, the replacement token comes out.
class HashFunction {
public:
    virtual ~HashFunction() = default;
    virtual std::string operator()(const std::string& data) const = 0;
};

// "[HASH-XXXX]": first 4 hex chars (uppercase) of SHA256(data || salt).
// Deterministic, so equal values correlate across log lines.
class DefaultHashFunction : public HashFunction {
public:
    // Empty salt falls back to LOGGUARD_SALT, then to an insecure default.
    explicit DefaultHashFunction(const std::string& salt = "");
    std::string operator()(const std::string& data) const override;

private:
    std::string salt_;
};

class AnonymizationStrategy {
public:
    virtual ~AnonymizationStrategy() = default;
    // category is the dotted name, e.g. "BR.CPF".
    virtual std::string anonymize(const std::string& data, const std::string& category) = 0;
    virtual bool can_reverse() const = 0;
};

// "[ANON-<CAT>-<12 hex>]", random per call: no reversal, no correlation.
class IrreversibleAnonymizer : public AnonymizationStrategy {
public:
    std::string anonymize(const std::string& data, const std::string& category) override;
    bool can_reverse() const override { return false; }
};

// "[PSEUDO-<8 hex>]" from HMAC-SHA256(key, category ":" data).
// Pseudonymous, not anonymous: anyone holding the key can confirm a guess.
class DeterministicPseudonymizer : public AnonymizationStrategy {
public:
    // Empty key falls back to LOGGUARD_SECRET_KEY, then to an insecure default.
    explicit DeterministicPseudonymizer(const std::string& secret_key = "");
    std::string anonymize(const std::string& data, const std::string& category) override;
    bool can_reverse() const override { return false; }

private:
    std::string secret_key_;
};

// Uniform contract used by the scanner, whatever the configured method.
class ObfuscationStrategy {
public:
    virtual ~ObfuscationStrategy() = default;
    virtual std::string obfuscate(const Candidate& candidate) = 0;
};

std::unique_ptr<ObfuscationStrategy> make_obfuscation_strategy(const ScannerConfig& cfg);
