#include "Obfuscator.hpp"
#include "CryptoUtil.hpp"
#include "ScannerConfig.hpp"
#include "Vault.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace {

std::string env_or(const std::string& explicit_value, const char* env_name, const char* fallback) {
    if (!explicit_value.empty()) return explicit_value;
    const char* env = std::getenv(env_name);
    return env ? std::string(env) : std::string(fallback);
}

std::string upper(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

class HashStrategy : public ObfuscationStrategy {
public:
    explicit HashStrategy(std::shared_ptr<HashFunction> fn) : fn_(std::move(fn)) {}
    std::string obfuscate(const Candidate& c) override { return (*fn_)(c.text); }

private:
    std::shared_ptr<HashFunction> fn_;
};

class VaultStrategy : public ObfuscationStrategy {
public:
    explicit VaultStrategy(std::shared_ptr<VaultInterface> vault) : vault_(std::move(vault)) {}
    std::string obfuscate(const Candidate& c) override { return vault_->encrypt(c.text); }

private:
    std::shared_ptr<VaultInterface> vault_;
};

class AnonymizeStrategy : public ObfuscationStrategy {
public:
    explicit AnonymizeStrategy(std::shared_ptr<AnonymizationStrategy> s) : s_(std::move(s)) {}
    std::string obfuscate(const Candidate& c) override {
        return s_->anonymize(c.text, category_name(c.category));
    }

private:
    std::shared_ptr<AnonymizationStrategy> s_;
};

class MaskStrategy : public ObfuscationStrategy {
public:
    std::string obfuscate(const Candidate&) override { return "***"; }
};

} // namespace

bool parse_obfuscation_method(const std::string& name, ObfuscationMethod& out) {
    const std::string n = upper(name);
    if (n == "HASH")      { out = ObfuscationMethod::Hash;      return true; }
    if (n == "VAULT")     { out = ObfuscationMethod::Vault;     return true; }
    if (n == "ANONYMIZE") { out = ObfuscationMethod::Anonymize; return true; }
    if (n == "MASK")      { out = ObfuscationMethod::Mask;      return true; }
    return false;
}

const char* obfuscation_method_name(ObfuscationMethod m) {
    switch (m) {
        case ObfuscationMethod::Hash:      return "HASH";
        case ObfuscationMethod::Vault:     return "VAULT";
        case ObfuscationMethod::Anonymize: return "ANONYMIZE";
        case ObfuscationMethod::Mask:      return "MASK";
    }
    return "UNKNOWN";
}

DefaultHashFunction::DefaultHashFunction(const std::string& salt)
    : salt_(env_or(salt, "LOGGUARD_SALT", "default_insecure_salt_change_me")) {}

std::string DefaultHashFunction::operator()(const std::string& data) const {
    const std::string digest = CryptoUtil::sha256_hex(data + salt_);
    return "[HASH-" + upper(digest.substr(0, 4)) + "]";
}

// Desc: random token tagged with the category's short name
// In: const std::string& data (unused), const std::string& category ("BR.CPF")
// Out: std::string ("[ANON-CPF-0123456789AB]")
std::string IrreversibleAnonymizer::anonymize(const std::string&, const std::string& category) {
    const auto dot = category.rfind('.');
    const std::string prefix = dot == std::string::npos ? category : category.substr(dot + 1);
    std::string rnd = CryptoUtil::random_hex(12);
    if (rnd.empty()) rnd = "000000000000";
    return "[ANON-" + prefix + "-" + rnd + "]";
}

DeterministicPseudonymizer::DeterministicPseudonymizer(const std::string& secret_key)
    : secret_key_(env_or(secret_key, "LOGGUARD_SECRET_KEY", "change_me_insecure_default")) {}

std::string DeterministicPseudonymizer::anonymize(const std::string& data, const std::string& category) {
    const std::string mac = CryptoUtil::hmac_sha256_hex(secret_key_, category + ":" + data);
    return "[PSEUDO-" + upper(mac.substr(0, 8)) + "]";
}

// Desc: bind the configured method (and injected callbacks) to one strategy
// In: const ScannerConfig& cfg
// Out: std::unique_ptr<ObfuscationStrategy>
std::unique_ptr<ObfuscationStrategy> make_obfuscation_strategy(const ScannerConfig& cfg) {
    switch (cfg.method) {
        case ObfuscationMethod::Hash: {
            auto fn = cfg.hash_function ? cfg.hash_function
                                        : std::make_shared<DefaultHashFunction>(cfg.hash_salt);
            return std::make_unique<HashStrategy>(std::move(fn));
        }
        case ObfuscationMethod::Vault: {
            auto vault = cfg.vault ? cfg.vault
                                   : std::static_pointer_cast<VaultInterface>(
                                         std::make_shared<AesGcmVault>(cfg.vault_key));
            return std::make_unique<VaultStrategy>(std::move(vault));
        }
        case ObfuscationMethod::Anonymize: {
            auto s = cfg.anonymization_strategy
                         ? cfg.anonymization_strategy
                         : std::static_pointer_cast<AnonymizationStrategy>(
                               std::make_shared<IrreversibleAnonymizer>());
            return std::make_unique<AnonymizeStrategy>(std::move(s));
        }
        case ObfuscationMethod::Mask:
            break;
    }
    return std::make_unique<MaskStrategy>();
}
