// include/ConfigManager.hpp
#pragma once
#include "Category.hpp"
#include "Obfuscator.hpp"
#include "ScannerConfig.hpp"

#include <vector>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

// Upper bound for cooldown_seconds (one day).
const double kMaxCooldownSeconds = 86400.0;

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& text);

    const std::vector<Category>& getRules() const { return rules_; }
    ObfuscationMethod getMethod() const { return method_; }
    const std::string& getVaultKey() const { return vault_key_; }
    const std::string& getHashSalt() const { return hash_salt_; }
    const std::string& getAnonymizationStrategy() const { return anonymization_strategy_; }
    const std::string& getPseudonymKey() const { return pseudonym_key_; }
    const std::vector<std::string>& getHoneytokens() const { return honeytokens_; }
    const std::string& getHoneytokenDb() const { return honeytoken_db_; }
    std::uint64_t getCircuitThreshold() const { return circuit_threshold_; }
    double getCooldownSeconds() const { return cooldown_seconds_; }
    bool usePrefilter() const { return prefilter_; }
    const std::string& getLogFile() const { return log_file_; }

    // Scanner settings; handlers and the honeytoken DB are wired by the caller.
    ScannerConfig toScannerConfig() const;

private:
    bool loadJson_(const nlohmann::json& j);

    std::vector<Category> rules_;
    ObfuscationMethod method_ = ObfuscationMethod::Hash;
    std::string vault_key_;
    std::string hash_salt_;
    std::string anonymization_strategy_ = "irreversible";
    std::string pseudonym_key_;
    std::vector<std::string> honeytokens_;
    std::string honeytoken_db_;
    std::uint64_t circuit_threshold_ = 1000;
    double cooldown_seconds_ = 5.0;
    bool prefilter_ = true;
    std::string log_file_ = "logs/logguard.log";
};
