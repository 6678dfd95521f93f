// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
using nlohmann::json;

// Desc: convert string to lowercase
// In: std::string s
// Out: std::string (lowercased)
static inline std::string toLower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }
    return loadJson_(j);
}

bool ConfigManager::loadFromString(const std::string& text) {
    json j;
    try { j = json::parse(text); }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }
    return loadJson_(j);
}

// Desc: validate and apply every recognized key; unknown keys are ignored
// In: const json& j
// Out: bool (false on the first invalid field)
bool ConfigManager::loadJson_(const json& j) {
    if (!j.is_object()) { std::cerr << "[ConfigManager] top-level value must be an object\n"; return false; }

    // every load starts from the defaults
    *this = ConfigManager();

    // rules: "ALL" or array of category names
    if (j.contains("rules")) {
        const auto& r = j["rules"];
        if (r.is_string() && toLower(r.get<std::string>()) == "all") {
            rules_ = all_categories();
        } else if (r.is_array()) {
            for (const auto& item : r) {
                Category c;
                if (!item.is_string() || !parse_category(item.get<std::string>(), c)) {
                    std::cerr << "[ConfigManager] unknown rule: " << item.dump() << "\n";
                    return false;
                }
                if (std::find(rules_.begin(), rules_.end(), c) == rules_.end()) rules_.push_back(c);
            }
        } else {
            std::cerr << "[ConfigManager] 'rules' must be \"ALL\" or an array of category names\n";
            return false;
        }
    }

    // obfuscation_method
    if (j.contains("obfuscation_method")) {
        if (!j["obfuscation_method"].is_string() ||
            !parse_obfuscation_method(j["obfuscation_method"].get<std::string>(), method_)) {
            std::cerr << "[ConfigManager] 'obfuscation_method' must be HASH, VAULT, ANONYMIZE or MASK\n";
            return false;
        }
    }

    auto read_string = [&](const char* key, std::string& dst) {
        if (!j.contains(key)) return true;
        if (!j[key].is_string()) {
            std::cerr << "[ConfigManager] '" << key << "' must be a string\n";
            return false;
        }
        dst = j[key].get<std::string>();
        return true;
    };
    if (!read_string("vault_key", vault_key_)) return false;
    if (!read_string("hash_salt", hash_salt_)) return false;
    if (!read_string("pseudonym_key", pseudonym_key_)) return false;
    if (!read_string("honeytoken_db", honeytoken_db_)) return false;
    if (!read_string("log_file", log_file_)) return false;
    if (log_file_.empty()) { std::cerr << "[ConfigManager] 'log_file' must be non-empty\n"; return false; }

    // anonymization_strategy
    if (!read_string("anonymization_strategy", anonymization_strategy_)) return false;
    anonymization_strategy_ = toLower(anonymization_strategy_);
    if (anonymization_strategy_ != "irreversible" && anonymization_strategy_ != "pseudonymize") {
        std::cerr << "[ConfigManager] 'anonymization_strategy' must be 'irreversible' or 'pseudonymize', got: "
                  << anonymization_strategy_ << "\n";
        return false;
    }

    // honeytokens
    if (j.contains("honeytokens")) {
        if (!j["honeytokens"].is_array()) {
            std::cerr << "[ConfigManager] 'honeytokens' must be an array of strings\n";
            return false;
        }
        for (const auto& h : j["honeytokens"]) {
            if (!h.is_string() || h.get<std::string>().empty()) {
                std::cerr << "[ConfigManager] honeytoken entries must be non-empty strings\n";
                return false;
            }
            honeytokens_.push_back(h.get<std::string>());
        }
    }

    // breaker
    if (j.contains("circuit_threshold")) {
        const auto& t = j["circuit_threshold"];
        if (!t.is_number_integer() || t.get<long long>() <= 0) {
            std::cerr << "[ConfigManager] 'circuit_threshold' must be an integer > 0\n";
            return false;
        }
        circuit_threshold_ = t.get<std::uint64_t>();
    }
    if (j.contains("cooldown_seconds")) {
        const auto& c = j["cooldown_seconds"];
        if (!c.is_number() || c.get<double>() <= 0.0 || c.get<double>() > kMaxCooldownSeconds) {
            std::cerr << "[ConfigManager] 'cooldown_seconds' must be a number in (0, "
                      << kMaxCooldownSeconds << "]\n";
            return false;
        }
        cooldown_seconds_ = c.get<double>();
    }

    if (j.contains("prefilter")) {
        if (!j["prefilter"].is_boolean()) { std::cerr << "[ConfigManager] 'prefilter' must be boolean\n"; return false; }
        prefilter_ = j["prefilter"].get<bool>();
    }

    return true;
}

// Desc: map the loaded file onto a ScannerConfig
// In: (none)
// Out: ScannerConfig
ScannerConfig ConfigManager::toScannerConfig() const {
    ScannerConfig cfg;
    cfg.rules = rules_;
    cfg.method = method_;
    cfg.vault_key = vault_key_;
    cfg.hash_salt = hash_salt_;
    cfg.honeytokens = honeytokens_;
    if (anonymization_strategy_ == "pseudonymize") {
        cfg.anonymization_strategy = std::make_shared<DeterministicPseudonymizer>(pseudonym_key_);
    }
    cfg.circuit_threshold = circuit_threshold_;
    cfg.cooldown = std::chrono::milliseconds(static_cast<long long>(cooldown_seconds_ * 1000.0));
    cfg.use_prefilter = prefilter_;
    return cfg;
}
