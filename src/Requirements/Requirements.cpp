// requirements.cpp
#include "requirements.hpp"
#include "SqliteHoneytokenStore.hpp"
#include "Vault.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>


// Desc: append a timestamped line to config log file
// In: const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& msg) {
    int fd = ::open("logs/config.log", O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: create directory if missing and record status
// In: const char* path, StartupResult& out
// Out: void
void Requirements::ensureDir(const char* path, StartupResult& out) {
    if (::mkdir(path, 0755) == -1 && errno != EEXIST) {
        out.logs.push_back(std::string("[ensureDir] failed: ") + path + " (" + ::strerror(errno) + ")");
        return;
    }
    out.logs.push_back(std::string("[ensureDir] ok: ") + path);
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(std::string("[config] loaded: ") + config_path);
    return true;
}

// Desc: cross-field checks that a single key cannot express
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    if (cfg.getRules().empty()) {
        out.error = "[config] 'rules' is empty: nothing would be redacted";
        out.logs.push_back(out.error);
        return false;
    }

    // Secrets are never logged, only whether they come from file, env or default.
    if (cfg.getMethod() == ObfuscationMethod::Vault && cfg.getVaultKey().empty()) {
        if (std::getenv("LOGGUARD_MASTER_KEY")) {
            out.logs.push_back("[config] vault key: from LOGGUARD_MASTER_KEY");
        } else {
            out.logs.push_back("[config] WARNING: VAULT without key, tokens will be " +
                               std::string(kVaultNoKeyToken));
        }
    }
    if (cfg.getMethod() == ObfuscationMethod::Hash && cfg.getHashSalt().empty() &&
        !std::getenv("LOGGUARD_SALT")) {
        out.logs.push_back("[config] WARNING: hash salt not set, using insecure default");
    }
    if (cfg.getMethod() == ObfuscationMethod::Anonymize &&
        cfg.getAnonymizationStrategy() == "pseudonymize" && cfg.getPseudonymKey().empty() &&
        !std::getenv("LOGGUARD_SECRET_KEY")) {
        out.logs.push_back("[config] WARNING: pseudonym key not set, using insecure default");
    }

    out.logs.push_back("[config] rules enabled: " + std::to_string(cfg.getRules().size()));
    out.logs.push_back(std::string("[config] obfuscation_method: ") + obfuscation_method_name(cfg.getMethod()));
    out.logs.push_back("[config] circuit_threshold: " + std::to_string(cfg.getCircuitThreshold()));
    out.logs.push_back("[config] honeytokens: " + std::to_string(cfg.getHoneytokens().size()));
    out.logs.push_back("[config] validation ok");
    return true;
}

// Desc: open/init SQLite honeytoken DB, apply schema and seed configured tokens
// In: const std::string& db_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::initHoneytokenDb(const std::string& db_path, StartupResult& out) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        out.error = std::string("[honeytoken] sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        out.logs.push_back(out.error);
        if (raw) sqlite3_close(raw);
        return false;
    }
    sqlite3_busy_timeout(raw, 5000);
    sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    out.db.reset(raw);

    if (!SqliteHoneytokenStore::ensure_schema(out.db.get())) {
        out.error = "[honeytoken] schema exec failed";
        out.logs.push_back(out.error);
        return false;
    }

    SqliteHoneytokenStore store(out.db.get());
    for (const auto& t : out.config.getHoneytokens()) {
        if (!store.add(t, "config")) {
            out.error = "[honeytoken] failed to seed token from config";
            out.logs.push_back(out.error);
            return false;
        }
    }
    out.logs.push_back("[honeytoken] schema ok, tokens: " + std::to_string(store.token_count()));
    return true;
}


// Desc: orchestrate startup: dirs, config, honeytoken DB; log results
// In: const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;

    // 1) dirs
    ensureDir("logs", res);

    // 2) config load + validate
    if (!loadConfig(config_path, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }
    if (!validateConfig(res.config, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }

    // 3) optional honeytoken DB
    const std::string& db_path = res.config.getHoneytokenDb();
    if (!db_path.empty() && !initHoneytokenDb(db_path, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }

    res.ok = true;
    for (auto& l : res.logs) fileLog(l);
    return res;
}
