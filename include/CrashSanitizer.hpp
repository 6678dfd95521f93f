#pragma once
#include <exception>
#include <string>
#include <nlohmann/json.hpp>

class Scanner;

extern const char* const kRedactedSecretKey;

// Scrubs exception text and captured local variables before they reach a
// crash report. Values are routed through the owning Scanner.
class CrashSanitizer {
public:
    CrashSanitizer(Scanner& scanner, int out_fd);
    ~CrashSanitizer();

    CrashSanitizer(const CrashSanitizer&) = delete;
    CrashSanitizer& operator=(const CrashSanitizer&) = delete;

    // Variable names that look like credentials (password, senha, secret,
    // key, token, auth) are replaced outright, whatever their value.
    static bool isSecretName(const std::string& name);

    nlohmann::json sanitize_locals(const nlohmann::json& locals);
    std::string format_exception(const std::exception& e);
    void report(const std::exception& e, const nlohmann::json& locals = nlohmann::json::object());

    // Route uncaught exceptions through report() before abort().
    // The previous handler is restored on uninstall() or destruction.
    void install();
    void uninstall();

private:
    static void onTerminate_();

    Scanner& scanner_;
    int out_fd_;
    std::terminate_handler previous_{nullptr};
    bool installed_{false};
};
