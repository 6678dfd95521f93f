#include "CrashSanitizer.hpp"
#include "Scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <typeinfo>
#include <unistd.h>

const char* const kRedactedSecretKey = "[REDACTED_SECRET_KEY]";

namespace {

const char* const kSecretNameHints[] = {"password", "senha", "secret", "key", "token", "auth"};

CrashSanitizer* g_installed = nullptr;

std::string demangle(const char* name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> res(abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                               std::free);
    return (status == 0 && res) ? std::string(res.get()) : std::string(name);
}

void write_all(int fd, const std::string& s) {
    if (fd < 0) return;
    ssize_t _wr = ::write(fd, s.data(), s.size());
    (void)_wr;
}

} // namespace

CrashSanitizer::CrashSanitizer(Scanner& scanner, int out_fd)
    : scanner_(scanner), out_fd_(out_fd) {}

CrashSanitizer::~CrashSanitizer() {
    uninstall();
}

bool CrashSanitizer::isSecretName(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    for (const char* hint : kSecretNameHints) {
        if (lower.find(hint) != std::string::npos) return true;
    }
    return false;
}

// Desc: scrub a {name: value} map of captured locals
// In: const nlohmann::json& locals
// Out: nlohmann::json (same shape)
nlohmann::json CrashSanitizer::sanitize_locals(const nlohmann::json& locals) {
    if (locals.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = locals.begin(); it != locals.end(); ++it) {
            out[it.key()] = isSecretName(it.key()) ? nlohmann::json(kRedactedSecretKey)
                                                   : sanitize_locals(it.value());
        }
        return out;
    }
    if (locals.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& el : locals) out.push_back(sanitize_locals(el));
        return out;
    }
    if (locals.is_string()) return scanner_.sanitize(locals.get<std::string>());
    if (locals.is_null() || locals.is_boolean()) return locals;

    // Numbers: a bare integer can still be a document number.
    const std::string repr = locals.dump();
    const std::string clean = scanner_.sanitize(repr);
    return clean == repr ? locals : nlohmann::json(clean);
}

std::string CrashSanitizer::format_exception(const std::exception& e) {
    return demangle(typeid(e).name()) + ": " + scanner_.sanitize(e.what());
}

// Desc: write a sanitized crash report to out_fd
// In: const std::exception& e, const nlohmann::json& locals
// Out: void
void CrashSanitizer::report(const std::exception& e, const nlohmann::json& locals) {
    std::string msg = "=== logguard crash report ===\n";
    msg += format_exception(e) + "\n";
    if (!locals.empty()) msg += "locals: " + sanitize_locals(locals).dump() + "\n";
    write_all(out_fd_, msg);
}

void CrashSanitizer::install() {
    if (installed_) return;
    g_installed = this;
    previous_ = std::set_terminate(&CrashSanitizer::onTerminate_);
    installed_ = true;
}

void CrashSanitizer::uninstall() {
    if (!installed_) return;
    std::set_terminate(previous_);
    if (g_installed == this) g_installed = nullptr;
    installed_ = false;
}

void CrashSanitizer::onTerminate_() {
    if (g_installed) {
        if (std::exception_ptr ep = std::current_exception()) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                g_installed->report(e);
            } catch (...) {
                write_all(g_installed->out_fd_, "=== logguard crash report ===\nnon-standard exception\n");
            }
        }
    }
    std::abort();
}
