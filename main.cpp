// main.cpp
#include "CrashSanitizer.hpp"
#include "Logger.hpp"
#include "Scanner.hpp"
#include "SqliteHoneytokenStore.hpp"
#include "Vault.hpp"
#include "requirements.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./logguard                  Sanitize stdin line by line (default)\n"
              << "  ./logguard json             Sanitize one JSON document per stdin line\n"
              << "  ./logguard decrypt <token>  Recover a [VAULT:...] token (needs the vault key)\n"
              << "  ./logguard -h, --help       Show this help message\n"
              << "Config: $LOGGUARD_CONFIG or ./config.json\n";
}

// Desc: sanitize stdin line by line to stdout
// In: Scanner& scanner
// Out: int (exit code)
static int run_lines(Scanner& scanner) {
    std::string line;
    while (std::getline(std::cin, line)) {
        std::cout << scanner.sanitize(line) << '\n';
    }
    std::cout.flush();
    return 0;
}

// Desc: sanitize one JSON document per stdin line
// In: Scanner& scanner
// Out: int (exit code; 1 if any line was not valid JSON)
static int run_json(Scanner& scanner) {
    int rc = 0;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(std::cin, line)) {
        ++line_no;
        if (line.empty()) continue;
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            // the parser message may quote the payload
            std::cerr << "[Main] invalid JSON on line " << line_no << " (" << e.id << ")\n";
            rc = 1;
            continue;
        }
        std::cout << scanner.process_structure(doc).dump() << '\n';
    }
    std::cout.flush();
    return rc;
}

int main(int argc, char** argv) {
    // Handle help flag early
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_help();
        return 0;
    }
    const char* config_env = std::getenv("LOGGUARD_CONFIG");
    const std::string config_path = config_env ? config_env : "./config.json";

    auto boot = Requirements::run(config_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    // "decrypt" mode: no scanner needed
    if (argc > 1 && std::string(argv[1]) == "decrypt") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " decrypt <token>\n";
            return 1;
        }
        AesGcmVault vault(boot.config.getVaultKey());
        const DecryptResult r = vault.decrypt(argv[2]);
        if (!r.ok) {
            std::cerr << r.error << "\n";
            return 1;
        }
        std::cout << r.value << "\n";
        return 0;
    }

    // [Create new process for logging]
    int log_pipe[2];
    if (pipe(log_pipe) == -1) { perror("pipe"); return 1; }

    pid_t logger_pid = fork();
    if (logger_pid == -1) { perror("fork"); return 1; }

    if (logger_pid == 0) {
        close(log_pipe[1]);
        logger_loop(log_pipe[0], boot.config.getLogFile());
        _exit(0);
    }
    close(log_pipe[0]);
    const int log_fd = log_pipe[1];

    ScannerConfig cfg = boot.config.toScannerConfig();
    cfg.log_fd = log_fd;
    if (boot.db) {
        auto store = std::make_shared<SqliteHoneytokenStore>(boot.db.get(), nullptr, log_fd);
        cfg.honeytoken_handler = store;
    }

    int rc = 0;
    {
        Scanner scanner(std::move(cfg));
        CrashSanitizer crash(scanner, STDERR_FILENO);
        crash.install();

        log_line(log_fd, "Main", std::string("started, method=") + obfuscation_method_name(scanner.method()));
        rc = (argc > 1 && std::string(argv[1]) == "json") ? run_json(scanner) : run_lines(scanner);
        log_line(log_fd, "Main", "stopped");
    }

    close(log_fd);
    waitpid(logger_pid, nullptr, 0);
    return rc;
}
