// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <unistd.h>


// Desc: logger loop to read from pipe and append to log file
// In: int pipe_read_fd, const std::string& log_path
// Out: void (returns once every writer closed the pipe)
void logger_loop(int pipe_read_fd, const std::string& log_path) {
    char buf[1024];
    // [Main loop of logger thread]
    while (true) {
        ssize_t len = read(pipe_read_fd, buf, sizeof(buf) - 1);
        if (len == 0) break;
        if (len < 0) {
            if (errno == EINTR) continue;
            break;
        }
        buf[len] = '\0';
        FILE* f = fopen(log_path.c_str(), "a");
        if (f) {
            fwrite(buf, 1, len, f);
            fclose(f);
        }
    }
    close(pipe_read_fd);
}

// Desc: write a timestamped line for a component to a raw fd
// In: int fd, const std::string& component, const std::string& msg
// Out: void
void log_line(int fd, const std::string& component, const std::string& msg) {
    if (fd < 0) return;
    std::time_t now = std::time(nullptr);
    char dt[64];
    ctime_r(&now, dt);
    dt[std::strlen(dt) - 1] = '\0'; // strip '\n'

    std::string line = "[" + std::string(dt) + "] [" + component + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
}
