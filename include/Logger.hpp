#pragma once
#include <string>

// Drain a pipe into log_path until the write end is closed.
void logger_loop(int pipe_read_fd, const std::string& log_path);

// Write one "[time] [component] msg" line straight to fd.
void log_line(int fd, const std::string& component, const std::string& msg);
