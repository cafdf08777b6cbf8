#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// Short-lived outbound connections. Each call runs on a private io_context
// and connect, write and read together must finish inside `timeout`.
// Numeric addresses are used as is; a hostname is looked up with
// getaddrinfo, and a lookup already in progress when the deadline passes is
// waited for before TransportError is thrown. Failures throw TransportError.

// Writes `line` plus '\n' and returns everything the server sends back
// before closing, with trailing line breaks removed.
std::string request_line(const std::string& host,
                         uint16_t port,
                         const std::string& line,
                         std::chrono::milliseconds timeout);

// Writes `line` plus '\n' and closes without waiting for a reply.
void send_line(const std::string& host,
               uint16_t port,
               const std::string& line,
               std::chrono::milliseconds timeout);
