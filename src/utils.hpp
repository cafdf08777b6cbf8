#pragma once
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// "<hostname>-<pid>"
std::string host_process_tag();

// "peer-" followed by the first 8 hex digits of sha256(host_process_tag()).
std::string default_peer_id();

// Address of the interface that would route to the public internet. Uses a
// connected UDP socket, so nothing is sent. Falls back to 127.0.0.1.
std::string detect_local_ip();

std::string trim_whitespace(const std::string& s);
