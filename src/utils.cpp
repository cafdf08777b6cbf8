#include "utils.hpp"
#include <openssl/sha.h>
#include <asio.hpp>
#include <unistd.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdio>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string host_process_tag(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        std::snprintf(hostname, sizeof(hostname), "%s", "unknown-host");
    }
    std::ostringstream ss;
    ss << hostname << "-" << getpid();
    return ss.str();
}

std::string default_peer_id(){
    return "peer-" + sha256_hex(host_process_tag()).substr(0, 8);
}

std::string detect_local_ip(){
    try {
        asio::io_context io;
        asio::ip::udp::socket socket(io);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        auto address = socket.local_endpoint().address();
        if(address.is_unspecified()) return "127.0.0.1";
        return address.to_string();
    } catch(const std::system_error&){
        return "127.0.0.1";
    }
}

std::string trim_whitespace(const std::string& s){
    auto begin = std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); });
    auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
    if(begin >= end) return "";
    return std::string(begin, end);
}
