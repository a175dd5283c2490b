#include "utils_net.hpp"
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace cfscan::net {

uint16_t csum16(const void* data, std::size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    // memcpy so odd buffer offsets never do unaligned 16-bit loads
    while (len > 1) { uint16_t w; std::memcpy(&w, p, 2); sum += w; p += 2; len -= 2; }
    if (len) sum += *p;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

bool parse_ipv4(const std::string& text, uint32_t& out) {
    in_addr a{};
    if (inet_pton(AF_INET, text.c_str(), &a) != 1) return false;
    out = ntohl(a.s_addr);
    return true;
}

std::string ipv4_to_string(uint32_t host_order) {
    in_addr a{};
    a.s_addr = htonl(host_order);
    char buf[INET_ADDRSTRLEN];
    return inet_ntop(AF_INET, &a, buf, sizeof(buf)) ? std::string(buf) : std::string();
}

} // namespace cfscan::net
