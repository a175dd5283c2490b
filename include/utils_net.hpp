#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cfscan::net {

// Internet checksum over an arbitrary buffer (RFC 1071)
uint16_t csum16(const void* data, std::size_t len);

// Host-order IPv4 <-> dotted quad. parse returns false on anything else.
bool parse_ipv4(const std::string& text, uint32_t& out);
std::string ipv4_to_string(uint32_t host_order);

} // namespace cfscan::net
