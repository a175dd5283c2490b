// ===================== include/address_source.hpp =====================
#pragma once
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cfscan {

class DiagLogger;

inline constexpr const char *kCloudflareIpsUrl = "https://api.cloudflare.com/client/v4/ips";

// IPv4 ranges from the Cloudflare API. Prints the reason to `err` and
// returns nullopt on any failure.
std::optional<std::vector<std::string>> fetch_cloudflare_cidrs(std::ostream &err, DiagLogger *diag = nullptr,
                                                               std::chrono::milliseconds timeout = std::chrono::seconds(10));

// `ipv4_cidrs` out of an API response body; nullopt unless "success":true.
std::optional<std::vector<std::string>> parse_cloudflare_ips(const std::string &body);

// Comma or newline separated ranges. Throws std::runtime_error if unreadable.
std::vector<std::string> load_cidrs_from_file(const std::string &path);
std::vector<std::string> split_cidr_list(const std::string &content);

// Every address of a /24 or smaller block; only multiples of 16 in larger
// ones. Unparsable entries are reported to `warn` and skipped. Result is
// unique and in ascending numeric order.
std::vector<std::string> expand_cidrs(const std::vector<std::string> &cidrs, std::ostream &warn,
                                      DiagLogger *diag = nullptr);

} // namespace cfscan
