//// ===================== File: include/geo_resolver.hpp =====================
#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace cfscan {

class DiagLogger;

inline constexpr const char *kGeoNetworkError = "Network Error";

struct GeoInfo {
    std::string ip;
    std::string city;    // "N/A" when ipinfo omits it
    std::string country; // ISO code, "N/A" when absent
};

// address -> human readable location. Implementations must not throw; any
// failure is reported as kGeoNetworkError.
class GeoLookup {
public:
    virtual ~GeoLookup() = default;
    virtual std::string resolve(const std::string &ip) = 0;
};

// ipinfo.io over HTTPS (reachable from networks where ip-api.com is not).
class IpInfoGeoLookup : public GeoLookup {
public:
    explicit IpInfoGeoLookup(std::chrono::milliseconds timeout = std::chrono::seconds(10),
                             DiagLogger *diag = nullptr);

    std::string resolve(const std::string &ip) override;

    // Throws on transport failure; nullopt on a non-200 answer.
    std::optional<GeoInfo> lookup(const std::string &ip) const;

    // Body of GET /<ip>/json -> GeoInfo.
    static GeoInfo parse(const std::string &ip, const std::string &body);
    static std::string describe(const GeoInfo &g) { return g.city + ", " + g.country; }

private:
    std::chrono::milliseconds timeout_;
    DiagLogger *diag_;
};

} // namespace cfscan
