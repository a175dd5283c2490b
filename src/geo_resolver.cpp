//// ===================== File: src/geo_resolver.cpp =====================
#include "geo_resolver.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"

#include <regex>
#include <stdexcept>
#include <string>

namespace cfscan
{
    IpInfoGeoLookup::IpInfoGeoLookup(std::chrono::milliseconds timeout, DiagLogger *diag)
        : timeout_(timeout), diag_(diag) {}

    std::optional<GeoInfo> IpInfoGeoLookup::lookup(const std::string &ip) const
    {
        HttpResponse resp = HttpClient::get("https://ipinfo.io/" + ip + "/json", timeout_);
        if (resp.status != 200)
        {
            if (diag_)
                diag_->log("GEO_FAIL ip=" + ip + " status=" + std::to_string(resp.status));
            return std::nullopt;
        }
        return parse(ip, resp.body);
    }

    std::string IpInfoGeoLookup::resolve(const std::string &ip)
    {
        try
        {
            auto g = lookup(ip);
            if (!g)
                return kGeoNetworkError;
            std::string loc = describe(*g);
            if (diag_)
                diag_->log("GEO_OK ip=" + ip + " location=\"" + loc + "\"");
            return loc;
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->log("GEO_FAIL ip=" + ip + " error=\"" + e.what() + "\"");
            return kGeoNetworkError;
        }
    }

    GeoInfo IpInfoGeoLookup::parse(const std::string &ip, const std::string &body)
    {
        GeoInfo g{};
        g.ip = ip;
        std::smatch m;
        auto grab = [&](const std::regex &re)
        { return std::regex_search(body, m, re) ? m[1].str() : std::string(); };

        g.city = grab(std::regex("\"city\"\\s*:\\s*\"([^\"]*)\""));
        g.country = grab(std::regex("\"country\"\\s*:\\s*\"([^\"]*)\""));
        if (g.city.empty())
            g.city = "N/A";
        if (g.country.empty())
            g.country = "N/A";
        return g;
    }
} // namespace cfscan
