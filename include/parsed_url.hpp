// ===================== include/parsed_url.hpp =====================
#pragma once
#include <cstdint>
#include <string>

namespace netprobe
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "example.com" or "2001:db8::1" (no brackets)
        uint16_t port;      // explicit or scheme default
        std::string path;   // e.g., "/health"

        explicit ParsedURL(const std::string &url);

        bool isHttps() const { return scheme == "https"; }
        bool hasScheme() const { return explicit_scheme_; }
        std::string toGetRequestString() const;

    private:
        bool explicit_scheme_ = false;
    };
} // namespace netprobe
