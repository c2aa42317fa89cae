// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include <algorithm>
#include <cctype>

namespace netprobe
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            host_start = scheme_end + 3;
            explicit_scheme_ = true;
        }

        std::string authority;
        size_t path_start = url.find('/', host_start);
        if (path_start != std::string::npos)
        {
            authority = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
        }
        else
        {
            authority = url.substr(host_start);
            path = "/";
        }

        port = isHttps() ? 443 : 80;
        std::string port_str;
        if (!authority.empty() && authority[0] == '[')
        {
            // [v6]:port
            size_t close = authority.find(']');
            host = authority.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            if (close != std::string::npos && close + 1 < authority.size() && authority[close + 1] == ':')
                port_str = authority.substr(close + 2);
        }
        else
        {
            size_t colon = authority.find(':');
            // more than one ':' means a bare IPv6 literal
            if (colon != std::string::npos && authority.find(':', colon + 1) == std::string::npos)
            {
                host = authority.substr(0, colon);
                port_str = authority.substr(colon + 1);
            }
            else
            {
                host = authority;
            }
        }
        if (!port_str.empty() && port_str.size() <= 5 &&
            port_str.find_first_not_of("0123456789") == std::string::npos)
        {
            unsigned long p = std::stoul(port_str);
            if (p > 0 && p <= 65535)
                port = static_cast<uint16_t>(p);
        }
    }

    std::string ParsedURL::toGetRequestString() const
    {
        std::string host_hdr = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != (isHttps() ? 443 : 80))
            host_hdr += ":" + std::to_string(port);
        return std::string("GET ") + path + " HTTP/1.1\r\n" +
               "Host: " + host_hdr + "\r\n" +
               "User-Agent: netprobe/0.4\r\n" +
               "Accept: */*\r\n" +
               "Connection: close\r\n\r\n";
    }
} // namespace netprobe
