#include "probe_driver.hpp"

#include <cerrno>
#include <cstring>

#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

namespace netprobe {

// URL for a target: the hostname itself when it already is a URL, else
// scheme://host:port/ with https for port 443.
static std::string target_url(const ProbeTarget& t) {
    if (t.hostname && t.hostname->find("://") != std::string::npos) return *t.hostname;
    const std::uint16_t port = t.port.value_or(80);
    std::string host = t.hostname ? *t.hostname : t.ip.to_string();
    if (!t.hostname && t.ip.is_v6()) host = "[" + host + "]";
    const char* scheme = port == 443 ? "https" : "http";
    return std::string(scheme) + "://" + host + ":" + std::to_string(port) + "/";
}

ProbeOutcome HttpDriver::probe(const ProbeRequest& req, const CancelToken& cancel) {
    ParsedURL url(target_url(req.target));
    if (url.scheme != "http" && url.scheme != "https")
        return ProbeOutcome::error("unsupported URL scheme: " + url.scheme);

    const auto t0 = net::Clock::now();
    const auto deadline = t0 + req.timeout;

    TcpSocket sock;
    ConnectResult cr = sock.connectTo(req.target.ip, url.port, deadline, &cancel);
    if (cr.wait == net::WaitResult::Cancelled) return ProbeOutcome::cancelled();
    if (cr.wait == net::WaitResult::Timeout) return ProbeOutcome::timeout(req.timeout);
    if (cr.wait == net::WaitResult::Failed || cr.error != 0) {
        auto o = ProbeOutcome::error(std::string("connect error: ") + std::strerror(cr.error), cr.error);
        o.refused = cr.error == ECONNREFUSED;
        return o;
    }

    const std::string request = url.toGetRequestString();
    std::string first;
    net::WaitResult wr = net::WaitResult::Failed;

    if (url.isHttps()) {
        SslSession tls;
        if (!tls.handshake(sock.fd(), url.host, deadline, &cancel)) {
            if (cancel.cancelled()) return ProbeOutcome::cancelled();
            if (net::Clock::now() >= deadline) return ProbeOutcome::timeout(req.timeout);
            std::string why = SslSession::lastError();
            return ProbeOutcome::error("TLS handshake failed" + (why.empty() ? std::string{} : ": " + why));
        }
        if (!tls.sendAll(request, deadline, &cancel)) {
            if (cancel.cancelled()) return ProbeOutcome::cancelled();
            return ProbeOutcome::error("request write failed");
        }
        first = tls.recvSome(deadline, &cancel, &wr);
    } else {
        if (!sock.sendAll(request, deadline, &cancel)) {
            if (cancel.cancelled()) return ProbeOutcome::cancelled();
            return ProbeOutcome::error("request write failed");
        }
        first = sock.recvSome(deadline, &cancel, &wr);
    }
    const double rtt = net::elapsed_ms(t0);

    if (wr == net::WaitResult::Cancelled) return ProbeOutcome::cancelled();
    if (wr == net::WaitResult::Timeout) return ProbeOutcome::timeout(req.timeout);
    if (first.empty()) return ProbeOutcome::error("connection closed without response");
    if (first.compare(0, 5, "HTTP/") != 0) return ProbeOutcome::error("protocol error: not an HTTP response");

    // status line: HTTP/1.1 200 OK
    std::string status_line = first.substr(0, first.find("\r\n"));
    return ProbeOutcome::done(rtt, status_line);
}

} // namespace netprobe
