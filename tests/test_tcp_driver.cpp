#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#include "probe_driver.hpp"

using namespace netprobe;

// Bound loopback socket; returns the fd and stores the port.
static int bind_loopback(int type, uint16_t &port) {
    int fd = ::socket(AF_INET, type, 0);
    if (fd < 0) return -1;
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    a.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr *>(&a), sizeof(a)) != 0) {
        ::close(fd);
        return -1;
    }
    socklen_t len = sizeof(a);
    ::getsockname(fd, reinterpret_cast<sockaddr *>(&a), &len);
    port = ntohs(a.sin_port);
    return fd;
}

static ProbeRequest request(uint16_t port, uint32_t seq = 1) {
    ProbeRequest req;
    req.target.ip = *IpAddress::parse("127.0.0.1");
    req.target.port = port;
    req.seq = seq;
    req.timeout = std::chrono::milliseconds(1000);
    req.hop_limit = 0;
    return req;
}

// Accepts one connection, reads the request and answers with `reply`.
static std::thread serve_once(int listen_fd, std::string reply) {
    return std::thread([listen_fd, reply] {
        int c = ::accept(listen_fd, nullptr, nullptr);
        if (c < 0) return;
        char buf[1024];
        ::recv(c, buf, sizeof(buf), 0);
        ::send(c, reply.data(), reply.size(), MSG_NOSIGNAL);
        ::close(c);
    });
}

int main() {
    CancelToken cancel;
    TcpDriver tcp;

    // open port
    uint16_t open_port = 0;
    int lfd = bind_loopback(SOCK_STREAM, open_port);
    if (lfd < 0 || ::listen(lfd, 16) != 0) return 1;
    ProbeOutcome o = tcp.probe(request(open_port), cancel);
    if (o.status != SampleStatus::Done || !o.rtt_ms || o.refused) return 2;
    ProbeSample s = to_sample(request(open_port, 7), o, Protocol::Tcp);
    if (s.seq != 7 || !s.ok() || !s.rtt_ms || s.protocol != Protocol::Tcp) return 3;
    // take the handshake-only connection out of the backlog
    int stale = ::accept(lfd, nullptr, nullptr);
    if (stale >= 0) ::close(stale);

    // closed port: bound but never listening
    uint16_t closed_port = 0;
    int cfd = bind_loopback(SOCK_STREAM, closed_port);
    if (cfd < 0) return 4;
    ::close(cfd);
    o = tcp.probe(request(closed_port), cancel);
    if (o.status != SampleStatus::Error || !o.refused) return 5;
    s = to_sample(request(closed_port), o, Protocol::Tcp);
    if (s.rtt_ms) return 6; // only Done samples carry rtt

    // cancelled before the probe
    CancelToken stopped;
    stopped.cancel();
    o = tcp.probe(request(closed_port), stopped);
    if (o.status == SampleStatus::Done) return 7;

    // UDP: nothing listening -> port unreachable
    UdpDriver udp;
    uint16_t udp_closed = 0;
    int ufd = bind_loopback(SOCK_DGRAM, udp_closed);
    if (ufd < 0) return 8;
    ::close(ufd);
    o = udp.probe(request(udp_closed), cancel);
    if (o.status != SampleStatus::Done || !o.refused) return 9;

    // UDP: an echoing peer
    uint16_t udp_port = 0;
    int echo_fd = bind_loopback(SOCK_DGRAM, udp_port);
    if (echo_fd < 0) return 10;
    std::thread echo([echo_fd] {
        char buf[256];
        sockaddr_storage from{};
        socklen_t len = sizeof(from);
        ssize_t n = ::recvfrom(echo_fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&from), &len);
        if (n > 0) ::sendto(echo_fd, buf, static_cast<size_t>(n), 0, reinterpret_cast<sockaddr *>(&from), len);
    });
    o = udp.probe(request(udp_port), cancel);
    echo.join();
    ::close(echo_fd);
    if (o.status != SampleStatus::Done || o.refused) return 11;

    // UDP: silence -> timeout
    uint16_t mute_port = 0;
    int mute_fd = bind_loopback(SOCK_DGRAM, mute_port);
    ProbeRequest mute = request(mute_port);
    mute.timeout = std::chrono::milliseconds(150);
    o = udp.probe(mute, cancel);
    ::close(mute_fd);
    if (o.status != SampleStatus::Timeout) return 12;

    // HTTP: a real status line is Done, anything else a protocol error
    HttpDriver http;
    std::thread srv = serve_once(lfd, "HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n");
    o = http.probe(request(open_port), cancel);
    srv.join();
    if (o.status != SampleStatus::Done || o.message != "HTTP/1.1 204 No Content") return 13;

    srv = serve_once(lfd, "SSH-2.0-OpenSSH_9.6\r\n");
    o = http.probe(request(open_port), cancel);
    srv.join();
    if (o.status == SampleStatus::Done) return 14;

    o = http.probe(request(closed_port), cancel);
    if (o.status != SampleStatus::Error || !o.refused) return 15;

    ::close(lfd);
    return 0;
}
