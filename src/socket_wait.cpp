#include "socket_wait.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>

namespace netprobe::net {

static constexpr auto kCancelSlice = std::chrono::milliseconds(50);

WaitResult wait_fd(int fd, short events, Clock::time_point deadline,
                   const CancelToken* cancel, short* revents) {
    using namespace std::chrono;
    for (;;) {
        if (cancel && cancel->cancelled()) return WaitResult::Cancelled;
        auto now = Clock::now();
        if (now >= deadline) return WaitResult::Timeout;

        auto left = duration_cast<milliseconds>(deadline - now) + milliseconds(1);
        auto slice = std::min<milliseconds>(left, kCancelSlice);

        pollfd p{};
        p.fd = fd;
        p.events = events;
        int rc = ::poll(&p, 1, static_cast<int>(slice.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WaitResult::Failed;
        }
        if (rc > 0) {
            if (revents) *revents = p.revents;
            return WaitResult::Ready;
        }
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace netprobe::net
