#pragma once
#include <chrono>
#include <unistd.h>

#include "cancel_token.hpp"

namespace netprobe::net {

using Clock = std::chrono::steady_clock;

// Owning file descriptor.
class UniqueFd {
public:
    UniqueFd() : fd_(-1) {}
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    int release() {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_;
};

enum class WaitResult { Ready, Timeout, Cancelled, Failed };

// Polls `fd` for `events` until the deadline, waking at least every 50 ms to
// check the cancel token. `revents` receives the poll result when Ready.
WaitResult wait_fd(int fd, short events, Clock::time_point deadline,
                   const CancelToken* cancel, short* revents = nullptr);

bool set_nonblocking(int fd);

double elapsed_ms(Clock::time_point since);

} // namespace netprobe::net
