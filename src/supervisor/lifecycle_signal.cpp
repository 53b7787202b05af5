#include "supervisor/lifecycle_signal.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

LifecycleSignal::LifecycleSignal() {
    if (pipe2(pipe_fds_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
}

LifecycleSignal::~LifecycleSignal() {
    for (int& fd : pipe_fds_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void LifecycleSignal::fire() {
    if (fired_.exchange(true)) return;

    // The byte is never drained: the read end stays readable for every waiter.
    const char byte = 1;
    ssize_t n;
    do {
        n = write(pipe_fds_[1], &byte, 1);
    } while (n < 0 && errno == EINTR);
}

bool LifecycleSignal::is_set() const {
    return fired_.load();
}

bool LifecycleSignal::wait_for(std::chrono::milliseconds timeout) const {
    if (is_set()) return true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!is_set()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;

        struct pollfd pfd;
        pfd.fd = pipe_fds_[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0 && errno != EINTR) break;
    }
    return is_set();
}

void LifecycleSignal::wait() const {
    while (!is_set()) {
        struct pollfd pfd;
        pfd.fd = pipe_fds_[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, -1);
        if (ret < 0 && errno != EINTR) return;
    }
}

int LifecycleSignal::fd() const {
    return pipe_fds_[0];
}
