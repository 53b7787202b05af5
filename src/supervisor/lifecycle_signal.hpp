#pragma once

#include <atomic>
#include <chrono>

/// One-shot host lifecycle signal (e.g. "application quit").
///
/// Backed by a self-pipe so it can be waited on with poll(2) next to other
/// file descriptors. fire() only touches an atomic and write(2), so it is
/// safe to call from a POSIX signal handler.
class LifecycleSignal {
public:
    LifecycleSignal();
    ~LifecycleSignal();

    LifecycleSignal(const LifecycleSignal&) = delete;
    LifecycleSignal& operator=(const LifecycleSignal&) = delete;

    /// Raise the signal. Only the first call has an effect.
    void fire();

    bool is_set() const;

    /// Block until the signal fires or the timeout elapses.
    /// Returns true if the signal is set.
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Block until the signal fires.
    void wait() const;

    /// Read end of the self-pipe; becomes readable once fired and stays so.
    int fd() const;

private:
    std::atomic<bool> fired_{false};
    int pipe_fds_[2] = {-1, -1};
};
