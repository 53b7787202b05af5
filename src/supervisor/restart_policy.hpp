#pragma once

#include <chrono>

enum class FailureKind {
    SpawnFailure,    // the OS could not create the engine process
    UnexpectedExit,  // the engine's output stream closed while not shutting down
};

/// Immutable restart configuration shared by the supervisor loop.
struct RestartPolicy {
    std::chrono::milliseconds exit_delay{2000};
    std::chrono::milliseconds spawn_failure_delay{5000};

    /// Consecutive failures tolerated before giving up (0 = retry forever)
    int max_attempts = 0;

    /// A run lasting at least this long resets the failure count
    std::chrono::milliseconds reset_after{60000};

    /// Wait after SIGTERM before falling back to SIGKILL
    std::chrono::milliseconds shutdown_grace{5000};

    std::chrono::milliseconds delay_for(FailureKind kind) const {
        return kind == FailureKind::SpawnFailure ? spawn_failure_delay : exit_delay;
    }

    bool allows_retry(int consecutive_failures) const {
        return max_attempts <= 0 || consecutive_failures < max_attempts;
    }

    bool is_stable_run(std::chrono::milliseconds uptime) const {
        return uptime >= reset_after;
    }
};
