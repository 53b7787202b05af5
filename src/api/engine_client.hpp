#pragma once

#include <memory>
#include <string>

struct HealthResult {
    bool healthy = false;
    int status = 0;         // HTTP status, 0 = no response
    std::string error;      // transport error, if any
};

/// Talks to the engine's local HTTP API
class EngineClient {
public:
    EngineClient(const std::string& host, int port, int timeout_ms = 3000);
    ~EngineClient();

    /// GET <path>; healthy on any 2xx answer
    HealthResult check_health(const std::string& path = "/api/health");

    bool test_connection() { return check_health().healthy; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
