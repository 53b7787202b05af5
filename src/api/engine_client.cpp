#include "api/engine_client.hpp"

#include <httplib.h>

struct EngineClient::Impl {
    std::string host;
    int port;
    int timeout_ms = 3000;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        time_t sec = timeout_ms / 1000;
        time_t usec = (timeout_ms % 1000) * 1000;
        cli->set_connection_timeout(sec, usec);
        cli->set_read_timeout(sec, usec);
        cli->set_write_timeout(sec, usec);
        return cli;
    }
};

EngineClient::EngineClient(const std::string& host, int port, int timeout_ms)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->timeout_ms = timeout_ms;
}

EngineClient::~EngineClient() = default;

HealthResult EngineClient::check_health(const std::string& path) {
    HealthResult result;
    try {
        auto cli = impl_->make_client();
        auto res = cli->Get(path.empty() ? "/" : path);
        if (!res) {
            result.error = httplib::to_string(res.error());
            return result;
        }
        result.status = res->status;
        result.healthy = res->status >= 200 && res->status < 300;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}
