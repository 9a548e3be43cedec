#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "hiccupwatch/core/error.hpp"
#include "hiccupwatch/exporter/exporter.hpp"
#include "hiccupwatch/exporter/telemetry.hpp"


namespace hiccupwatch::exporter {

struct HttpServerConfig {
    std::string host = "0.0.0.0";
    std::uint16_t port = 9096;       // 0 binds an ephemeral port
    std::string path = "/metrics";
    int poll_interval_ms = 100;      // upper bound on stop() latency
    int io_timeout_ms = 2000;        // per-connection read/write timeout
    std::size_t max_request_bytes = 8192;
};

struct HttpResponse {
    int status{200};
    std::string content_type;
    std::string body;
    bool head_only{false};
};

inline constexpr std::string_view kExpositionContentType = "text/plain; version=0.0.4; charset=utf-8";

[[nodiscard]]
std::string_view reason_phrase(int status) noexcept;

// Full HTTP/1.1 response bytes (status line, headers, body). Connection: close.
[[nodiscard]]
std::string serialize(const HttpResponse& response);


/*
===============================================================================
 hiccupwatch::exporter::HttpServer
===============================================================================

Minimal pull endpoint for Prometheus scrapers.

- One listening socket, one serving thread. Connections are handled one at a
  time and closed after the response (scrapes are infrequent and short).
- GET/HEAD <path>  -> 200 with Exporter::render()
- GET/HEAD other   -> 404
- other methods    -> 405
- malformed        -> 400

The accept loop polls with `poll_interval_ms`, so stop() returns within one
interval plus the connection currently being served (bounded by
`io_timeout_ms`). If the listening socket fails the loop exits on its own and
running() turns false; stop() (or a new start()) still reclaims the thread
and the descriptor.

Thread-safety: start()/stop() from one control thread. respond() is const and
may be called from anywhere (it only reads the Exporter).
===============================================================================
*/

class HttpServer {
public:
    HttpServer(HttpServerConfig config, const Exporter& exporter,
               std::shared_ptr<HttpTelemetry> telemetry = std::make_shared<HttpTelemetry>());
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds, listens and spawns the serving thread
    [[nodiscard]]
    core::Error start();

    // Stops accepting and joins the serving thread. Idempotent.
    void stop() noexcept;

    [[nodiscard]]
    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // Actual bound port (resolves port 0), valid after start()
    [[nodiscard]]
    std::uint16_t port() const noexcept {
        return bound_port_;
    }

    // Listening socket, -1 while stopped
    [[nodiscard]]
    int listen_fd() const noexcept {
        return listen_fd_;
    }

    [[nodiscard]]
    const HttpServerConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    const HttpTelemetry& telemetry() const noexcept {
        return *telemetry_;
    }

    // Builds the response for one raw request head
    [[nodiscard]]
    HttpResponse respond(std::string_view request) const;

    // Metrics collector
    template <typename Collector>
    void collect(Collector& collector) const {
        telemetry_->collect(collector);
    }

private:
    HttpServerConfig config_;
    const Exporter& exporter_;
    std::shared_ptr<HttpTelemetry> telemetry_;

    int listen_fd_{-1};
    std::uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;

private:
    void serve_loop_() noexcept;
    void fail_(const char* what, int err) noexcept;
    void handle_connection_(int fd) noexcept;
    [[nodiscard]] bool read_request_(int fd, std::string& out) const;
    [[nodiscard]] static bool write_all_(int fd, std::string_view data) noexcept;
};

} // namespace hiccupwatch::exporter
