#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "hiccupwatch/exporter/http_server.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"


using namespace hiccupwatch;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
std::string http_exchange(std::uint16_t port, const std::string& request) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    TEST_CHECK(fd >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    TEST_CHECK(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
    TEST_CHECK(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    TEST_CHECK(::send(fd, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

    std::string response;
    char buf[4096];
    for (;;) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        response.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return response;
}

// -----------------------------------------------------------------------------
// Test: request routing without sockets
// -----------------------------------------------------------------------------
void test_respond_routing() {
    std::cout << "[TEST] HttpServer respond() routing\n";

    lcr::metrics::atomic::counter64 hits;
    hits.inc(5);
    exporter::Exporter registry;
    registry.register_source([&hits](exporter::Exporter::Collector& c) { hits.collect("hits_total", "Hits.", c); });

    exporter::HttpServerConfig cfg;
    cfg.path = "/metrics";
    exporter::HttpServer server(cfg, registry);

    auto ok = server.respond("GET /metrics HTTP/1.1\r\nHost: localhost\r\n\r\n");
    TEST_CHECK(ok.status == 200);
    TEST_CHECK(ok.content_type.rfind("text/plain; version=0.0.4", 0) == 0);
    TEST_CHECK(ok.body == registry.render());
    TEST_CHECK(!ok.head_only);

    auto query = server.respond("GET /metrics?name[]=x HTTP/1.1\r\n\r\n");
    TEST_CHECK(query.status == 200);

    auto head = server.respond("HEAD /metrics HTTP/1.1\r\n\r\n");
    TEST_CHECK(head.status == 200);
    TEST_CHECK(head.head_only);

    TEST_CHECK(server.respond("GET / HTTP/1.1\r\n\r\n").status == 404);
    TEST_CHECK(server.respond("GET /metrics/extra HTTP/1.1\r\n\r\n").status == 404);
    TEST_CHECK(server.respond("POST /metrics HTTP/1.1\r\n\r\n").status == 405);
    TEST_CHECK(server.respond("DELETE /other HTTP/1.1\r\n\r\n").status == 405);
    TEST_CHECK(server.respond("garbage\r\n\r\n").status == 400);
    TEST_CHECK(server.respond("GET /metrics\r\n\r\n").status == 400);
    TEST_CHECK(server.respond("").status == 400);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: response serialization
// -----------------------------------------------------------------------------
void test_serialize() {
    std::cout << "[TEST] HttpServer serialize\n";

    exporter::HttpResponse rsp;
    rsp.status = 200;
    rsp.content_type = "text/plain";
    rsp.body = "x 1\n";
    TEST_CHECK(exporter::serialize(rsp) ==
               "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 4\r\nConnection: close\r\n\r\nx 1\n");

    rsp.head_only = true;
    TEST_CHECK(exporter::serialize(rsp) ==
               "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 4\r\nConnection: close\r\n\r\n");

    exporter::HttpResponse bad;
    bad.status = 405;
    bad.content_type = "text/plain";
    TEST_CHECK(exporter::serialize(bad).find("\r\nAllow: GET, HEAD\r\n") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: real scrape over loopback on an ephemeral port
// -----------------------------------------------------------------------------
void test_scrape_over_socket() {
    std::cout << "[TEST] HttpServer scrape over loopback\n";

    lcr::metrics::atomic::gauge64 value;
    value.store(1234);
    exporter::Exporter registry;
    registry.register_source([&value](exporter::Exporter::Collector& c) { value.collect("answer", "Answer.", c); });

    exporter::HttpServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.path = "/metrics";
    cfg.poll_interval_ms = 20;
    exporter::HttpServer server(cfg, registry);
    registry.register_source([&server](exporter::Exporter::Collector& c) { server.collect(c); });

    TEST_CHECK(server.start() == core::Error::None);
    TEST_CHECK(server.running());
    TEST_CHECK(server.port() != 0);
    TEST_CHECK(server.start() == core::Error::InvalidState);

    const std::string ok = http_exchange(server.port(), "GET /metrics HTTP/1.1\r\nHost: localhost\r\n\r\n");
    TEST_CHECK(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    TEST_CHECK(ok.find("Content-Type: text/plain; version=0.0.4") != std::string::npos);
    TEST_CHECK(ok.find("\r\n\r\n# HELP answer Answer.\n# TYPE answer gauge\nanswer 1234\n") != std::string::npos);
    TEST_CHECK(ok.find("prometheus_http_requests_total 0\n") != std::string::npos);

    const std::string missing = http_exchange(server.port(), "GET /nope HTTP/1.1\r\n\r\n");
    TEST_CHECK(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);

    const std::string method = http_exchange(server.port(), "PUT /metrics HTTP/1.1\r\n\r\n");
    TEST_CHECK(method.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) == 0);

    const std::string malformed = http_exchange(server.port(), "NONSENSE\r\n\r\n");
    TEST_CHECK(malformed.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

    // Scrape accounting happens after each response, outside render()
    const std::string again = http_exchange(server.port(), "GET /metrics HTTP/1.1\r\n\r\n");
    TEST_CHECK(again.find("prometheus_http_requests_total 4\n") != std::string::npos);
    TEST_CHECK(again.find("# HELP prometheus_http_rejected_requests_total Number of HTTP requests answered with a 4xx status\n")
               != std::string::npos);
    TEST_CHECK(again.find("prometheus_http_rejected_requests_total 3\n") != std::string::npos);

    server.stop();
    TEST_CHECK(!server.running());
    TEST_CHECK(server.telemetry().requests_total.load() == 5);
    TEST_CHECK(server.telemetry().rejected_requests_total.load() == 3);
    TEST_CHECK(server.telemetry().request_duration.snapshot().count == 5);
    server.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: bind failure is reported
// -----------------------------------------------------------------------------
void test_bind_failure() {
    std::cout << "[TEST] HttpServer bind failure\n";

    exporter::Exporter registry;
    exporter::HttpServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    exporter::HttpServer first(cfg, registry);
    TEST_CHECK(first.start() == core::Error::None);

    exporter::HttpServerConfig taken = cfg;
    taken.port = first.port();
    exporter::HttpServer second(taken, registry);
    TEST_CHECK(second.start() == core::Error::BindFailed);
    TEST_CHECK(!second.running());

    first.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a dead listening socket ends the serve loop and clears running()
// -----------------------------------------------------------------------------
void test_listen_socket_failure() {
    std::cout << "[TEST] HttpServer listening socket failure\n";

    exporter::Exporter registry;
    exporter::HttpServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.poll_interval_ms = 20;
    exporter::HttpServer server(cfg, registry);
    TEST_CHECK(server.start() == core::Error::None);
    TEST_CHECK(server.listen_fd() >= 0);

    // Shutting down a listening socket wakes poll() with POLLHUP
    TEST_CHECK(::shutdown(server.listen_fd(), SHUT_RDWR) == 0);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (server.running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    TEST_CHECK(!server.running());

    // The server can be restarted on a fresh socket
    TEST_CHECK(server.start() == core::Error::None);
    TEST_CHECK(server.running());
    const std::string ok = http_exchange(server.port(), "GET /metrics HTTP/1.1\r\n\r\n");
    TEST_CHECK(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);

    server.stop();
    TEST_CHECK(!server.running());
    TEST_CHECK(server.listen_fd() == -1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_respond_routing();
    test_serialize();
    test_scrape_over_socket();
    test_bind_failure();
    test_listen_socket_failure();

    std::cout << "\n[hiccupwatch::exporter::HttpServer] ALL TESTS PASSED\n";
    return 0;
}
