#include "hiccupwatch/exporter/http_server.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

#include "lcr/system/monotonic_clock.hpp"
#include "lcr/log/logger.hpp"


namespace hiccupwatch::exporter {

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
    }
    return "Unknown";
}

std::string serialize(const HttpResponse& response) {
    std::string out;
    out.reserve(128 + (response.head_only ? 0 : response.body.size()));
    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out.push_back(' ');
    out.append(reason_phrase(response.status));
    out += "\r\nContent-Type: ";
    out += response.content_type;
    out += "\r\nContent-Length: ";
    out += std::to_string(response.body.size());
    if (response.status == 405) {
        out += "\r\nAllow: GET, HEAD";
    }
    out += "\r\nConnection: close\r\n\r\n";
    if (!response.head_only) {
        out += response.body;
    }
    return out;
}


HttpServer::HttpServer(HttpServerConfig config, const Exporter& exporter, std::shared_ptr<HttpTelemetry> telemetry)
    : config_(std::move(config))
    , exporter_(exporter)
    , telemetry_(std::move(telemetry))
{}

HttpServer::~HttpServer() {
    stop();
}

core::Error HttpServer::start() {
    if (running()) {
        HCW_WARN("[http] start() ignored, server already running on port " << bound_port_);
        return core::Error::InvalidState;
    }
    // Reclaims a serve loop that ended on a socket failure
    stop();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* result = nullptr;
    const std::string port_str = std::to_string(config_.port);
    const char* host = config_.host.empty() ? nullptr : config_.host.c_str();
    const int gai = ::getaddrinfo(host, port_str.c_str(), &hints, &result);
    if (gai != 0) {
        HCW_ERROR("[http] cannot resolve " << config_.host << ":" << config_.port << ": " << ::gai_strerror(gai));
        return core::Error::BindFailed;
    }

    int fd = -1;
    int last_errno = 0;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        const int one = 1;
        (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 16) == 0) {
            break;
        }
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(result);

    if (fd < 0) {
        HCW_ERROR("[http] cannot listen on " << config_.host << ":" << config_.port << ": " << std::strerror(last_errno));
        return core::Error::BindFailed;
    }

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        HCW_ERROR("[http] getsockname failed: " << std::strerror(errno));
        ::close(fd);
        return core::Error::IoError;
    }
    if (addr.ss_family == AF_INET) {
        bound_port_ = ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    else {
        bound_port_ = ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }

    listen_fd_ = fd;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { serve_loop_(); });

    HCW_INFO("[http] serving metrics on http://" << config_.host << ":" << bound_port_ << config_.path);
    return core::Error::None;
}

void HttpServer::stop() noexcept {
    const bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (was_running) {
        HCW_INFO("[http] scrape endpoint stopped (" << telemetry_->requests_total.load() << " requests served)");
    }
}

HttpResponse HttpServer::respond(std::string_view request) const {
    HttpResponse rsp;
    rsp.content_type = "text/plain; charset=utf-8";

    // Request line: METHOD SP TARGET SP VERSION CRLF
    const std::size_t eol = request.find("\r\n");
    const std::string_view line = request.substr(0, eol);
    const std::size_t sp1 = line.find(' ');
    const std::size_t sp2 = (sp1 == std::string_view::npos) ? sp1 : line.find(' ', sp1 + 1);
    if (eol == std::string_view::npos || sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        line.substr(sp2 + 1).rfind("HTTP/", 0) != 0) {
        rsp.status = 400;
        rsp.body = "Bad Request\n";
        return rsp;
    }

    const std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    const std::size_t query = target.find('?');
    if (query != std::string_view::npos) {
        target = target.substr(0, query);
    }

    const bool is_head = (method == "HEAD");
    if (method != "GET" && !is_head) {
        rsp.status = 405;
        rsp.body = "Method Not Allowed\n";
        return rsp;
    }
    rsp.head_only = is_head;
    if (target != config_.path) {
        rsp.status = 404;
        rsp.body = "Not Found\n";
        return rsp;
    }

    rsp.status = 200;
    rsp.content_type = std::string(kExpositionContentType);
    rsp.body = exporter_.render();
    return rsp;
}

void HttpServer::serve_loop_() noexcept {
    HCW_DEBUG("[http] accept loop entered");
    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, config_.poll_interval_ms);
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            fail_("poll failed", errno);
            break;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            fail_("listening socket closed", 0);
            break;
        }
        const int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            const int err = errno;
            if (err == EBADF || err == EINVAL || err == ENOTSOCK || err == EOPNOTSUPP) {
                fail_("accept failed", err);
                break;
            }
            if (err != EINTR && err != EAGAIN && err != ECONNABORTED) {
                HCW_ERROR("[http] accept failed: " << std::strerror(err));
            }
            continue;
        }
        handle_connection_(client);
        ::close(client);
    }
    HCW_DEBUG("[http] accept loop exited");
}

void HttpServer::fail_(const char* what, int err) noexcept {
    running_.store(false, std::memory_order_release);
    if (err != 0) {
        HCW_ERROR("[http] " << what << ": " << std::strerror(err) << ", scrape endpoint stopped");
    }
    else {
        HCW_ERROR("[http] " << what << ", scrape endpoint stopped");
    }
}

void HttpServer::handle_connection_(int fd) noexcept {
    const std::uint64_t t0 = lcr::system::monotonic_clock::now_ns();

    timeval tv{};
    tv.tv_sec = config_.io_timeout_ms / 1000;
    tv.tv_usec = (config_.io_timeout_ms % 1000) * 1000;
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    try {
        std::string request;
        HttpResponse rsp;
        if (!read_request_(fd, request)) {
            rsp.status = 400;
            rsp.content_type = "text/plain; charset=utf-8";
            rsp.body = "Bad Request\n";
        }
        else {
            rsp = respond(request);
        }

        if (!write_all_(fd, serialize(rsp))) {
            HCW_WARN("[http] failed to write response: " << std::strerror(errno));
        }
        telemetry_->requests_total.inc();
        if (rsp.status == 200) {
            telemetry_->response_size_bytes.store(rsp.body.size());
        }
        else {
            telemetry_->rejected_requests_total.inc();
        }
        HCW_TRACE("[http] " << rsp.status << " " << reason_phrase(rsp.status) << " (" << rsp.body.size() << " bytes)");
    }
    catch (const std::exception& e) {
        HCW_ERROR("[http] request handling failed: " << e.what());
    }

    telemetry_->request_duration.record(lcr::system::monotonic_clock::now_ns() - t0);
}

bool HttpServer::read_request_(int fd, std::string& out) const {
    char buf[1024];
    while (out.size() < config_.max_request_bytes) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        out.append(buf, static_cast<std::size_t>(n));
        if (out.find("\r\n\r\n") != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool HttpServer::write_all_(int fd, std::string_view data) noexcept {
    while (!data.empty()) {
        const ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

} // namespace hiccupwatch::exporter
