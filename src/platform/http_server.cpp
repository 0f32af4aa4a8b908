#include "platform/http_server.hpp"

#include "platform/logging.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace dazibao {
namespace {
void set_timeout(int fd, int option, int seconds) {
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, option, &tv, sizeof tv);
}

bool write_all(int fd, const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t w = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w <= 0) {
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool read_head(int fd, std::string& head) {
    char buffer[2048];
    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() >= http::kMaxRequestHead) {
            return false;
        }
        ssize_t r = recv(fd, buffer, sizeof(buffer), 0);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r <= 0) {
            return false;
        }
        head.append(buffer, static_cast<size_t>(r));
    }
    return true;
}
}  // namespace

std::optional<HttpRequest> http::parse_request_head(const std::string& head) {
    size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream line(head.substr(0, line_end));
    HttpRequest request;
    std::string target;
    std::string version;
    if (!(line >> request.method >> target >> version)) {
        return std::nullopt;
    }
    if (version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/') {
        return std::nullopt;
    }

    size_t query = target.find_first_of("?#");
    request.path = target.substr(0, query);
    return request;
}

const char* http::status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string http::serialize_response(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << status_text(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Cache-Control: no-store\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    return out.str();
}

HttpResponse http::text_response(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.body = body + "\n";
    return response;
}

HttpServer::HttpServer(int port, RequestHandler handler)
    : m_port(port), m_handler(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    if (m_running) {
        return true;
    }

    m_server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_server_fd < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }

    int reuse = 1;
    setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(static_cast<uint16_t>(m_port));

    if (bind(m_server_fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        error = "bind to port " + std::to_string(m_port) + " failed: " + std::strerror(errno);
        close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    if (listen(m_server_fd, 16) < 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close(m_server_fd);
        m_server_fd = -1;
        return false;
    }

    if (m_port == 0) {
        socklen_t length = sizeof(address);
        if (getsockname(m_server_fd, reinterpret_cast<struct sockaddr*>(&address), &length) == 0) {
            m_port = ntohs(address.sin_port);
        }
    }

    // Accept wakes up every second so stop() is observed.
    set_timeout(m_server_fd, SO_RCVTIMEO, 1);

    m_running = true;
    m_thread = std::thread(&HttpServer::accept_loop, this);
    return true;
}

void HttpServer::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (m_server_fd >= 0) {
        close(m_server_fd);
        m_server_fd = -1;
    }
}

void HttpServer::accept_loop() {
    while (m_running) {
        int client_fd = accept4(m_server_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd >= 0) {
            handle_client(client_fd);
        }
    }
}

void HttpServer::handle_client(int client_fd) {
    set_timeout(client_fd, SO_RCVTIMEO, 5);
    set_timeout(client_fd, SO_SNDTIMEO, 5);

    HttpResponse response;
    std::string head;
    if (!read_head(client_fd, head)) {
        close(client_fd);
        return;
    }

    auto request = http::parse_request_head(head);
    if (!request) {
        response = http::text_response(400, "Bad Request");
    } else {
        response = m_handler(*request);
    }

    if (!write_all(client_fd, http::serialize_response(response))) {
        logging::warning(std::string("failed to write HTTP response: ") + std::strerror(errno));
    }
    close(client_fd);
}
}  // namespace dazibao
