#ifndef DAZIBAO_PLATFORM_HTTP_SERVER_HPP
#define DAZIBAO_PLATFORM_HTTP_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace dazibao {
struct HttpRequest {
    std::string method;
    std::string path;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

namespace http {
constexpr size_t kMaxRequestHead = 16 * 1024;

// Parses the request line of a head ending in CRLF CRLF; the query string is dropped.
std::optional<HttpRequest> parse_request_head(const std::string& head);
std::string serialize_response(const HttpResponse& response);
const char* status_text(int status);
HttpResponse text_response(int status, const std::string& body);
}

class HttpServer {
public:
    HttpServer(int port, RequestHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and listens on the calling thread, then serves on a background thread.
    // Port 0 picks a free port, reported by port() afterwards.
    bool start(std::string& error);
    void stop();

    int port() const { return m_port; }

private:
    void accept_loop();
    void handle_client(int client_fd);

    int m_port;
    RequestHandler m_handler;
    int m_server_fd = -1;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};
}  // namespace dazibao

#endif
