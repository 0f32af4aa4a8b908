#include "platform/http_server.hpp"
#include "platform/command_executor.hpp"

#include <glibmm/init.h>

#include <arpa/inet.h>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace {
std::string fetch(int port, const std::string& request) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    assert(fd >= 0);

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(connect(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) == 0);

    assert(send(fd, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

    std::string response;
    char buffer[1024];
    ssize_t r = 0;
    while ((r = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(r));
    }
    close(fd);
    return response;
}
}  // namespace

int main() {
    Glib::init();

    {
        auto request = dazibao::http::parse_request_head("GET /data?refresh=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
        assert(request.has_value());
        assert(request->method == "GET");
        assert(request->path == "/data");
    }

    {
        assert(!dazibao::http::parse_request_head("GET /data HTTP/1.1").has_value());
        assert(!dazibao::http::parse_request_head("GARBAGE\r\n\r\n").has_value());
        assert(!dazibao::http::parse_request_head("GET data HTTP/1.1\r\n\r\n").has_value());
        assert(!dazibao::http::parse_request_head("GET / FTP/1.0\r\n\r\n").has_value());
    }

    {
        dazibao::HttpResponse response;
        response.status = 404;
        response.body = "nope";
        const std::string text = dazibao::http::serialize_response(response);
        assert(text.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
        assert(text.find("Content-Length: 4\r\n") != std::string::npos);
        assert(text.find("Connection: close\r\n") != std::string::npos);
        assert(text.substr(text.size() - 8) == "\r\n\r\nnope");
    }

    {
        dazibao::HttpServer server(0, [](const dazibao::HttpRequest& request) {
            dazibao::HttpResponse response;
            response.content_type = "application/json";
            response.body = "{\"path\":\"" + request.path + "\"}";
            return response;
        });

        std::string error;
        assert(server.start(error));
        assert(server.port() > 0);

        const std::string ok = fetch(server.port(), "GET /data HTTP/1.1\r\nHost: localhost\r\n\r\n");
        assert(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        assert(ok.find("Content-Type: application/json\r\n") != std::string::npos);
        assert(ok.find("{\"path\":\"/data\"}") != std::string::npos);

        const std::string bad = fetch(server.port(), "NONSENSE\r\n\r\n");
        assert(bad.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

        dazibao::HttpServer clash(server.port(), [](const dazibao::HttpRequest&) { return dazibao::HttpResponse(); });
        std::string clash_error;
        assert(!clash.start(clash_error));
        assert(!clash_error.empty());

        server.stop();
    }

    {
        // Shell children must not inherit the listening or client sockets.
        const std::string list_fds = "ls -l /proc/$$/fd";
        dazibao::HttpServer server(0, [&list_fds](const dazibao::HttpRequest&) {
            dazibao::HttpResponse response;
            response.body = dazibao::CommandExecutor().execute(list_fds).output;
            return response;
        });

        std::string error;
        assert(server.start(error));

        const auto idle = dazibao::CommandExecutor().execute(list_fds);
        assert(idle.success);
        assert(idle.output.find("socket:") == std::string::npos);

        const std::string during = fetch(server.port(), "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
        assert(during.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        assert(during.find("socket:") == std::string::npos);

        server.stop();
    }

    return 0;
}
