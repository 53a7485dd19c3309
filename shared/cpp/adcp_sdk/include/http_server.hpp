#pragma once
#include <string>
#include <map>
#include <functional>

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> query;
};

struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// libmicrohttpd daemon with one thread per connection, so a slow handler
// never holds up other clients.
class HttpServer {
public:
    using Handler = std::function<HttpReply(const HttpRequest&)>;

    explicit HttpServer(Handler handler);
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // port 0 binds an ephemeral port; see port().
    bool start(int port);
    void stop();
    int port() const { return port_; }
    std::string base_url() const;

    HttpReply handle(const HttpRequest& req) const { return handler_(req); }

private:
    Handler handler_;
    struct MHD_Daemon* daemon_{nullptr};
    int port_{0};
};
