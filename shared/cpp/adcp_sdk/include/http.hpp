#pragma once
#include <string>
#include <stdexcept>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Thrown when no HTTP response was obtained at all.
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& msg, bool timed_out)
        : std::runtime_error(msg), timed_out_(timed_out) {}
    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

// Must be called once before worker threads start issuing requests.
void http_global_init();

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
