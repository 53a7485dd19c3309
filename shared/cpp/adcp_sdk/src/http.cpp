#include "../include/http.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw HttpError("curl_easy_init failed", false); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};

std::once_flag g_curl_once;
}

void http_global_init() {
    std::call_once(g_curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms) {
    http_global_init();
    if (timeout_ms <= 0) throw HttpError("deadline already passed", true);

    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    c.headers = curl_slist_append(c.headers, "Accept: application/json");

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L); // called from worker threads

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw HttpError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code),
                        code == CURLE_OPERATION_TIMEDOUT);
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
