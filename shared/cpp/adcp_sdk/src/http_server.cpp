#include "../include/http_server.hpp"
#include "../include/log.hpp"
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include <cstdint>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using mhd_result = enum MHD_Result;
#else
using mhd_result = int;
#endif

namespace {
struct ConnInfo {
    HttpRequest req;
};

mhd_result send_response(struct MHD_Connection* conn, const HttpReply& reply) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(reply.body.size(), (void*)reply.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, reply.content_type.c_str());
    mhd_result ret = MHD_queue_response(conn, reply.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> mhd_result {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

mhd_result handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                   const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<HttpServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{HttpRequest{method, url, {}, {}}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->req.body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    ci->req.query = parse_query(connection);
    HttpReply reply;
    try {
        reply = server->handle(ci->req);
    } catch (const std::exception& e) {
        log_line(LogLevel::Error, "http", ci->req.method + " " + ci->req.path + " failed: " + e.what());
        reply.status = MHD_HTTP_INTERNAL_SERVER_ERROR;
        reply.body = json({{"error", e.what()}}).dump();
    }
    return send_response(connection, reply);
}

void request_completed(void* /*cls*/, struct MHD_Connection*, void** con_cls, enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

HttpServer::HttpServer(Handler handler) : handler_(std::move(handler)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(int port) {
    if (daemon_) return true;
    daemon_ = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                               static_cast<uint16_t>(port), nullptr, nullptr,
                               &handler, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) return false;
    const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    port_ = info ? info->port : port;
    return true;
}

void HttpServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
}

std::string HttpServer::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}
