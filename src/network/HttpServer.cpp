#include "network/HttpServer.hpp"
#include "core/Logger.hpp"
#include "utils/ThreadPool.hpp"
#include <algorithm>
#include <chrono>
#include <limits>

struct HttpServer::Impl {
    SoupServer* server = nullptr;
    std::shared_ptr<const RequestHandler> handler;
    std::shared_ptr<ThreadPool> pool;
};

// 일시정지된 메시지를 메인 루프에서 마무리하기 위한 상태
struct HttpServer::PendingResponse {
    SoupServer* server = nullptr;
    SoupMessage* msg = nullptr;
    std::string path;
    HttpResponse response;

    PendingResponse(SoupServer* s, SoupMessage* m, const char* p)
        : server(SOUP_SERVER(g_object_ref(s)))
        , msg(SOUP_MESSAGE(g_object_ref(m)))
        , path(p ? p : "") {}

    ~PendingResponse() {
        g_object_unref(msg);
        g_object_unref(server);
    }

    PendingResponse(const PendingResponse&) = delete;
    PendingResponse& operator=(const PendingResponse&) = delete;
};

HttpServer::HttpServer(std::shared_ptr<const RequestHandler> handler, std::shared_ptr<ThreadPool> pool)
    : impl_(std::make_unique<Impl>()) {
    impl_->handler = std::move(handler);
    impl_->pool = std::move(pool);
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(const std::string& address, int port) {
    if (impl_->server) {
        LOG_WARNING("HTTP server already running");
        return true;
    }

    impl_->server = soup_server_new(SOUP_SERVER_SERVER_HEADER, "curlgate", nullptr);
    if (!impl_->server) {
        LOG_ERROR("Failed to create HTTP server");
        return false;
    }

    soup_server_add_handler(impl_->server, "/curl", &HttpServer::onCurl, this, nullptr);
    soup_server_add_handler(impl_->server, "/waiting", &HttpServer::onWaiting, this, nullptr);
    soup_server_add_handler(impl_->server, nullptr, &HttpServer::onDefault, this, nullptr);

    GError* error = nullptr;
    gboolean listening = FALSE;

    if (address.empty() || address == "0.0.0.0") {
        listening = soup_server_listen_all(impl_->server, static_cast<guint>(port),
                                           static_cast<SoupServerListenOptions>(0), &error);
    } else {
        GSocketAddress* socketAddress =
            g_inet_socket_address_new_from_string(address.c_str(), static_cast<guint>(port));
        if (!socketAddress) {
            LOG_ERROR("Invalid listen address: {}", address);
            stop();
            return false;
        }
        listening = soup_server_listen(impl_->server, socketAddress,
                                       static_cast<SoupServerListenOptions>(0), &error);
        g_object_unref(socketAddress);
    }

    if (!listening) {
        LOG_ERROR("Failed to listen on {}:{}: {}", address, port, error ? error->message : "unknown error");
        if (error) {
            g_error_free(error);
        }
        stop();
        return false;
    }

    LOG_INFO("HTTP server listening on {}:{}", address, port);
    return true;
}

void HttpServer::stop() {
    if (!impl_->server) {
        return;
    }

    soup_server_disconnect(impl_->server);
    g_object_unref(impl_->server);
    impl_->server = nullptr;

    LOG_INFO("HTTP server stopped");
}

void HttpServer::drain() {
    if (impl_->pool) {
        impl_->pool->shutdown();
    }

    // 워커가 g_idle_add 로 넘긴 completePending 을 메인 루프 밖에서 처리
    while (g_main_context_iteration(nullptr, FALSE)) {
    }

    stop();
}

HttpRequest HttpServer::toRequest(SoupMessage* msg, const char* path, GHashTable* query) {
    HttpRequest request;
    request.method = msg->method ? msg->method : "";
    request.path = path ? path : "";

    const char* contentType = soup_message_headers_get_content_type(msg->request_headers, nullptr);
    if (contentType) {
        request.contentType = contentType;
    }

    if (query) {
        GHashTableIter iter;
        gpointer key = nullptr;
        gpointer value = nullptr;
        g_hash_table_iter_init(&iter, query);
        while (g_hash_table_iter_next(&iter, &key, &value)) {
            request.query.emplace(static_cast<const char*>(key),
                                  value ? static_cast<const char*>(value) : "");
        }
    }

    if (msg->request_body && msg->request_body->data) {
        request.body.assign(msg->request_body->data, static_cast<size_t>(msg->request_body->length));
    }

    return request;
}

void HttpServer::respond(SoupMessage* msg, const char* path, const HttpResponse& response) {
    soup_message_set_status(msg, static_cast<guint>(response.status));
    soup_message_set_response(msg, response.contentType.c_str(), SOUP_MEMORY_COPY,
                              response.body.data(), response.body.size());

    LOG_INFO("{} {} -> {} ({} bytes)", msg->method ? msg->method : "?", path ? path : "",
             response.status, response.body.size());
}

gboolean HttpServer::completePending(gpointer userData) {
    auto* pending = static_cast<PendingResponse*>(userData);

    respond(pending->msg, pending->path.c_str(), pending->response);
    soup_server_unpause_message(pending->server, pending->msg);

    delete pending;
    return G_SOURCE_REMOVE;
}

void HttpServer::onCurl(SoupServer* server, SoupMessage* msg, const char* path,
                        GHashTable* query, SoupClientContext* /*client*/, gpointer userData) {
    auto* self = static_cast<HttpServer*>(userData);
    auto handler = self->impl_->handler;

    auto prepared = handler->prepareCurl(toRequest(msg, path, query));
    if (auto* response = std::get_if<HttpResponse>(&prepared)) {
        respond(msg, path, *response);
        return;
    }

    soup_server_pause_message(server, msg);
    auto* pending = new PendingResponse(server, msg, path);

    // 클라이언트가 먼저 끊어도 curl 은 자체 데드라인까지 실행된다
    bool submitted = self->impl_->pool->submit(
        [handler, job = std::move(std::get<RequestHandler::CurlJob>(prepared)), pending]() {
            try {
                pending->response = handler->executeCurl(job);
            } catch (const std::exception& e) {
                LOG_ERROR("Unhandled error while executing curl: {}", e.what());
                pending->response = RequestHandler::jsonError(500, "Internal server error");
            }
            g_idle_add(&HttpServer::completePending, pending);
        });

    if (!submitted) {
        pending->response = RequestHandler::jsonError(503, "Server is shutting down");
        completePending(pending);
    }
}

void HttpServer::onWaiting(SoupServer* server, SoupMessage* msg, const char* path,
                           GHashTable* query, SoupClientContext* /*client*/, gpointer userData) {
    auto* self = static_cast<HttpServer*>(userData);

    auto prepared = self->impl_->handler->prepareWaiting(toRequest(msg, path, query));
    if (auto* response = std::get_if<HttpResponse>(&prepared)) {
        respond(msg, path, *response);
        return;
    }

    auto delay = std::get<std::chrono::milliseconds>(prepared);
    auto interval = static_cast<guint>(std::min<long long>(
        delay.count(), std::numeric_limits<guint>::max()));

    soup_server_pause_message(server, msg);
    auto* pending = new PendingResponse(server, msg, path);
    pending->response = RequestHandler::waitingDone();

    // 타이머 소스 사용: 메인 루프를 막지 않는다
    g_timeout_add(interval, &HttpServer::completePending, pending);
}

void HttpServer::onDefault(SoupServer* /*server*/, SoupMessage* msg, const char* path,
                           GHashTable* /*query*/, SoupClientContext* /*client*/, gpointer /*userData*/) {
    respond(msg, path, RequestHandler::notFound());
}
