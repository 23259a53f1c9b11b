#pragma once

#include <memory>
#include <string>
#include <libsoup/soup.h>
#include <glib.h>
#include "network/RequestHandler.hpp"

class ThreadPool;

// libsoup 서버. GLib 메인 루프에서 동작하며 curl 실행은 ThreadPool 로 넘긴다
class HttpServer {
public:
    HttpServer(std::shared_ptr<const RequestHandler> handler, std::shared_ptr<ThreadPool> pool);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start(const std::string& address, int port);
    void stop();

    // 워커 풀을 비우고 이미 완료된 응답을 보낸 뒤 서버를 멈춘다
    void drain();

private:
    // Soup 콜백들 (static 함수로)
    static void onCurl(SoupServer* server, SoupMessage* msg, const char* path,
                       GHashTable* query, SoupClientContext* client, gpointer userData);
    static void onWaiting(SoupServer* server, SoupMessage* msg, const char* path,
                          GHashTable* query, SoupClientContext* client, gpointer userData);
    static void onDefault(SoupServer* server, SoupMessage* msg, const char* path,
                          GHashTable* query, SoupClientContext* client, gpointer userData);

    static HttpRequest toRequest(SoupMessage* msg, const char* path, GHashTable* query);
    static void respond(SoupMessage* msg, const char* path, const HttpResponse& response);

    struct PendingResponse;
    static gboolean completePending(gpointer userData);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};
