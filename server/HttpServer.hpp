#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "ApiHandler.hpp"
#include "../common/HttpProtocol.hpp"
#include "../common/RequestBuffer.hpp"

namespace lan_watch::server
{
    inline constexpr std::chrono::seconds CLIENT_IDLE_TIMEOUT{10};

    struct ClientContext
    {
        int socketfd;
        SSL *ssl_handle;
        lan_watch::common::RequestBuffer buff;
        bool is_handshake_complete;
        std::chrono::steady_clock::time_point last_activity;
    };

    // Single-threaded epoll loop. One request per connection, then close.
    class HttpServer
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_port;
        std::chrono::milliseconds m_idle_timeout;
        std::atomic<bool> m_stop_requested;
        std::map<int, ClientContext> m_clients;

        RequestHandler m_handler;
        std::string m_cert_file;
        std::string m_key_file;
        SSL_CTX *m_ssl_ctx;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void DispatchRequest(ClientContext &ctx);
        bool SendAll(ClientContext &ctx, const std::string &data);
        void CloseIdleClients();

    public:
        HttpServer(int port, RequestHandler handler, std::string cert_file = "", std::string key_file = "");

        ~HttpServer();

        HttpServer(const HttpServer &) = delete;
        HttpServer &operator=(const HttpServer &) = delete;

        void Init();
        void Run();

        // Safe to call from a signal handler.
        void Stop() { m_stop_requested = true; }

        bool TlsEnabled() const { return m_ssl_ctx != nullptr; }

        // After Init(), the port actually bound (resolves a requested port 0).
        int Port() const { return m_port; }

        // Call before Run().
        void SetIdleTimeout(std::chrono::milliseconds timeout) { m_idle_timeout = timeout; }
    };
}
