#include <fcntl.h>
#include <sys/epoll.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>
#include <poll.h>
#include <utility>
#include <vector>

#include "HttpServer.hpp"
#include <netinet/in.h>

namespace lan_watch::server
{
    using lan_watch::protocol::Response;
    using lan_watch::protocol::StatusCode;

    static bool wait_fd(int fd, short events, int timeout_ms = 5000)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = poll(&pfd, 1, timeout_ms);
        return r > 0;
    }

    HttpServer::HttpServer(int port, RequestHandler handler, std::string cert_file, std::string key_file)
        : m_server_fd(-1),
          m_epoll_fd(-1),
          m_port(port),
          m_idle_timeout(CLIENT_IDLE_TIMEOUT),
          m_stop_requested(false),
          m_handler(std::move(handler)),
          m_cert_file(std::move(cert_file)),
          m_key_file(std::move(key_file)),
          m_ssl_ctx(nullptr)
    {
        if (!m_handler)
            throw std::invalid_argument("HttpServer requires a request handler");
    }

    HttpServer::~HttpServer()
    {
        for (auto &it : m_clients)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        m_clients.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void HttpServer::LogOpenSSLErrors()
    {
        unsigned long err = 0;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[HttpServer] OpenSSL: " << buf << "\n";
        }
    }

    void HttpServer::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK.");
        }
    }

    void HttpServer::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void HttpServer::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[HttpServer] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void HttpServer::DisconnectClient(int fd)
    {
        auto it = m_clients.find(fd);
        if (it == m_clients.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            if (it->second.is_handshake_complete)
                SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        m_clients.erase(it);
    }

    void HttpServer::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr_in clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            int client_fd = accept(m_server_fd, reinterpret_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return;
                std::cerr << "[HttpServer] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            try
            {
                NonBlockingMode(client_fd);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[HttpServer] " << e.what() << " Dropping client " << client_fd << std::endl;
                close(client_fd);
                continue;
            }

            ClientContext ctx{};
            ctx.socketfd = client_fd;
            ctx.ssl_handle = nullptr;
            ctx.is_handshake_complete = true;
            ctx.last_activity = std::chrono::steady_clock::now();

            if (m_ssl_ctx)
            {
                SSL *ssl_handle = SSL_new(m_ssl_ctx);
                if (!ssl_handle)
                {
                    LogOpenSSLErrors();
                    close(client_fd);
                    continue;
                }
                SSL_set_fd(ssl_handle, client_fd);
                ctx.ssl_handle = ssl_handle;
                ctx.is_handshake_complete = false;
            }

            m_clients[client_fd] = std::move(ctx);

            try
            {
                EpollControlAdd(client_fd);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[HttpServer] " << e.what() << std::endl;
                if (m_clients[client_fd].ssl_handle)
                    SSL_free(m_clients[client_fd].ssl_handle);
                close(client_fd);
                m_clients.erase(client_fd);
                continue;
            }

            // The ClientHello may already be waiting.
            if (m_ssl_ctx)
                HandleClientData(client_fd);
        }
    }

    void HttpServer::HandleClientData(int fd)
    {
        auto it = m_clients.find(fd);
        if (it == m_clients.end())
            return;

        ClientContext &ctx = it->second;
        ctx.last_activity = std::chrono::steady_clock::now();

        if (ctx.is_handshake_complete == false)
        {
            int ret = SSL_accept(ctx.ssl_handle);

            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                {
                    return;
                }
                std::cerr << "[HttpServer] TLS handshake failed on " << fd << ". Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
        }

        uint8_t temp_buffer[4096];

        while (!ctx.buff.HasCompleteHead() && !ctx.buff.IsOverLimit())
        {
            if (ctx.ssl_handle)
            {
                int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));
                if (count > 0)
                {
                    ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                    continue;
                }

                int err = SSL_get_error(ctx.ssl_handle, count);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    break;

                DisconnectClient(fd);
                return;
            }

            ssize_t count = recv(fd, temp_buffer, sizeof(temp_buffer), 0);
            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }
            if (count == -1 && errno == EINTR)
                continue;
            if (count == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
                break;

            DisconnectClient(fd);
            return;
        }

        if (ctx.buff.IsOverLimit())
        {
            SendAll(ctx, lan_watch::protocol::SerializeResponse(
                             lan_watch::protocol::MakeErrorResponse(StatusCode::RequestHeaderFieldsTooLarge)));
            DisconnectClient(fd);
            return;
        }

        if (!ctx.buff.HasCompleteHead())
            return;

        DispatchRequest(ctx);
        DisconnectClient(fd);
    }

    void HttpServer::DispatchRequest(ClientContext &ctx)
    {
        auto req = ctx.buff.ExtractRequest();

        Response resp;
        bool include_body = true;
        if (!req.has_value())
        {
            resp = lan_watch::protocol::MakeErrorResponse(StatusCode::BadRequest);
        }
        else
        {
            try
            {
                resp = m_handler(req.value());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[HttpServer] Error handling " << req->method << " " << req->target << ": " << e.what() << std::endl;
                resp = lan_watch::protocol::MakeErrorResponse(StatusCode::InternalServerError);
            }
            include_body = req->method != "HEAD";
        }

        if (!SendAll(ctx, lan_watch::protocol::SerializeResponse(resp, include_body)))
        {
            std::cerr << "[HttpServer] Failed to send response to client " << ctx.socketfd << std::endl;
        }
    }

    bool HttpServer::SendAll(ClientContext &ctx, const std::string &data)
    {
        const auto *bytes = reinterpret_cast<const uint8_t *>(data.data());
        size_t off = 0;
        while (off < data.size())
        {
            if (ctx.ssl_handle)
            {
                int n = SSL_write(ctx.ssl_handle, bytes + off, static_cast<int>(data.size() - off));
                if (n > 0)
                {
                    off += static_cast<size_t>(n);
                    continue;
                }

                int err = SSL_get_error(ctx.ssl_handle, n);
                if (err == SSL_ERROR_WANT_READ)
                {
                    if (!wait_fd(ctx.socketfd, POLLIN))
                        return false;
                    continue;
                }
                if (err == SSL_ERROR_WANT_WRITE)
                {
                    if (!wait_fd(ctx.socketfd, POLLOUT))
                        return false;
                    continue;
                }
                return false;
            }

            ssize_t n = send(ctx.socketfd, bytes + off, data.size() - off, MSG_NOSIGNAL);
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n == -1 && errno == EINTR)
                continue;
            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (!wait_fd(ctx.socketfd, POLLOUT))
                    return false;
                continue;
            }
            return false;
        }
        return true;
    }

    void HttpServer::CloseIdleClients()
    {
        auto now = std::chrono::steady_clock::now();

        std::vector<int> idle;
        for (const auto &it : m_clients)
        {
            if (now - it.second.last_activity > m_idle_timeout)
                idle.push_back(it.first);
        }

        for (int fd : idle)
        {
            DisconnectClient(fd);
        }
    }

    void HttpServer::Init()
    {
        if (!m_cert_file.empty())
        {
            m_ssl_ctx = SSL_CTX_new(TLS_server_method());
            if (m_ssl_ctx == nullptr)
            {
                throw std::runtime_error("Failed to create SSL Context. Is OpenSSL installed?");
            }

            if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_file.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load '" + m_cert_file + "'. Check your paths!");
            }

            if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_file.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load '" + m_key_file + "'.");
            }

            if (!SSL_CTX_check_private_key(m_ssl_ctx))
            {
                throw std::runtime_error("Private Key does not match the Certificate!");
            }
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        socklen_t address_length = sizeof(serverAddress);
        if (getsockname(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), &address_length) == 0)
            m_port = ntohs(serverAddress.sin_port);

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        EpollControlAdd(m_server_fd);
    }

    void HttpServer::Run()
    {
        std::cout << "[HttpServer] Listening on port " << m_port << (m_ssl_ctx ? " (TLS)" : "") << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (!m_stop_requested)
        {
            // Bounded wait so Stop() and idle clients are noticed.
            if ((count = epoll_wait(m_epoll_fd, ev, 128, 500)) == -1)
            {
                if (errno == EINTR)
                    continue;

                std::cerr << "[HttpServer] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                    HandleNewConnection();
                else
                    HandleClientData(current_fd);
            }

            CloseIdleClients();
        }

        std::cout << "[HttpServer] Stopped" << std::endl;
    }
}
