#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "../server/HttpServer.hpp"

using namespace lan_watch;

namespace
{
    protocol::Response StubHandler(const protocol::Request &req)
    {
        if (req.Path() == "/boom")
            throw std::runtime_error("handler failure");
        if (req.Path() != "/ping")
            return protocol::MakeErrorResponse(protocol::StatusCode::NotFound);

        protocol::Response resp;
        resp.body = "pong";
        return resp;
    }

    // Plain blocking client socket with a receive timeout.
    class TestClient
    {
    public:
        explicit TestClient(int port) : m_fd(socket(AF_INET, SOCK_STREAM, 0))
        {
            if (m_fd == -1)
                throw std::runtime_error("socket failed");

            timeval tv{};
            tv.tv_sec = 5;
            setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(port));
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            if (connect(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
            {
                close(m_fd);
                throw std::runtime_error("connect failed");
            }
        }

        ~TestClient() { close(m_fd); }

        TestClient(const TestClient &) = delete;
        TestClient &operator=(const TestClient &) = delete;

        void Send(const std::string &data)
        {
            size_t off = 0;
            while (off < data.size())
            {
                ssize_t n = send(m_fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
                if (n <= 0)
                    throw std::runtime_error("send failed");
                off += static_cast<size_t>(n);
            }
        }

        // Reads until the server closes; sets closed to false on timeout.
        std::string ReadUntilClose(bool &closed)
        {
            std::string out;
            char buf[4096];
            while (true)
            {
                ssize_t n = recv(m_fd, buf, sizeof(buf), 0);
                if (n > 0)
                {
                    out.append(buf, static_cast<size_t>(n));
                    continue;
                }
                closed = (n == 0);
                return out;
            }
        }

    private:
        int m_fd;
    };

    class HttpServerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            http = std::make_unique<server::HttpServer>(0, StubHandler);
            http->SetIdleTimeout(std::chrono::milliseconds(1000));
            http->Init();
            loop = std::thread([this]
                               { http->Run(); });
        }

        void TearDown() override
        {
            http->Stop();
            if (loop.joinable())
                loop.join();
        }

        std::string Exchange(const std::string &request, bool &closed)
        {
            TestClient client(http->Port());
            client.Send(request);
            return client.ReadUntilClose(closed);
        }

        std::unique_ptr<server::HttpServer> http;
        std::thread loop;
    };

    std::string StatusLine(const std::string &response)
    {
        return response.substr(0, response.find("\r\n"));
    }
}

TEST_F(HttpServerTest, BindsEphemeralPort)
{
    EXPECT_GT(http->Port(), 0);
    EXPECT_FALSE(http->TlsEnabled());
}

TEST_F(HttpServerTest, GetIsAnsweredOnceThenClosed)
{
    bool closed = false;
    std::string response = Exchange("GET /ping HTTP/1.1\r\nHost: test\r\n\r\n", closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(StatusLine(response), "HTTP/1.1 200 OK");
    EXPECT_NE(response.find("Content-Length: 4\r\n"), std::string::npos);
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos);
    ASSERT_GE(response.size(), 8u);
    EXPECT_EQ(response.substr(response.size() - 8), "\r\n\r\npong");
}

TEST_F(HttpServerTest, PipelinedSecondRequestIsNotServed)
{
    bool closed = false;
    std::string response = Exchange("GET /ping HTTP/1.1\r\n\r\nGET /ping HTTP/1.1\r\n\r\n", closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u);
    EXPECT_EQ(response.find("HTTP/1.1", 1), std::string::npos);
}

TEST_F(HttpServerTest, HeadSendsLengthWithoutBody)
{
    bool closed = false;
    std::string response = Exchange("HEAD /ping HTTP/1.1\r\n\r\n", closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(StatusLine(response), "HTTP/1.1 200 OK");
    EXPECT_NE(response.find("Content-Length: 4\r\n"), std::string::npos);
    ASSERT_GE(response.size(), 4u);
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
    EXPECT_EQ(response.find("pong"), std::string::npos);
}

TEST_F(HttpServerTest, GarbageHeadIsBadRequest)
{
    bool closed = false;
    std::string response = Exchange("\x16\x03\x01 nonsense\r\n\r\n", closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(StatusLine(response), "HTTP/1.1 400 Bad Request");
}

TEST_F(HttpServerTest, OversizedHeadIsRejected)
{
    // Exactly one byte over the limit and no terminator, so the server has
    // read everything by the time it answers.
    std::string request = "GET /ping HTTP/1.1\r\nX-Pad: ";
    request.append(protocol::MAX_REQUEST_HEAD + 1 - request.size(), 'a');

    bool closed = false;
    std::string response = Exchange(request, closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(StatusLine(response), "HTTP/1.1 431 Request Header Fields Too Large");
}

TEST_F(HttpServerTest, HandlerExceptionIsInternalError)
{
    bool closed = false;
    std::string response = Exchange("GET /boom HTTP/1.1\r\n\r\n", closed);

    EXPECT_TRUE(closed);
    EXPECT_EQ(StatusLine(response), "HTTP/1.1 500 Internal Server Error");
}

TEST_F(HttpServerTest, IncompleteRequestIsClosedWhenIdle)
{
    TestClient client(http->Port());
    client.Send("GET /ping HTTP/1.1\r\n");

    auto started = std::chrono::steady_clock::now();
    bool closed = false;
    std::string response = client.ReadUntilClose(closed);

    EXPECT_TRUE(closed);
    EXPECT_TRUE(response.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST(HttpServerConfigTest, DefaultIdleTimeoutIsTenSeconds)
{
    EXPECT_EQ(server::CLIENT_IDLE_TIMEOUT, std::chrono::seconds(10));
}
