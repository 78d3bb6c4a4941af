#include "http_server.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <chrono>
#include <thread>

using namespace statik;
using statik::test::TempDir;
using namespace std::chrono_literals;

namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_.write("index.html", "<p>home</p>");
        root_.write("assets/app.js", "console.log(1);");

        ServerConfig cfg;
        cfg.port = 0;
        cfg.root = root_.path();
        cfg.worker_threads = 2;
        cfg.queue_capacity = 4;
        cfg.idle_timeout_s = 5;
        server_ = std::make_unique<HttpServer>(cfg);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        server_->stop();
    }

    int connect_client() const {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(server_->port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (connect(fd, (sockaddr*)&addr, sizeof(addr)) != 0) {
            close(fd);
            return -1;
        }
        return fd;
    }

    static std::string read_until_closed(int fd) {
        std::string out;
        char buf[4096];
        ssize_t n;
        while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    // One request on a fresh connection with Connection: close
    std::string fetch(const std::string& request_line) const {
        int fd = connect_client();
        EXPECT_GE(fd, 0);
        std::string req = request_line + "\r\nHost: localhost\r\nConnection: close\r\n\r\n";
        EXPECT_EQ(send(fd, req.data(), req.size(), 0), static_cast<ssize_t>(req.size()));
        std::string out = read_until_closed(fd);
        close(fd);
        return out;
    }

    TempDir root_;
    std::unique_ptr<HttpServer> server_;
};

} // namespace

TEST_F(HttpServerTest, ServesIndexForRoot) {
    std::string out = fetch("GET / HTTP/1.1");
    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(out.find("Content-Type: text/html\r\n"), std::string::npos);
    EXPECT_NE(out.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.find("\r\n\r\n") + 4), "<p>home</p>");
}

TEST_F(HttpServerTest, ServesFileWithMimeType) {
    std::string out = fetch("GET /assets/app.js HTTP/1.1");
    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(out.find("Content-Type: application/javascript\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.find("\r\n\r\n") + 4), "console.log(1);");
}

TEST_F(HttpServerTest, ErrorResponses) {
    EXPECT_EQ(fetch("GET /missing HTTP/1.1").rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_EQ(fetch("GET /../../etc/passwd HTTP/1.1").rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);

    std::string out = fetch("DELETE /index.html HTTP/1.1");
    EXPECT_EQ(out.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0), 0u);
    EXPECT_NE(out.find("Allow: GET\r\n"), std::string::npos);
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
    int fd = connect_client();
    ASSERT_GE(fd, 0);

    std::string req = "GET /assets/ HTTP/1.1\r\n\r\n"
                      "GET /assets/app.js HTTP/1.1\r\nConnection: close\r\n\r\n";
    ASSERT_EQ(send(fd, req.data(), req.size(), 0), static_cast<ssize_t>(req.size()));
    std::string out = read_until_closed(fd);
    close(fd);

    auto second = out.find("HTTP/1.1 200 OK", 1);
    ASSERT_NE(second, std::string::npos);
    EXPECT_NE(out.find("<a href=\"app.js\">app.js</a>"), std::string::npos);
    EXPECT_NE(out.find("console.log(1);", second), std::string::npos);

    EXPECT_TRUE([&] {
        for (int i = 0; i < 200; i++) {
            if (server_->get_stats().requests_served >= 2) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }());
    EXPECT_GE(server_->get_stats().connections_accepted, 1u);
}

TEST_F(HttpServerTest, StopClosesIdleConnections) {
    int fd = connect_client();
    ASSERT_GE(fd, 0);

    auto start = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);

    char c;
    EXPECT_LE(recv(fd, &c, 1, 0), 0);
    close(fd);
}

TEST(HttpServerTimeoutTest, SilentClientIsDisconnectedAfterIdleTimeout) {
    TempDir root;
    ServerConfig cfg;
    cfg.port = 0;
    cfg.root = root.path();
    cfg.worker_threads = 1;
    cfg.queue_capacity = 1;
    cfg.idle_timeout_s = 1;
    HttpServer server(cfg);
    ASSERT_TRUE(server.start());

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(connect(fd, (sockaddr*)&addr, sizeof(addr)), 0);

    // Guard the client side so a missing server timeout fails instead of hanging
    timeval tv{5, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    auto start = std::chrono::steady_clock::now();
    char c;
    EXPECT_EQ(recv(fd, &c, 1, 0), 0);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 500ms);
    EXPECT_LT(elapsed, 3s);

    close(fd);
    server.stop();
}
