// ==============================================================================
// test_upstream_connection_gtest.cpp - Loopback tests for the MUD TCP connection
// ==============================================================================

#include "mudgate/upstream_connection.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <thread>

namespace mudgate {

using namespace std::chrono_literals;

namespace {

// 驱动io_context直到条件成立，最多约5秒
template <typename Pred>
bool run_until(net::io_context& ioc, Pred pred) {
    for (int i = 0; i < 500 && !pred(); ++i) {
        ioc.restart();
        ioc.run_for(5ms);
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class TcpUpstreamTest : public ::testing::Test {
protected:
    TcpUpstreamTest()
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          peer_(ioc_) {}

    std::string port() const { return std::to_string(acceptor_.local_endpoint().port()); }

    // 拨号并等待MUD端接受连接
    std::shared_ptr<TcpUpstream> connect() {
        bool accepted = false;
        acceptor_.async_accept(peer_, [&accepted](beast::error_code ec) { accepted = !ec; });

        auto upstream = std::make_shared<TcpUpstream>(ioc_, 5s, false, 1);
        std::optional<beast::error_code> result;
        upstream->dial("127.0.0.1", port(), [&result](beast::error_code ec) { result = ec; });

        EXPECT_TRUE(run_until(ioc_, [&] { return result.has_value() && accepted; }));
        EXPECT_TRUE(result.has_value() && !*result);
        return upstream;
    }

    // 反复非阻塞读取，直到读到want字节或出错
    std::string read_from(TcpUpstream& upstream, std::size_t want, std::size_t max_bytes, beast::error_code& ec) {
        std::string out;
        run_until(ioc_, [&] {
            upstream.read_some(out, max_bytes, ec);
            return ec || out.size() >= want;
        });
        return out;
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    tcp::socket peer_;
};

// ============================================================================
// Tests
// ============================================================================

TEST_F(TcpUpstreamTest, DialWriteAndRead) {
    auto upstream = connect();

    upstream->write("kill orc\r\n");
    upstream->write("flee\r\n");
    ASSERT_TRUE(run_until(ioc_, [&] { return peer_.available() >= 16; }));

    std::string received(16, '\0');
    net::read(peer_, net::buffer(&received[0], received.size()));
    EXPECT_EQ(received, "kill orc\r\nflee\r\n");

    net::write(peer_, net::buffer(std::string("The orc flees.\r\n")));
    beast::error_code ec;
    EXPECT_EQ(read_from(*upstream, 16, 1024, ec), "The orc flees.\r\n");
    EXPECT_FALSE(ec);
}

TEST_F(TcpUpstreamTest, ReadWithoutDataDoesNotBlock) {
    auto upstream = connect();

    std::string out;
    beast::error_code ec;
    EXPECT_EQ(upstream->read_some(out, 1024, ec), 0u);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(out.empty());
}

TEST_F(TcpUpstreamTest, ReadCappedAtMaxBytes) {
    auto upstream = connect();

    const std::string flood(10000, 'x');
    net::write(peer_, net::buffer(flood));
    std::this_thread::sleep_for(50ms);

    std::string out;
    beast::error_code ec;
    run_until(ioc_, [&] {
        return upstream->read_some(out, 100, ec) > 0 || ec;
    });
    EXPECT_FALSE(ec);
    EXPECT_EQ(out.size(), 100u);

    const auto rest = flood.size() - out.size();
    EXPECT_EQ(read_from(*upstream, rest, 100000, ec).size(), rest);
}

TEST_F(TcpUpstreamTest, PeerCloseReportsEof) {
    auto upstream = connect();

    net::write(peer_, net::buffer(std::string("Goodbye\n")));
    peer_.close();

    beast::error_code ec;
    std::string out;
    run_until(ioc_, [&] {
        upstream->read_some(out, 1024, ec);
        return static_cast<bool>(ec);
    });
    EXPECT_EQ(out, "Goodbye\n");
    EXPECT_EQ(ec, net::error::eof);
}

TEST_F(TcpUpstreamTest, DialRefused) {
    const auto closed_port = port();
    acceptor_.close();

    auto upstream = std::make_shared<TcpUpstream>(ioc_, 5s, false, 2);
    std::optional<beast::error_code> result;
    upstream->dial("127.0.0.1", closed_port, [&result](beast::error_code ec) { result = ec; });

    ASSERT_TRUE(run_until(ioc_, [&] { return result.has_value(); }));
    EXPECT_TRUE(*result);

    std::string out;
    beast::error_code ec;
    upstream->read_some(out, 1024, ec);
    EXPECT_EQ(ec, net::error::not_connected);
}

TEST_F(TcpUpstreamTest, CloseCancelsPendingDial) {
    acceptor_.async_accept(peer_, [](beast::error_code) {});

    auto upstream = std::make_shared<TcpUpstream>(ioc_, 5s, false, 3);
    bool called = false;
    upstream->dial("127.0.0.1", port(), [&called](beast::error_code) { called = true; });
    upstream->close();

    ioc_.restart();
    ioc_.run_for(200ms);
    EXPECT_FALSE(called);
}

TEST_F(TcpUpstreamTest, ClosedConnectionIgnoresWrites) {
    auto upstream = connect();
    upstream->close();
    upstream->write("look\r\n");

    std::string out;
    beast::error_code ec;
    EXPECT_EQ(upstream->read_some(out, 1024, ec), 0u);
    EXPECT_EQ(ec, net::error::not_connected);
}

} // namespace mudgate
