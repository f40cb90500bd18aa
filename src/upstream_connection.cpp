#include "mudgate/upstream_connection.hpp"

#include <boost/asio/write.hpp>
#include <algorithm>
#include <iostream>

namespace mudgate {

TcpUpstream::TcpUpstream(net::io_context& ioc, std::chrono::seconds dial_timeout, bool debug, std::uint64_t id)
    : id_(id),
      resolver_(net::make_strand(ioc)),
      stream_(net::make_strand(ioc)),
      dial_timeout_(dial_timeout),
      debug_(debug) {}

void TcpUpstream::dial(const std::string& host, const std::string& port, DialHandler handler) {
    dial_handler_ = std::move(handler);

    if (debug_) std::cout << "[Upstream " << id_ << "] Resolving " << host << ":" << port << std::endl;

    resolver_.async_resolve(
        host,
        port,
        beast::bind_front_handler(&TcpUpstream::on_resolve, shared_from_this()));
}

void TcpUpstream::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");
    if (closed_) return;

    stream_.expires_after(dial_timeout_);
    stream_.async_connect(
        results,
        beast::bind_front_handler(&TcpUpstream::on_connect, shared_from_this()));
}

void TcpUpstream::on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail(ec, "connect");

    stream_.expires_never();

    // tick里的同步read_some依赖非阻塞模式，遇到无数据时返回would_block
    stream_.socket().non_blocking(true, ec);
    if (ec) return fail(ec, "non_blocking");

    beast::error_code ignored;
    stream_.socket().set_option(tcp::no_delay(true), ignored);

    if (closed_) return;
    connected_ = true;
    if (debug_) std::cout << "[Upstream " << id_ << "] Connected." << std::endl;

    auto handler = std::move(dial_handler_);
    dial_handler_ = nullptr;
    if (handler) handler(ec);
}

void TcpUpstream::write(std::string data) {
    if (closed_ || !connected_ || write_error_) return;

    queue_.push_back(std::move(data));
    if (queue_.size() > 1) return;
    do_write();
}

void TcpUpstream::do_write() {
    net::async_write(
        stream_,
        net::buffer(queue_.front()),
        beast::bind_front_handler(&TcpUpstream::on_write, shared_from_this()));
}

void TcpUpstream::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        queue_.clear();
        if (ec == net::error::operation_aborted || closed_) return;

        std::cerr << "[Upstream " << id_ << "] Error in write: " << ec.message() << std::endl;
        write_error_ = ec;
        return;
    }

    queue_.pop_front();
    if (!queue_.empty()) {
        do_write();
    }
}

std::size_t TcpUpstream::read_some(std::string& out, std::size_t max_bytes, beast::error_code& ec) {
    ec = {};
    if (write_error_) {
        ec = write_error_;
        return 0;
    }
    if (closed_ || !connected_) {
        ec = net::error::not_connected;
        return 0;
    }

    char chunk[4096];
    std::size_t total = 0;

    while (total < max_bytes) {
        const std::size_t want = std::min(sizeof(chunk), max_bytes - total);
        beast::error_code read_ec;
        const std::size_t n = stream_.socket().read_some(net::buffer(chunk, want), read_ec);

        if (read_ec == net::error::would_block || read_ec == net::error::try_again) break;
        if (read_ec) {
            ec = read_ec;
            break;
        }

        out.append(chunk, n);
        total += n;
        if (n < want) break;
    }

    return total;
}

void TcpUpstream::close() {
    if (closed_) return;
    closed_ = true;
    connected_ = false;
    dial_handler_ = nullptr;

    resolver_.cancel();

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.socket().close(ec);
    if (ec && debug_) std::cerr << "[Upstream " << id_ << "] Close error: " << ec.message() << std::endl;

    if (debug_) std::cout << "[Upstream " << id_ << "] Closed." << std::endl;
}

void TcpUpstream::fail(beast::error_code ec, char const* what) {
    if (ec == net::error::operation_aborted || closed_) return;

    std::cerr << "[Upstream " << id_ << "] Error in " << what << ": " << ec.message() << std::endl;

    auto handler = std::move(dial_handler_);
    dial_handler_ = nullptr;
    if (handler) handler(ec);
}

} // namespace mudgate
