#include "mudgate/websocket_server.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace mudgate {

class ClientChannel : public std::enable_shared_from_this<ClientChannel> {
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    std::vector<std::shared_ptr<const std::string>> queue_;
    ChannelHandlers handlers_;
    std::function<void(std::shared_ptr<ClientChannel>)> on_leave_;
    std::uint64_t id_ = 0;
    bool opened_ = false;
    bool left_ = false;
    bool debug_;

public:
    ClientChannel(tcp::socket&& socket, const ChannelHandlers& handlers,
                  std::function<void(std::shared_ptr<ClientChannel>)> on_leave, bool debug)
        : ws_(std::move(socket)), handlers_(handlers), on_leave_(std::move(on_leave)), debug_(debug) {}

    ~ClientChannel() {
        if (debug_) std::cout << "[Channel " << id_ << "] Destroyed." << std::endl;
    }

    void run() {
        net::dispatch(ws_.get_executor(),
            beast::bind_front_handler(&ClientChannel::on_run, shared_from_this()));
    }

    void send(std::string message) {
        auto ss = std::make_shared<const std::string>(std::move(message));
        net::post(ws_.get_executor(),
            beast::bind_front_handler(&ClientChannel::on_send, shared_from_this(), ss));
    }

    void close() {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
    }

private:
    void on_run() {
        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        http::async_read(ws_.next_layer(), buffer_, req_,
            beast::bind_front_handler(&ClientChannel::on_read_request, shared_from_this()));
    }

    void on_read_request(beast::error_code ec, std::size_t) {
        if (ec) {
            if (debug_ && ec != http::error::end_of_stream) {
                std::cerr << "[Channel] Request read error: " << ec.message() << std::endl;
            }
            return leave();
        }

        if (!websocket::is_upgrade(req_)) {
            return do_http_response();
        }

        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " mudgate");
            }));
        ws_.async_accept(req_, beast::bind_front_handler(&ClientChannel::on_accept, shared_from_this()));
    }

    void do_http_response() {
        res_ = std::make_shared<http::response<http::string_body>>();
        res_->version(req_.version());
        res_->keep_alive(false);
        res_->set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " mudgate");

        const auto target = req_.target();
        if (req_.method() == http::verb::get && target == "/") {
            res_->result(http::status::ok);
            res_->set(http::field::content_type, "text/html");
            res_->body() = "<h1>MudGate</h1><p>WebSocket gateway running.</p>";
        } else if (req_.method() == http::verb::get && target == "/health") {
            res_->result(http::status::ok);
            res_->set(http::field::content_type, "application/json");
            res_->body() = handlers_.health ? handlers_.health() : std::string("{\"status\":\"ok\"}");
        } else {
            res_->result(http::status::not_found);
            res_->set(http::field::content_type, "text/plain");
            res_->body() = "Not found";
        }
        res_->prepare_payload();

        http::async_write(ws_.next_layer(), *res_,
            beast::bind_front_handler(&ClientChannel::on_http_write, shared_from_this()));
    }

    void on_http_write(beast::error_code ec, std::size_t) {
        if (ec && debug_) std::cerr << "[Channel] HTTP write error: " << ec.message() << std::endl;

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
        leave();
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            if (debug_) std::cerr << "[Channel] Accept error: " << ec.message() << std::endl;
            return leave();
        }

        std::weak_ptr<ClientChannel> weak = shared_from_this();
        id_ = handlers_.on_open([weak](std::string message) {
            if (auto self = weak.lock()) {
                self->send(std::move(message));
            }
        });
        opened_ = true;

        if (debug_) std::cout << "[Channel " << id_ << "] WebSocket opened." << std::endl;
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&ClientChannel::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) {
            return leave();
        }
        if (ec) {
            if (debug_) std::cerr << "[Channel " << id_ << "] Read error: " << ec.message() << std::endl;
            return leave();
        }

        auto message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message) handlers_.on_message(id_, message);

        do_read();
    }

    void on_send(std::shared_ptr<const std::string> const& ss) {
        if (left_) return;
        queue_.push_back(ss);
        if (queue_.size() > 1) return;
        do_write();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(net::buffer(*queue_.front()),
            beast::bind_front_handler(&ClientChannel::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            if (debug_) std::cerr << "[Channel " << id_ << "] Write error: " << ec.message() << std::endl;
            queue_.clear();
            return leave();
        }
        queue_.erase(queue_.begin());
        if (!queue_.empty()) {
            do_write();
        }
    }

    // 只执行一次：通知Gateway关闭会话(会同步关闭上游连接)，再从服务器移除
    void leave() {
        if (left_) return;
        left_ = true;

        if (opened_ && handlers_.on_close) handlers_.on_close(id_);
        close();
        on_leave_(shared_from_this());
    }
};

WebSocketServer::WebSocketServer(net::io_context& ioc, tcp::endpoint endpoint, ChannelHandlers handlers, bool debug)
    : ioc_(ioc), acceptor_(ioc), handlers_(std::move(handlers)), debug_(debug) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

    acceptor_.bind(endpoint, ec);
    if (ec) throw std::runtime_error("Failed to bind acceptor: " + ec.message());

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("Failed to listen on acceptor: " + ec.message());
}

void WebSocketServer::run() {
    std::cout << "[Server] Started listening on " << acceptor_.local_endpoint() << std::endl;
    do_accept();
}

void WebSocketServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<ClientChannel>> channels(channels_.begin(), channels_.end());
    for (auto& channel : channels) {
        channel->close();
    }
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&WebSocketServer::on_accept, shared_from_this()));
}

void WebSocketServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;

    if (ec) {
        std::cerr << "[Server] Accept error: " << ec.message() << std::endl;
    } else {
        auto on_leave_cb = [this](std::shared_ptr<ClientChannel> channel) {
            this->leave(channel);
        };
        auto channel = std::make_shared<ClientChannel>(std::move(socket), handlers_, on_leave_cb, debug_);
        join(channel);
        channel->run();
    }
    do_accept();
}

void WebSocketServer::join(std::shared_ptr<ClientChannel> channel) {
    channels_.insert(channel);
    if (debug_) std::cout << "[Server] Client joined. Total clients: " << channels_.size() << std::endl;
}

void WebSocketServer::leave(std::shared_ptr<ClientChannel> channel) {
    channels_.erase(channel);
    if (debug_) std::cout << "[Server] Client left. Total clients: " << channels_.size() << std::endl;
}

} // namespace mudgate
