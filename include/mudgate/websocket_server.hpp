#ifndef MUDGATE_WEBSOCKET_SERVER_HPP
#define MUDGATE_WEBSOCKET_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace mudgate {

class ClientChannel;

/**
 * 浏览器连接的回调集合，由GatewayCore接到Gateway上。
 */
struct ChannelHandlers {
    // 握手完成，参数是向该浏览器发送一帧文本的函数，返回会话id
    std::function<std::uint64_t(std::function<void(std::string)>)> on_open;
    std::function<void(std::uint64_t, const std::string&)> on_message;
    std::function<void(std::uint64_t)> on_close;
    // /health 的JSON响应体
    std::function<std::string()> health;
};

/**
 * 接受浏览器连接，每个连接对应一个ClientChannel。
 *
 * 同一端口上非WebSocket升级的HTTP GET请求会得到一个简单的状态页：
 * "/" 返回HTML，"/health" 返回JSON，其余路径返回404。
 */
class WebSocketServer : public std::enable_shared_from_this<WebSocketServer> {
public:
    WebSocketServer(net::io_context& ioc, tcp::endpoint endpoint, ChannelHandlers handlers, bool debug);

    void run();

    // 关闭所有浏览器连接并停止接受新连接
    void stop();

    std::size_t channel_count() const { return channels_.size(); }

    tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    void join(std::shared_ptr<ClientChannel> channel);
    void leave(std::shared_ptr<ClientChannel> channel);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    ChannelHandlers handlers_;
    bool debug_;

    std::unordered_set<std::shared_ptr<ClientChannel>> channels_;
};

} // namespace mudgate

#endif // MUDGATE_WEBSOCKET_SERVER_HPP
