#ifndef MUDGATE_UPSTREAM_CONNECTION_HPP
#define MUDGATE_UPSTREAM_CONNECTION_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace mudgate {

/**
 * 到MUD服务器的一条文本流连接。
 *
 * 所有操作都不阻塞：dial异步完成，write进入队列后异步发送，read_some只读取当前已到达的数据。
 * 写失败不会立即回调，而是记录下来，在下一次read_some时以错误码返回，
 * 这样所有流错误都在tick里统一处理并只上报一次。
 */
class UpstreamConnection {
public:
    using DialHandler = std::function<void(beast::error_code)>;

    virtual ~UpstreamConnection() = default;

    virtual void dial(const std::string& host, const std::string& port, DialHandler handler) = 0;

    virtual void write(std::string data) = 0;

    /**
     * @brief 非阻塞读取，最多读取max_bytes字节并追加到out。
     * @return 本次读取的字节数；没有数据时返回0且ec为空，连接关闭时ec为net::error::eof。
     */
    virtual std::size_t read_some(std::string& out, std::size_t max_bytes, beast::error_code& ec) = 0;

    virtual void close() = 0;
};

/**
 * 基于beast::tcp_stream的实现，连接阶段带超时。
 */
class TcpUpstream : public UpstreamConnection, public std::enable_shared_from_this<TcpUpstream> {
public:
    TcpUpstream(net::io_context& ioc, std::chrono::seconds dial_timeout, bool debug, std::uint64_t id);

    void dial(const std::string& host, const std::string& port, DialHandler handler) override;
    void write(std::string data) override;
    std::size_t read_some(std::string& out, std::size_t max_bytes, beast::error_code& ec) override;
    void close() override;

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void fail(beast::error_code ec, char const* what);

    std::uint64_t id_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    std::chrono::seconds dial_timeout_;
    DialHandler dial_handler_;
    std::deque<std::string> queue_;
    beast::error_code write_error_;
    bool connected_ = false;
    bool closed_ = false;
    bool debug_;
};

} // namespace mudgate

#endif // MUDGATE_UPSTREAM_CONNECTION_HPP
