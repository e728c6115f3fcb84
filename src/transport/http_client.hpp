#pragma once

#include "common.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <memory>
#include <functional>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct OutboundRequest {
    std::string method;
    std::string host;       // name to resolve, also used for SNI
    uint16_t port = 0;
    bool use_tls = false;
    std::string target;     // path plus query
    HeaderMap headers;
    std::string body;
};

struct ProxyResponse {
    int status_code = 0;
    HeaderMap headers;
    std::string body;
};

// ec is net::error::timed_out when the deadline expired, error carries the
// step that failed ("Failed to connect: ...")
using ProxyResponseCallback = std::function<void(const boost::system::error_code& ec,
                                                 const ProxyResponse& response,
                                                 const std::string& error)>;

// One-shot HTTP/1.1 client: a fresh connection per request, closed afterwards.
class HttpClient {
public:
    explicit HttpClient(net::io_context& io_context,
                        std::chrono::steady_clock::duration timeout = std::chrono::seconds(30));
    ~HttpClient() = default;

    void send_request(OutboundRequest request, ProxyResponseCallback callback);

    ssl::context& ssl_context() { return ssl_context_; }
    std::chrono::steady_clock::duration timeout() const { return timeout_; }

private:
    net::io_context& io_context_;
    ssl::context ssl_context_;
    std::chrono::steady_clock::duration timeout_;
};

// State of a single round trip. Every handler runs on the exchange's strand.
class ClientExchange : public std::enable_shared_from_this<ClientExchange> {
public:
    ClientExchange(net::io_context& io_context, ssl::context& ssl_context,
                   OutboundRequest request, std::chrono::steady_clock::duration timeout,
                   ProxyResponseCallback callback);

    void start();

private:
    void prepare_request();
    void handle_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results);
    void handle_connect(const boost::system::error_code& ec, const tcp::endpoint& endpoint);
    void handle_handshake(const boost::system::error_code& ec);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_deadline(const boost::system::error_code& ec);

    void write_request();
    void read_response();
    void reset_parser();
    void fail(const boost::system::error_code& ec, const std::string& step);
    void complete(const boost::system::error_code& ec, const ProxyResponse& response, const std::string& error);
    void close_sockets();

    tcp::socket& lowest_layer();

private:
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    net::steady_timer deadline_;
    std::unique_ptr<tcp::socket> plain_socket_;
    std::unique_ptr<ssl::stream<tcp::socket>> ssl_socket_;

    OutboundRequest request_;
    http::request<http::string_body> wire_request_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::string_body>> parser_;

    std::chrono::steady_clock::duration timeout_;
    ProxyResponseCallback callback_;
    bool timed_out_ = false;
    bool use_ssl_ = false;
    bool head_request_ = false;
};
