#pragma once

#include "common.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Http1Session : public std::enable_shared_from_this<Http1Session> {
public:
    explicit Http1Session(tcp::socket socket, RequestCB request_cb);
    void start();
    // Closes the connection once no request is in flight
    void shutdown();

private:
    void read_request();
    void handle_request();
    void send_response(const HttpResponse& response);
    void reject(http::status status, const std::string& body);
    void close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    RequestCB request_cb_;
    std::shared_ptr<http::response<http::string_body>> response_;
    unsigned request_version_ = 11;
    bool keep_alive_ = false;
    bool head_request_ = false;
    bool busy_ = false;
    bool draining_ = false;
};

// Listener half of the HTTP/1.1 front end
class Http1Server {
public:
    Http1Server(net::io_context& io_context, const tcp::endpoint& endpoint, RequestCB request_cb);

    void start();
    // Stops accepting; open sessions finish their current exchange, then close
    void stop();
    tcp::endpoint local_endpoint() const { return endpoint_; }
    std::size_t active_sessions();

private:
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    tcp::endpoint endpoint_;
    RequestCB request_cb_;
    std::mutex sessions_mutex_;
    std::vector<std::weak_ptr<Http1Session>> sessions_;
    std::atomic<bool> stopping_{false};
};

// Beast response carrying a relayed or synthesized HttpResponse.
// Connection-scoped headers are dropped and framing recomputed, except for
// HEAD where the relayed Content-Length is kept as is.
http::response<http::string_body> to_wire_response(const HttpResponse& response,
                                                    unsigned version, bool keep_alive, bool head_request);
