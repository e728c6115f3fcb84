#pragma once

#include "config.h"
#include "../transport/common.h"
#include "../transport/http1_server.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

class Session;

// Process-wide listeners: HTTP/1.1 always, HTTP/2 when http2_port is set.
class Server {
public:
    Server(boost::asio::io_context& p_io_context, const ServerConfig& p_config, RequestCB p_handler);
    ~Server() = default;

    void start();
    // Stops accepting and lets open connections finish what they already received
    void stop();
    std::size_t active_connections();

    bool is_ssl_enabled() const { return use_ssl_; }
    bool is_http2_enabled() const { return http2_acceptor_ != nullptr; }
    boost::asio::ip::tcp::endpoint http1_endpoint() const { return http1_server_->local_endpoint(); }
    boost::asio::ip::tcp::endpoint http2_endpoint() const { return http2_endpoint_; }
private:
    void accept_connection();
    void setup_ssl_context(const std::string& cert_file, const std::string& key_file);
    boost::asio::ip::tcp::endpoint resolve_bind_address(const std::string& host, uint16_t port);

private:
    boost::asio::io_context& io_context_;
    RequestCB request_handler_;
    std::unique_ptr<Http1Server> http1_server_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> http2_acceptor_;
    boost::asio::ip::tcp::endpoint http2_endpoint_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    bool use_ssl_ = false;
    std::atomic<bool> stopping_{false};
    std::mutex sessions_mutex_;
    std::vector<std::weak_ptr<Session>> http2_sessions_;
};
