#include "server.h"
#include "../utils/logger.h"
#include "../transport/session.h"

#include <algorithm>
#include <stdexcept>

using boost::asio::ip::tcp;
namespace ssl = boost::asio::ssl;

Server::Server(boost::asio::io_context& p_io_context, const ServerConfig& p_config, RequestCB p_handler)
                : io_context_(p_io_context), request_handler_(std::move(p_handler)),
                  use_ssl_(p_config.use_ssl) {
    http1_server_ = std::make_unique<Http1Server>(
        io_context_, resolve_bind_address(p_config.host, p_config.port), request_handler_);

    if (p_config.http2_port != 0) {
        http2_acceptor_ = std::make_unique<tcp::acceptor>(
            boost::asio::make_strand(io_context_), resolve_bind_address(p_config.host, p_config.http2_port));
        http2_endpoint_ = http2_acceptor_->local_endpoint();
        if (use_ssl_) {
            setup_ssl_context(p_config.cert_file, p_config.key_file);
        }
    }
}

void Server::start() {
    http1_server_->start();
    if (http2_acceptor_) {
        LOG_INFO("Starting HTTP/2 listener on " << http2_acceptor_->local_endpoint()
                 << (use_ssl_ ? " (TLS)" : " (cleartext)"));
        accept_connection();
    }
}

void Server::stop() {
    stopping_ = true;
    http1_server_->stop();
    if (!http2_acceptor_) {
        return;
    }
    boost::asio::post(http2_acceptor_->get_executor(), [this]() {
        boost::system::error_code ec;
        http2_acceptor_->close(ec);
    });

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& weak : http2_sessions_) {
        if (auto session = weak.lock()) {
            session->shutdown();
        }
    }
}

std::size_t Server::active_connections() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    http2_sessions_.erase(std::remove_if(http2_sessions_.begin(), http2_sessions_.end(),
                                         [](const std::weak_ptr<Session>& weak) { return weak.expired(); }),
                          http2_sessions_.end());
    return http1_server_->active_sessions() + http2_sessions_.size();
}

tcp::endpoint Server::resolve_bind_address(const std::string& host, uint16_t port) {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty()) {
        throw std::invalid_argument("Cannot resolve listen address " + host + ": " + ec.message());
    }
    return results.begin()->endpoint();
}

void Server::setup_ssl_context(const std::string& cert_file, const std::string& key_file) {
    ssl_context_ = std::make_unique<ssl::context>(ssl::context::tlsv12);

    ssl_context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::single_dh_use
    );

    ssl_context_->use_certificate_chain_file(cert_file);
    ssl_context_->use_private_key_file(key_file, ssl::context::pem);

    // Set ALPN for HTTP/2
    SSL_CTX_set_alpn_select_cb(ssl_context_->native_handle(),
        [](SSL* ssl, const unsigned char** out, unsigned char* outlen,
           const unsigned char* in, unsigned int inlen, void* arg) -> int {
            const unsigned char h2[] = "\x02h2";
            if (SSL_select_next_proto((unsigned char**)out, outlen, h2, sizeof(h2) - 1, in, inlen) != OPENSSL_NPN_NEGOTIATED) {
                return SSL_TLSEXT_ERR_NOACK;
            }
            return SSL_TLSEXT_ERR_OK;
        }, nullptr);

    LOG_INFO("SSL context configured with certificate: " << cert_file);
}

void Server::accept_connection() {
    http2_acceptor_->async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || !http2_acceptor_->is_open()) {
            return;
        }
        if (stopping_) {
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        }
        if (!ec) {
            LOG_DEBUG("New HTTP/2 connection accepted");
            auto session = use_ssl_
                ? std::make_shared<Session>(std::move(socket), *ssl_context_, request_handler_)
                : std::make_shared<Session>(std::move(socket), request_handler_);
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                http2_sessions_.push_back(session);
            }
            session->start();
        } else {
            LOG_ERROR("Accept error: " << ec.message());
        }
        accept_connection();
    });
}
