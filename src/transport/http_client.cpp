#include "http_client.hpp"
#include "../utils/logger.h"

#include <openssl/err.h>
#include <sstream>

namespace {

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

}

HttpClient::HttpClient(net::io_context& io_context, std::chrono::steady_clock::duration timeout)
    : io_context_(io_context), ssl_context_(ssl::context::tls_client), timeout_(timeout) {
    ssl_context_.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3
    );
    ssl_context_.set_default_verify_paths();
}

void HttpClient::send_request(OutboundRequest request, ProxyResponseCallback callback) {
    std::make_shared<ClientExchange>(io_context_, ssl_context_, std::move(request),
                                     timeout_, std::move(callback))->start();
}

ClientExchange::ClientExchange(net::io_context& io_context, ssl::context& ssl_context,
                               OutboundRequest request, std::chrono::steady_clock::duration timeout,
                               ProxyResponseCallback callback)
    : strand_(net::make_strand(io_context)),
      resolver_(strand_),
      deadline_(strand_),
      request_(std::move(request)),
      timeout_(timeout),
      callback_(std::move(callback)),
      use_ssl_(request_.use_tls) {
    if (use_ssl_) {
        ssl_socket_ = std::make_unique<ssl::stream<tcp::socket>>(strand_, ssl_context);
    } else {
        plain_socket_ = std::make_unique<tcp::socket>(strand_);
    }
}

tcp::socket& ClientExchange::lowest_layer() {
    return use_ssl_ ? ssl_socket_->next_layer() : *plain_socket_;
}

void ClientExchange::start() {
    prepare_request();

    auto self = shared_from_this();
    net::dispatch(strand_, [this, self]() {
        // Covers resolve, connect, handshake, write and read together
        deadline_.expires_after(timeout_);
        deadline_.async_wait([this, self](const boost::system::error_code& ec) {
            handle_deadline(ec);
        });

        resolver_.async_resolve(request_.host, std::to_string(request_.port),
            [this, self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                handle_resolve(ec, results);
            });
    });
}

void ClientExchange::prepare_request() {
    wire_request_.version(11);
    auto verb = http::string_to_verb(request_.method);
    if (verb == http::verb::unknown) {
        wire_request_.method_string(request_.method);
    } else {
        wire_request_.method(verb);
    }
    wire_request_.target(request_.target);

    for (const auto& [name, value] : request_.headers) {
        wire_request_.insert(name, value);
    }

    if (!request_.body.empty()) {
        wire_request_.body() = request_.body;
    }
    wire_request_.prepare_payload();

    head_request_ = verb == http::verb::head;
    reset_parser();
}

void ClientExchange::reset_parser() {
    parser_.emplace();
    parser_->header_limit(64 * 1024);
    parser_->body_limit(kMaxBodyBytes);
    if (head_request_) {
        parser_->skip(true);
    }
}

void ClientExchange::handle_resolve(const boost::system::error_code& ec,
                                    tcp::resolver::results_type results) {
    if (timed_out_) {
        return;
    }
    if (ec) {
        fail(ec, "Failed to resolve host");
        return;
    }

    auto self = shared_from_this();
    net::async_connect(lowest_layer(), results,
        [this, self](const boost::system::error_code& ec, const tcp::endpoint& endpoint) {
            handle_connect(ec, endpoint);
        });
}

void ClientExchange::handle_connect(const boost::system::error_code& ec, const tcp::endpoint& endpoint) {
    if (timed_out_) {
        return;
    }
    if (ec) {
        fail(ec, "Failed to connect");
        return;
    }
    LOG_DEBUG("Connected to " << endpoint << " for " << request_.host);

    if (!use_ssl_) {
        write_request();
        return;
    }

    if (!is_ip_literal(request_.host) &&
        !SSL_set_tlsext_host_name(ssl_socket_->native_handle(), request_.host.c_str())) {
        boost::system::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        fail(sni_ec, "Failed to set SNI");
        return;
    }
    ssl_socket_->set_verify_mode(ssl::verify_peer);
    ssl_socket_->set_verify_callback(ssl::host_name_verification(request_.host));

    auto self = shared_from_this();
    ssl_socket_->async_handshake(ssl::stream_base::client,
        [this, self](const boost::system::error_code& ec) {
            handle_handshake(ec);
        });
}

void ClientExchange::handle_handshake(const boost::system::error_code& ec) {
    if (timed_out_) {
        return;
    }
    if (ec) {
        fail(ec, "TLS handshake failed");
        return;
    }
    write_request();
}

void ClientExchange::write_request() {
    auto self = shared_from_this();
    auto on_write = [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
        handle_write(ec, bytes_transferred);
    };
    if (use_ssl_) {
        http::async_write(*ssl_socket_, wire_request_, on_write);
    } else {
        http::async_write(*plain_socket_, wire_request_, on_write);
    }
}

void ClientExchange::handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred) {
    if (timed_out_) {
        return;
    }
    if (ec) {
        fail(ec, "Failed to write request");
        return;
    }
    LOG_DEBUG("Sent " << bytes_transferred << " bytes to " << request_.host);
    read_response();
}

void ClientExchange::read_response() {
    auto self = shared_from_this();
    auto on_read = [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
        handle_read(ec, bytes_transferred);
    };
    if (use_ssl_) {
        http::async_read(*ssl_socket_, buffer_, *parser_, on_read);
    } else {
        http::async_read(*plain_socket_, buffer_, *parser_, on_read);
    }
}

void ClientExchange::handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred) {
    if (timed_out_) {
        return;
    }
    if (ec) {
        fail(ec, "Failed to read response");
        return;
    }
    LOG_DEBUG("Received " << bytes_transferred << " bytes from " << request_.host);

    auto& res = parser_->get();
    auto status = res.result_int();
    // Interim 1xx answers precede the real one on the same connection
    if (status >= 100 && status < 200 && status != 101) {
        LOG_DEBUG("Skipping interim " << status << " response from " << request_.host);
        reset_parser();
        read_response();
        return;
    }

    ProxyResponse proxy_response;
    proxy_response.status_code = static_cast<int>(res.result_int());
    for (const auto& header : res) {
        proxy_response.headers.add(std::string(header.name_string()), std::string(header.value()));
    }
    proxy_response.body = std::move(res.body());

    complete({}, proxy_response, "");
}

void ClientExchange::handle_deadline(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !callback_) {
        return;
    }
    timed_out_ = true;
    auto seconds = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count() / 1000.0;
    std::ostringstream message;
    message << "Request timed out after " << seconds << " seconds";
    complete(net::error::timed_out, ProxyResponse{}, message.str());
}

void ClientExchange::fail(const boost::system::error_code& ec, const std::string& step) {
    complete(ec, ProxyResponse{}, step + ": " + ec.message());
}

void ClientExchange::complete(const boost::system::error_code& ec, const ProxyResponse& response,
                              const std::string& error) {
    if (!callback_) {
        return;
    }
    auto callback = std::move(callback_);
    callback_ = nullptr;

    deadline_.cancel();
    resolver_.cancel();
    close_sockets();

    callback(ec, response, error);
}

void ClientExchange::close_sockets() {
    boost::system::error_code ignored;
    lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
    lowest_layer().close(ignored);
}
