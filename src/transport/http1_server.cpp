#include "http1_server.hpp"
#include "../utils/logger.h"

#include <algorithm>

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(60);
constexpr auto kWriteTimeout = std::chrono::seconds(30);

}

http::response<http::string_body> to_wire_response(const HttpResponse& response,
                                                    unsigned version, bool keep_alive, bool head_request) {
    http::response<http::string_body> res;
    res.version(version);
    res.result(static_cast<unsigned>(response.status_code));

    for (const auto& [name, value] : response.headers) {
        if (is_hop_by_hop_header(name)) {
            continue;
        }
        if (iequals(name, "content-length") && !head_request) {
            continue;
        }
        res.insert(name, value);
    }

    if (!head_request) {
        res.body() = response.body;
        res.prepare_payload();
    } else if (res.find(http::field::content_length) == res.end()) {
        res.content_length(response.body.size());
    }
    res.keep_alive(keep_alive);
    return res;
}

Http1Session::Http1Session(tcp::socket socket, RequestCB request_cb)
    : stream_(std::move(socket)), request_cb_(std::move(request_cb)) {}

void Http1Session::start() {
    // Begin on the session's strand
    net::dispatch(stream_.get_executor(),
        beast::bind_front_handler(&Http1Session::read_request, shared_from_this()));
}

void Http1Session::read_request() {
    parser_.emplace();
    parser_->body_limit(kMaxBodyBytes);
    stream_.expires_after(kIdleTimeout);

    http::async_read(stream_, buffer_, *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes_transferred) {
            if (ec == http::error::end_of_stream) {
                self->close();
                return;
            }
            if (ec == http::error::body_limit) {
                LOG_WARN("HTTP/1.1 request body over " << kMaxBodyBytes << " bytes refused");
                self->reject(http::status::payload_too_large, R"({"error":"Request body too large"})");
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                    LOG_ERROR("HTTP/1.1 read error: " << ec.message());
                }
                self->close();
                return;
            }
            LOG_DEBUG("HTTP/1.1 read " << bytes_transferred << " bytes");
            self->handle_request();
        });
}

void Http1Session::handle_request() {
    auto request = parser_->release();
    stream_.expires_never();
    busy_ = true;

    request_version_ = request.version();
    keep_alive_ = request.keep_alive() && !draining_;
    head_request_ = request.method() == http::verb::head;

    InboundRequest inbound;
    inbound.method = std::string(request.method_string());
    inbound.target = std::string(request.target());
    for (const auto& field : request) {
        inbound.headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    inbound.body = std::move(request.body());

    LOG_DEBUG("HTTP/1.1 " << inbound.method << " " << inbound.target);

    // The engine completes on its own strand; hop back to ours before writing
    auto self = shared_from_this();
    request_cb_(inbound, [self](int32_t, const HttpResponse& response) {
        net::post(self->stream_.get_executor(), [self, response]() {
            self->send_response(response);
        });
    });
}

void Http1Session::send_response(const HttpResponse& response) {
    response_ = std::make_shared<http::response<http::string_body>>(
        to_wire_response(response, request_version_, keep_alive_, head_request_));
    stream_.expires_after(kWriteTimeout);

    http::async_write(stream_, *response_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_ERROR("Response write error: " << ec.message());
                self->close();
                return;
            }
            self->busy_ = false;
            if (!self->keep_alive_ || self->draining_) {
                self->close();
                return;
            }
            self->response_.reset();
            self->read_request();
        });
}

void Http1Session::shutdown() {
    net::post(stream_.get_executor(), [self = shared_from_this()]() {
        self->draining_ = true;
        self->keep_alive_ = false;
        if (!self->busy_) {
            self->close();
        }
    });
}

void Http1Session::reject(http::status status, const std::string& body) {
    keep_alive_ = false;
    head_request_ = false;
    busy_ = true;
    HttpResponse response(static_cast<int>(status), body);
    send_response(response);
}

void Http1Session::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
}

Http1Server::Http1Server(net::io_context& io_context, const tcp::endpoint& endpoint, RequestCB request_cb)
    : io_context_(io_context), acceptor_(net::make_strand(io_context), endpoint),
      endpoint_(acceptor_.local_endpoint()), request_cb_(std::move(request_cb)) {}

void Http1Server::start() {
    LOG_INFO("Starting HTTP/1.1 listener on " << acceptor_.local_endpoint());
    accept_connections();
}

void Http1Server::stop() {
    stopping_ = true;
    net::post(acceptor_.get_executor(), [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& weak : sessions_) {
        if (auto session = weak.lock()) {
            session->shutdown();
        }
    }
}

std::size_t Http1Server::active_sessions() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<Http1Session>& weak) { return weak.expired(); }),
                    sessions_.end());
    return sessions_.size();
}

void Http1Server::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (stopping_) {
                beast::error_code ignored;
                socket.close(ignored);
                return;
            }
            if (!ec) {
                LOG_DEBUG("HTTP/1.1 connection accepted");
                auto session = std::make_shared<Http1Session>(std::move(socket), request_cb_);
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_.push_back(session);
                }
                session->start();
            } else {
                LOG_ERROR("HTTP/1.1 accept error: " << ec.message());
            }
            accept_connections();
        });
}
