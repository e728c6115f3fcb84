#include "session.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

nghttp2_nv make_nv(const std::string& name, const std::string& value) {
    return {(uint8_t*)name.c_str(), (uint8_t*)value.c_str(), name.size(), value.size(),
            NGHTTP2_NV_FLAG_NONE};
}

std::string lowercase(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}

Session::Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(false) {
    plain_socket_ = std::make_unique<boost::asio::ip::tcp::socket>(std::move(p_socket));
}

Session::Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(true) {
    ssl_socket_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(std::move(p_socket), ssl_context);
}

Session::~Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

boost::asio::any_io_executor Session::executor() {
    return use_ssl_ ? ssl_socket_->get_executor() : plain_socket_->get_executor();
}

void Session::start() {
    LOG_DEBUG("Start nghttp2 session");
    if (use_ssl_) {
        handle_ssl_handshake();
    } else {
        setup_nghttp2();
        write_data();
        read_data();
    }
}

void Session::shutdown() {
    auto self(shared_from_this());
    boost::asio::post(executor(), [this, self]() {
        draining_ = true;
        if (!session_) {
            close_socket();
            return;
        }
        nghttp2_submit_goaway(session_, NGHTTP2_FLAG_NONE,
                              nghttp2_session_get_last_proc_stream_id(session_),
                              NGHTTP2_NO_ERROR, nullptr, 0);
        write_data();
    });
}

void Session::close_socket() {
    boost::system::error_code ec;
    auto& socket = use_ssl_ ? ssl_socket_->next_layer() : *plain_socket_;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

void Session::handle_ssl_handshake() {
    auto self(shared_from_this());
    ssl_socket_->async_handshake(boost::asio::ssl::stream_base::server,
        [this, self](boost::system::error_code ec) {
            if (!ec) {
                if (draining_) {
                    close_socket();
                    return;
                }
                LOG_DEBUG("SSL handshake completed");
                setup_nghttp2();
                write_data();
                read_data();
            } else {
                LOG_ERROR("SSL handshake failed: " << ec.message());
            }
        });
}

void Session::setup_nghttp2() {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);

    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_cb);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_cb);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_cb);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_cb);
    nghttp2_session_callbacks_set_send_callback(callbacks, send_cb);

    nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);

    // Send initial SETTINGS frame
    nghttp2_settings_entry iv[1] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100}
    };
    nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, 1);
}

void Session::read_data() {
    auto self(shared_from_this());
    auto on_read = [this, self](boost::system::error_code ec, std::size_t length) {
        if (ec) {
            if (ec != boost::asio::error::eof) {
                LOG_DEBUG("HTTP/2 read ended: " << ec.message());
            }
            return;
        }
        ssize_t read = nghttp2_session_mem_recv(session_, read_buffer_.data(), length);
        if (read < 0) {
            LOG_ERROR("nghttp2_session_mem_recv error: " << nghttp2_strerror((int)read));
            return;
        }
        write_data();
        read_data();
    };

    if (use_ssl_) {
        ssl_socket_->async_read_some(boost::asio::buffer(read_buffer_), on_read);
    } else {
        plain_socket_->async_read_some(boost::asio::buffer(read_buffer_), on_read);
    }
}

void Session::write_data() {
    int rv = nghttp2_session_send(session_);
    if (rv != 0) {
        LOG_ERROR("nghttp2_session_send failed: " << nghttp2_strerror(rv));
    }
    if (draining_ && streams_data_.empty()) {
        close_socket();
    }
}

void Session::dispatch_request(int32_t p_stream_id) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end()) {
        return;
    }
    auto& stream_data = it->second;
    stream_data.request.stream_id = p_stream_id;

    if (stream_data.body_too_large) {
        LOG_WARN("HTTP/2 request body over " << kMaxBodyBytes << " bytes refused on stream " << p_stream_id);
        send_response(p_stream_id, HttpResponse(413, R"({"error":"Request body too large"})"));
        return;
    }

    LOG_DEBUG("Processing complete request " << stream_data.request.method << " " << stream_data.request.target
              << " (body: " << stream_data.request.body.size() << " bytes)");

    // The sender may fire from another strand; marshal back onto this connection
    auto self(shared_from_this());
    auto sender = [self](int32_t stream_id, const HttpResponse& response) {
        boost::asio::post(self->executor(), [self, stream_id, response]() {
            self->send_response(stream_id, response);
            self->write_data();
        });
    };
    request_cb_(stream_data.request, sender);
}

void Session::send_response(int32_t p_stream_id, const HttpResponse& p_response) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end()) {
        LOG_DEBUG("Stream " << p_stream_id << " closed before its response was ready");
        return;
    }
    auto& stream_data = it->second;
    bool head_request = stream_data.request.method == "HEAD";

    // nghttp2 copies name/value pairs on submit, storage only has to live until then
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back(":status", std::to_string(p_response.status_code));
    for (const auto& [name, value] : p_response.headers) {
        if (is_hop_by_hop_header(name) || iequals(name, "host")) {
            continue;
        }
        if (iequals(name, "content-length") && !head_request) {
            continue;
        }
        fields.emplace_back(lowercase(name), value);
    }
    if (!head_request && !p_response.body.empty()) {
        fields.emplace_back("content-length", std::to_string(p_response.body.size()));
    }

    std::vector<nghttp2_nv> headers;
    headers.reserve(fields.size());
    for (const auto& [name, value] : fields) {
        headers.push_back(make_nv(name, value));
    }

    int rv;
    if (head_request || p_response.body.empty()) {
        rv = nghttp2_submit_response(session_, p_stream_id, headers.data(), headers.size(), nullptr);
    } else {
        stream_data.response_body = p_response.body;
        stream_data.response_offset = 0;

        nghttp2_data_provider data_prd;
        data_prd.source.ptr = nullptr;
        data_prd.read_callback = read_body_cb;
        rv = nghttp2_submit_response(session_, p_stream_id, headers.data(), headers.size(), &data_prd);
    }

    if (rv != 0) {
        LOG_ERROR("nghttp2_submit_response failed on stream " << p_stream_id << ": " << nghttp2_strerror(rv));
        return;
    }
    LOG_DEBUG("Response sent on stream " << p_stream_id << " with status " << p_response.status_code);
}

// Static callbacks
ssize_t Session::read_body_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                              size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                              void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it == sess->streams_data_.end()) {
        return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;
    }
    auto& stream_data = it->second;

    size_t remaining = stream_data.response_body.size() - stream_data.response_offset;
    size_t len = std::min(remaining, length);
    memcpy(buf, stream_data.response_body.data() + stream_data.response_offset, len);
    stream_data.response_offset += len;

    if (stream_data.response_offset == stream_data.response_body.size()) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    }
    return static_cast<ssize_t>(len);
}

int Session::on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                    void* user_data) {
    Session* sess = static_cast<Session*>(user_data);

    switch (frame->hd.type) {
        case NGHTTP2_HEADERS:
            // Request headers, or trailers closing a request that carried a body
            if (frame->headers.cat != NGHTTP2_HCAT_REQUEST && frame->headers.cat != NGHTTP2_HCAT_HEADERS) {
                break;
            }
            [[fallthrough]];
        case NGHTTP2_DATA:
            if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
                sess->dispatch_request(frame->hd.stream_id);
            }
            break;
        default:
            break;
    }
    return 0;
}

int Session::on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                            const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                            uint8_t flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    if(frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
        auto& request = sess->streams_data_[frame->hd.stream_id].request;
        auto header_name = std::string(reinterpret_cast<const char*>(name), namelen);
        auto header_value = std::string(reinterpret_cast<const char*>(value), valuelen);
        if(header_name == ":method")
            request.method = header_value;
        else if(header_name == ":path")
            request.target = header_value;
        else if(header_name == ":authority") {
            if (!request.headers.contains("host"))
                request.headers.add("host", header_value);
        }
        else if(header_name[0] != ':')
            request.headers.add(header_name, header_value);
    }

    return 0;
}

int Session::on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                    int32_t stream_id, const uint8_t* data,
                                    size_t len, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto& stream_data = sess->streams_data_[stream_id];
    if (stream_data.body_too_large) {
        return 0;
    }
    if (stream_data.request.body.size() + len > kMaxBodyBytes) {
        stream_data.body_too_large = true;
        stream_data.request.body.clear();
        return 0;
    }
    stream_data.request.body.append((const char*)data, len);
    LOG_DEBUG("Received " << len << " bytes of data on stream " << stream_id);
    return 0;
}

int Session::on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                uint32_t error_code, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    sess->streams_data_.erase(stream_id);
    LOG_DEBUG("Stream " << stream_id << " closed");
    return 0;
}

ssize_t Session::send_cb(nghttp2_session* session, const uint8_t* data,
                         size_t length, int flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    boost::system::error_code ec;

    size_t written;
    if (sess->use_ssl_) {
        written = boost::asio::write(*sess->ssl_socket_,
                                   boost::asio::buffer(data, length),
                                   ec);
    } else {
        written = boost::asio::write(*sess->plain_socket_,
                                   boost::asio::buffer(data, length),
                                   ec);
    }

    if (ec) {
        LOG_ERROR("Write error: " << ec.message());
        return NGHTTP2_ERR_CALLBACK_FAILURE;
    }

    return written;
}
