#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using OriginRequest = http::request<http::string_body>;
using OriginResponse = http::response<http::string_body>;

// Loopback origin server on its own io_context thread. Records every request
// it reads; answers through the handler unless constructed silent. A non-empty
// interim is written verbatim ahead of each response ("HTTP/1.1 100 Continue\r\n\r\n").
class TestOrigin {
public:
    using Handler = std::function<OriginResponse(const OriginRequest&)>;

    explicit TestOrigin(Handler handler, bool respond = true, std::string interim = "")
        : acceptor_(io_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          handler_(std::move(handler)), respond_(respond), interim_(std::move(interim)) {
        accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~TestOrigin() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::vector<OriginRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    // Echo body and Content-Type back with status 200
    static OriginResponse echo(const OriginRequest& req) {
        OriginResponse res{http::status::ok, req.version()};
        auto content_type = req.find(http::field::content_type);
        if (content_type != req.end()) {
            res.set(http::field::content_type, content_type->value());
        }
        res.body() = req.body();
        res.prepare_payload();
        return res;
    }

private:
    struct Connection {
        explicit Connection(tcp::socket s) : socket(std::move(s)) {}
        tcp::socket socket;
        beast::flat_buffer buffer;
        OriginRequest request;
        OriginResponse response;
    };

    void accept() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            auto conn = std::make_shared<Connection>(std::move(socket));
            read(conn);
            accept();
        });
    }

    void read(std::shared_ptr<Connection> conn) {
        http::async_read(conn->socket, conn->buffer, conn->request,
            [this, conn](beast::error_code ec, std::size_t) {
                if (ec) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(conn->request);
                }
                if (!respond_) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    held_.push_back(conn);
                    return;
                }
                conn->response = handler_(conn->request);
                conn->response.keep_alive(false);
                if (interim_.empty()) {
                    write(conn);
                    return;
                }
                net::async_write(conn->socket, net::buffer(interim_),
                    [this, conn](beast::error_code ec, std::size_t) {
                        if (!ec) {
                            write(conn);
                        }
                    });
            });
    }

    void write(std::shared_ptr<Connection> conn) {
        http::async_write(conn->socket, conn->response,
            [conn](beast::error_code, std::size_t) {
                beast::error_code ignored;
                conn->socket.shutdown(tcp::socket::shutdown_both, ignored);
            });
    }

    net::io_context io_;
    tcp::acceptor acceptor_;
    Handler handler_;
    bool respond_;
    std::string interim_;
    mutable std::mutex mutex_;
    std::vector<OriginRequest> requests_;
    std::vector<std::shared_ptr<Connection>> held_;
    std::thread thread_;
};

// A loopback port with nothing listening on it
inline uint16_t closed_port() {
    net::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

struct SelfSignedCertificate {
    std::string cert_pem;
    std::string key_pem;
};

// Fresh RSA key and a one-hour certificate for host, with a matching DNS subjectAltName
inline SelfSignedCertificate make_self_signed(const std::string& host) {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* key_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    EVP_PKEY_keygen_init(key_ctx);
    EVP_PKEY_CTX_set_rsa_keygen_bits(key_ctx, 2048);
    EVP_PKEY_keygen(key_ctx, &pkey);
    EVP_PKEY_CTX_free(key_ctx);

    X509* x509 = X509_new();
    X509_set_version(x509, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
    X509_gmtime_adj(X509_getm_notBefore(x509), -60);
    X509_gmtime_adj(X509_getm_notAfter(x509), 3600);
    X509_set_pubkey(x509, pkey);

    X509_NAME* name = X509_get_subject_name(x509);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(host.c_str()), -1, -1, 0);
    X509_set_issuer_name(x509, name);

    std::string san = "DNS:" + host;
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, NID_subject_alt_name, &san[0]);
    X509_add_ext(x509, ext, -1);
    X509_EXTENSION_free(ext);
    X509_sign(x509, pkey, EVP_sha256());

    auto to_string = [](BIO* bio) {
        char* data = nullptr;
        long length = BIO_get_mem_data(bio, &data);
        std::string out(data, static_cast<std::size_t>(length));
        BIO_free(bio);
        return out;
    };

    SelfSignedCertificate result;
    BIO* cert_bio = BIO_new(BIO_s_mem());
    PEM_write_bio_X509(cert_bio, x509);
    result.cert_pem = to_string(cert_bio);
    BIO* key_bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(key_bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    result.key_pem = to_string(key_bio);

    X509_free(x509);
    EVP_PKEY_free(pkey);
    return result;
}

// TLS flavour of TestOrigin: one request per connection, answered through the handler.
class TlsTestOrigin {
public:
    using Handler = TestOrigin::Handler;

    TlsTestOrigin(const SelfSignedCertificate& certificate, Handler handler)
        : ssl_context_(ssl::context::tls_server),
          acceptor_(io_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          handler_(std::move(handler)) {
        ssl_context_.use_certificate_chain(net::buffer(certificate.cert_pem));
        ssl_context_.use_private_key(net::buffer(certificate.key_pem), ssl::context::pem);
        accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~TlsTestOrigin() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::size_t handshakes() const { return handshakes_; }

private:
    struct Connection {
        Connection(tcp::socket s, ssl::context& ctx) : stream(std::move(s), ctx) {}
        ssl::stream<tcp::socket> stream;
        beast::flat_buffer buffer;
        OriginRequest request;
        OriginResponse response;
    };

    void accept() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            auto conn = std::make_shared<Connection>(std::move(socket), ssl_context_);
            conn->stream.async_handshake(ssl::stream_base::server, [this, conn](beast::error_code ec) {
                if (ec) {
                    return;
                }
                ++handshakes_;
                serve(conn);
            });
            accept();
        });
    }

    void serve(std::shared_ptr<Connection> conn) {
        http::async_read(conn->stream, conn->buffer, conn->request,
            [this, conn](beast::error_code ec, std::size_t) {
                if (ec) {
                    return;
                }
                conn->response = handler_(conn->request);
                conn->response.keep_alive(false);
                http::async_write(conn->stream, conn->response,
                    [conn](beast::error_code, std::size_t) {
                        beast::error_code ignored;
                        conn->stream.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
                    });
            });
    }

    net::io_context io_;
    ssl::context ssl_context_;
    tcp::acceptor acceptor_;
    Handler handler_;
    std::atomic<std::size_t> handshakes_{0};
    std::thread thread_;
};

}
