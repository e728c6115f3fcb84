#include "core/config.h"
#include "core/server.h"
#include "proxy/forwarding_engine.hpp"
#include "transport/request_handler.h"
#include "transport/proxy_handler.hpp"
#include "utils/logger.h"
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

namespace {

constexpr auto kDrainPollInterval = std::chrono::milliseconds(100);

void print_banner(const ServerConfig& config) {
    std::string base = "http://" + config.host + ":" + std::to_string(config.port);
    LOG_INFO(kServiceName << " " << kServiceVersion);
    LOG_INFO("Server running at: " << base);
    LOG_INFO("Health check:      " << base << "/health");
    LOG_INFO("Proxy endpoint:    " << base << "/proxy?url=<EXTERNAL_URL>");
    LOG_INFO("Example:           POST " << base << "/proxy?url=https://api.example.com/endpoint");
    if (config.http2_port != 0) {
        LOG_INFO("HTTP/2 port:       " << config.http2_port << (config.use_ssl ? " (TLS)" : " (cleartext)"));
    }
    LOG_INFO("Threads: " << config.threads << ", upstream timeout: " << kRoundTripTimeout.count() << "s");
}

}

int main() {
    try {
        ServerConfig config = ServerConfig::from_env();
        Logger::instance().set_level(config.log_level);

        boost::asio::io_context io_context(config.threads);

        ForwardingEngine engine(io_context);
        ProxyRequestHandler proxy_handler(engine);

        RequestHandler handler;
        handler.register_route("*", "/proxy", [&proxy_handler](const InboundRequest& request, ResponseSender sender) {
            proxy_handler.handle_proxy_request(request, sender);
        });

        Server server(io_context, config, [&handler](const InboundRequest& request, ResponseSender sender) {
            handler.handle_request(request, sender);
        });

        // In-flight round trips get their full budget before the loop is stopped
        boost::asio::steady_timer drain_timer(io_context);
        auto drain_deadline = std::chrono::steady_clock::now();
        std::function<void()> wait_for_drain = [&]() {
            auto open = server.active_connections();
            if (open == 0 || std::chrono::steady_clock::now() >= drain_deadline) {
                if (open != 0) {
                    LOG_WARN("Abandoning " << open << " connection(s) still open after drain period");
                }
                io_context.stop();
                return;
            }
            drain_timer.expires_after(kDrainPollInterval);
            drain_timer.async_wait([&](const boost::system::error_code& ec) {
                if (!ec) {
                    wait_for_drain();
                }
            });
        };

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signum) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal " << signum << ", shutting down gracefully...");
            server.stop();
            drain_deadline = std::chrono::steady_clock::now() + kRoundTripTimeout + std::chrono::seconds(5);
            wait_for_drain();
        });

        server.start();
        print_banner(config);

        // Run with multiple threads
        std::vector<std::thread> thread_pool;
        thread_pool.reserve(config.threads);

        for (int i = 0; i < config.threads - 1; ++i) {
            thread_pool.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        // Run on main thread
        io_context.run();

        // Wait for all threads
        for (auto& t : thread_pool) {
            if (t.joinable()) {
                t.join();
            }
        }

        LOG_INFO("Server closed");

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " << e.what());
        return 1;
    }
    
    return 0;
}
