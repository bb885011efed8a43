//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/HTTPServer.cpp
// Purpose: HTTP/HTTPS front end using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "sysmon/HTTPServer.hpp"
#include "sysmon/JSONRPCTypes.h"
#include "sysmon/version.h"

#include <openssl/ssl.h>

namespace sysmon {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
    constexpr auto kIoTimeout = std::chrono::seconds(30);
    constexpr const char* kHealthPath = "/health";
    constexpr const char* kDiscoveryPath = "/.well-known/mcp";
    constexpr const char* kChallenge = "Bearer realm=\"sysmon-mcp\"";

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    Response jsonResponse(http::status status, unsigned version, std::string body) {
        Response res{status, version};
        res.set(http::field::server, SERVER_NAME);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    // Non-2xx body: {code, message, details}
    Response errorResponse(http::status status, unsigned version, const std::string& code, const std::string& message) {
        JSONValue::Object o;
        SetMember(o, "code", JSONValue(code));
        SetMember(o, "message", JSONValue(message));
        SetMember(o, "details", JSONValue(JSONValue::Object{}));
        return jsonResponse(status, version, SerializeJSON(JSONValue(std::move(o))));
    }

    Response methodNotAllowed(unsigned version, const char* allow) {
        auto res = errorResponse(http::status::method_not_allowed, version, "method_not_allowed",
                                 std::format("use {}", allow));
        res.set(http::field::allow, allow);
        return res;
    }

    std::optional<std::string> headerValue(const Request& req, http::field field) {
        auto it = req.find(field);
        if (it == req.end()) {
            return std::nullopt;
        }
        return std::string(it->value());
    }

    std::optional<std::string> headerValue(const Request& req, beast::string_view name) {
        auto it = req.find(name);
        if (it == req.end()) {
            return std::nullopt;
        }
        return std::string(it->value());
    }

    std::string targetPath(beast::string_view target) {
        const auto q = target.find('?');
        return std::string(q == beast::string_view::npos ? target : target.substr(0, q));
    }
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    const auth::AccessGate& gate;
    Dispatcher& dispatcher;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when opts.tls
    net::thread_pool workPool;
    std::thread ioThread;
    uint16_t boundPort{0};

    Impl(const HTTPServer::Options& o, const auth::AccessGate& g, Dispatcher& d)
        : opts(o), gate(g), dispatcher(d), workPool(std::max<std::size_t>(1, o.workerThreads)) {
        if (opts.tls) {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        workPool.stop();
        workPool.join();
    }

    void sessionError(const char* kind, const std::exception& e) {
        if (running.load()) {
            LOG_WARN("HTTPServer {} session error: {}", kind, e.what());
        } else {
            LOG_DEBUG("HTTPServer {} session ended during shutdown: {}", kind, e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        boost::system::error_code ec;
        const auto remote = socket.remote_endpoint(ec);
        if (ec) {
            co_return;
        }
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serve(stream, remote.address());
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        boost::system::error_code ec;
        const auto remote = socket.remote_endpoint(ec);
        if (ec) {
            co_return;
        }
        try {
            beast::ssl_stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(kIoTimeout);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls, remote.address());
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const std::exception& e) {
            sessionError("TLS", e);
        }
        co_return;
    }

    //==========================================================================================================
    // serve
    // Purpose: Reads one request (body capped at opts.maxBodyBytes), routes it, writes the response and
    //          logs a one-line summary.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> serve(Stream& stream, const auth::IpAddress& peer) {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);

        boost::system::error_code ec;
        beast::get_lowest_layer(stream).expires_after(kIoTimeout);
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        const auto started = std::chrono::steady_clock::now();

        std::string method = "-";
        std::string path = "-";
        auth::IpAddress client = peer;
        Response res;
        if (ec == http::error::body_limit) {
            if (parser.is_header_done()) {
                method = std::string(parser.get().method_string());
                path = targetPath(parser.get().target());
            }
            res = errorResponse(http::status::payload_too_large, parser.get().version(), "payload_too_large",
                                std::format("request body exceeds {} bytes", opts.maxBodyBytes));
        } else if (ec) {
            LOG_DEBUG("closing connection from {}: {}", peer.to_string(), ec.message());
            co_return;
        } else {
            const Request& req = parser.get();
            method = std::string(req.method_string());
            path = targetPath(req.target());
            res = co_await route(req, path, peer, client);
        }

        beast::get_lowest_layer(stream).expires_after(kIoTimeout);
        co_await http::async_write(stream, res, net::use_awaitable);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        LOG_INFO("{} {} {} {}ms peer={} client={}", method, path, res.result_int(), elapsed.count(), peer.to_string(),
                 client.to_string());
        co_return;
    }

    // client is updated to the gate's effective client address once a /mcp request passes the gate.
    net::awaitable<Response> route(const Request& req, const std::string& path, const auth::IpAddress& peer,
                                   auth::IpAddress& client) {
        const unsigned version = req.version();

        if (path == kHealthPath) {
            if (req.method() != http::verb::get) {
                co_return methodNotAllowed(version, "GET");
            }
            co_return jsonResponse(http::status::ok, version, R"({"status":"ok"})");
        }

        if (path == kDiscoveryPath) {
            if (req.method() != http::verb::get) {
                co_return methodNotAllowed(version, "GET");
            }
            JSONValue::Object doc;
            SetMember(doc, "name", JSONValue(SERVER_NAME));
            SetMember(doc, "version", JSONValue(getVersionString()));
            SetMember(doc, "mcp_endpoint", JSONValue(opts.mcpPath));
            co_return jsonResponse(http::status::ok, version, SerializeJSON(JSONValue(std::move(doc))));
        }

        if (path == opts.mcpPath) {
            if (req.method() != http::verb::post) {
                co_return methodNotAllowed(version, "POST");
            }
            const auto check = gate.Check(peer, headerValue(req, http::field::authorization),
                                          headerValue(req, beast::string_view("X-Forwarded-For")));
            if (!check.ok) {
                auto res = errorResponse(static_cast<http::status>(check.httpStatus), version, check.code, check.message);
                if (check.includeWWWAuthenticate) {
                    res.set(http::field::www_authenticate, kChallenge);
                }
                co_return res;
            }
            client = check.context.clientIp;

            std::optional<std::string> body;
            try {
                // Adapter calls block; run the dispatch on the work pool so the I/O thread stays free.
                body = co_await net::co_spawn(
                    workPool.get_executor(),
                    [this, payload = req.body()]() -> net::awaitable<std::optional<std::string>> {
                        co_return dispatcher.Handle(payload);
                    },
                    net::use_awaitable);
            } catch (const std::exception& e) {
                LOG_ERROR("JSON-RPC dispatch failed: {}", e.what());
                co_return errorResponse(http::status::internal_server_error, version, "internal_error",
                                        "internal server error");
            }
            if (!body.has_value()) {
                Response res{http::status::accepted, version};
                res.set(http::field::server, SERVER_NAME);
                res.keep_alive(false);
                res.prepare_payload();
                co_return res;
            }
            co_return jsonResponse(http::status::ok, version, std::move(*body));
        }

        co_return errorResponse(http::status::not_found, version, "not_found", "no such endpoint");
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.tls) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                LOG_ERROR("HTTPServer accept error: {}", e.what());
            } else {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("HTTPServer accept loop ended during shutdown: {}", e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, const auth::AccessGate& gate, Dispatcher& dispatcher)
    : pImpl(std::make_unique<Impl>(opts, gate, dispatcher)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        tcp::endpoint ep(net::ip::make_address(pImpl->opts.address), pImpl->opts.port);
        pImpl->acceptor = std::make_unique<tcp::acceptor>(pImpl->ioc);
        pImpl->acceptor->open(ep.protocol());
        pImpl->acceptor->set_option(tcp::acceptor::reuse_address(true));
        pImpl->acceptor->bind(ep);
        pImpl->acceptor->listen();
        pImpl->boundPort = pImpl->acceptor->local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer I/O loop terminated: {}", e.what());
        }
    });
    LOG_INFO("listening on {}://{}:{}{}", pImpl->opts.tls ? "https" : "http", pImpl->opts.address,
             pImpl->boundPort, pImpl->opts.mcpPath);
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->workPool.stop();
    pImpl->workPool.join();
    done.set_value();
    return fut;
}

uint16_t HTTPServer::BoundPort() const {
    return pImpl->boundPort;
}

} // namespace sysmon
