//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "sysmon/Dispatcher.h"
#include "sysmon/auth/AccessControl.hpp"

namespace sysmon {

  //==========================================================================================================
  // HTTPServer
  // Purpose: Serves the gateway endpoints:
  //   POST /mcp              JSON-RPC, behind the access gate
  //   GET  /health           {"status":"ok"}, public
  //   GET  /.well-known/mcp  {name, version, mcp_endpoint}, public
  // Anything else answers 404 (unknown path) or 405 (known path, wrong method). Non-2xx bodies are
  // {code, message, details}. Each connection carries a single request.
  //==========================================================================================================
  class HTTPServer {
  public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; 0 picks an ephemeral port (see BoundPort)
    //   mcpPath: JSON-RPC endpoint path
    //   tls: Serve HTTPS (TLS 1.3 only); certFile/keyFile are PEM files
    //   maxBodyBytes: Request body cap; larger bodies get 413
    //   workerThreads: Threads running blocking JSON-RPC work off the I/O thread
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{8080};
        std::string mcpPath{"/mcp"};
        bool tls{false};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{1048576};
        std::size_t workerThreads{4};
    };

    //==========================================================================================================
    // Args:
    //   opts: Listener options.
    //   gate: Access gate applied to the JSON-RPC endpoint; must outlive the server.
    //   dispatcher: JSON-RPC engine; must outlive the server.
    // Throws:
    //   std::exception when the TLS certificate or key cannot be loaded.
    //==========================================================================================================
    HTTPServer(const Options& opts, const auth::AccessGate& gate, Dispatcher& dispatcher);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; it carries the bind error on failure.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context and joins the background threads.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound (valid after Start completed).
    uint16_t BoundPort() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // namespace sysmon
