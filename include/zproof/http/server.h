// ZPROOF - HTTP Server
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Minimal HTTP/1.1 server for the proof service.
//
// Features:
// - Route table keyed by method and exact path
// - One task per connection on a bounded thread pool
// - Content-Length aware request reading with a body size limit
// - Permissive CORS headers and OPTIONS preflight

#ifndef ZPROOF_HTTP_SERVER_H
#define ZPROOF_HTTP_SERVER_H

#include <zproof/http/json.h>
#include <zproof/util/threadpool.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace zproof {
namespace http {

// ============================================================================
// Request / Response
// ============================================================================

struct HttpRequest {
    std::string method;
    std::string path;                           // Without the query string
    std::string query;
    std::string version{"HTTP/1.1"};
    std::map<std::string, std::string> headers; // Lower-case names
    std::string body;
    std::string clientAddress;
    
    /// Header value or empty string
    std::string Header(const std::string& name) const;
};

struct HttpResponse {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;
    std::map<std::string, std::string> headers;
    
    /// Response with a serialized JSON body
    static HttpResponse Json(int status, const JSONValue& value);
    
    /// {"error": message}
    static HttpResponse Error(int status, const std::string& message);
};

/// Route handler. Exceptions derived from std::exception become a 500.
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Reason phrase for a status code
const char* StatusText(int status);

/**
 * Parse the request line, headers and any bytes after the header block.
 *
 * @return false if the header block is incomplete or malformed
 */
bool ParseHTTPRequest(const std::string& raw, HttpRequest& request);

/// Serialize a response with Content-Length and Connection: close
std::string BuildHTTPResponse(const HttpResponse& response);

// ============================================================================
// Server Configuration
// ============================================================================

struct HttpServerConfig {
    /// IPv4 bind address
    std::string bindAddress{"127.0.0.1"};
    
    /// TCP port, 0 picks an ephemeral port (see HttpServer::GetPort)
    uint16_t port{8080};
    
    /// Worker threads, 0 = hardware concurrency
    size_t threadPoolSize{0};
    
    /// Queued connections before new ones are answered with 503
    size_t maxConnections{128};
    
    /// Socket receive timeout (seconds)
    int requestTimeout{30};
    
    /// Max request body size (bytes)
    size_t maxRequestSize{1024 * 1024};
    
    /// Add Access-Control-* headers to every response
    bool enableCors{true};
};

// ============================================================================
// Connection Guard
// ============================================================================

/// Owns an accepted socket. Counts it as active until scope exit, then closes it.
class ConnectionGuard {
public:
    ConnectionGuard(int fd, std::atomic<size_t>& active);
    ~ConnectionGuard();
    
    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    
    int Fd() const { return fd_; }

private:
    int fd_;
    std::atomic<size_t>& active_;
};

// ============================================================================
// HTTP Server
// ============================================================================

class HttpServer {
public:
    explicit HttpServer(const HttpServerConfig& config = HttpServerConfig{});
    ~HttpServer();
    
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    
    const HttpServerConfig& GetConfig() const { return config_; }
    
    /// Register a handler for an exact method and path
    void Route(const std::string& method, const std::string& path, HttpHandler handler);
    
    /// Bind, listen and start accepting. Returns false on socket errors.
    bool Start();
    
    /// Stop accepting and join the worker threads
    void Stop();
    
    bool IsRunning() const { return running_.load(); }
    
    /// Actual listening port (useful when configured with port 0)
    uint16_t GetPort() const { return boundPort_; }
    
    /**
     * Route a parsed request and apply CORS headers.
     * Never throws: handler failures become 500 responses.
     */
    HttpResponse Dispatch(const HttpRequest& request) const;
    
    uint64_t GetTotalRequests() const { return totalRequests_.load(); }
    uint64_t GetTotalErrors() const { return totalErrors_.load(); }
    size_t GetActiveConnections() const { return activeConnections_.load(); }
    int64_t GetUptime() const;

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        HttpHandler handler;
    };
    
    void AcceptLoop(int listenSocket);
    void HandleConnection(int clientSocket, std::string clientAddress);
    void SendResponse(int clientSocket, const HttpResponse& response);
    void ApplyCors(HttpResponse& response) const;
    
    HttpServerConfig config_;
    std::atomic<bool> running_{false};
    
    std::vector<RouteEntry> routes_;
    mutable std::mutex routesMutex_;
    
    std::thread acceptThread_;
    int serverSocket_{-1};  // Start/Stop only, the accept thread gets a copy
    uint16_t boundPort_{0};
    
    mutable std::atomic<uint64_t> totalRequests_{0};
    mutable std::atomic<uint64_t> totalErrors_{0};
    std::atomic<size_t> activeConnections_{0};
    uint64_t nextRequestId_{0};  // Accept thread only
    std::chrono::steady_clock::time_point startTime_;
    
    std::unique_ptr<util::ThreadPool> threadPool_;
};

} // namespace http
} // namespace zproof

#endif // ZPROOF_HTTP_SERVER_H
