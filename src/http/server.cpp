// ZPROOF - HTTP Server Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/http/server.h>
#include <zproof/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace zproof {
namespace http {

namespace {

constexpr size_t MAX_HEADER_SIZE = 64 * 1024;
constexpr size_t RECV_CHUNK_SIZE = 16 * 1024;

/// Pause after a failed accept() so EMFILE and friends do not spin the loop
constexpr auto ACCEPT_BACKOFF = std::chrono::milliseconds(100);

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string TrimSpaces(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Offset just past the blank line ending the header block, or npos
size_t FindHeaderEnd(const std::string& raw) {
    size_t crlf = raw.find("\r\n\r\n");
    size_t lf = raw.find("\n\n");
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        return crlf + 4;
    }
    return lf == std::string::npos ? std::string::npos : lf + 2;
}

bool SendAll(int socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

// ============================================================================
// Request / Response Helpers
// ============================================================================

std::string HttpRequest::Header(const std::string& name) const {
    auto it = headers.find(ToLower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpResponse::Json(int status, const JSONValue& value) {
    HttpResponse response;
    response.status = status;
    response.body = value.ToJSON();
    return response;
}

HttpResponse HttpResponse::Error(int status, const std::string& message) {
    JSONValue body;
    body["error"] = message;
    return Json(status, body);
}

const char* StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

bool ParseHTTPRequest(const std::string& raw, HttpRequest& request) {
    size_t headerEnd = FindHeaderEnd(raw);
    if (headerEnd == std::string::npos) {
        return false;
    }
    
    std::istringstream stream(raw.substr(0, headerEnd));
    std::string line;
    
    // Request line: METHOD SP target SP version
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::istringstream requestLine(line);
    std::string target;
    if (!(requestLine >> request.method >> target >> request.version)) {
        return false;
    }
    if (request.version.compare(0, 5, "HTTP/") != 0 || target.empty()) {
        return false;
    }
    
    size_t queryPos = target.find('?');
    request.path = target.substr(0, queryPos);
    request.query = queryPos == std::string::npos ? "" : target.substr(queryPos + 1);
    
    request.headers.clear();
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        request.headers[ToLower(TrimSpaces(line.substr(0, colon)))] =
            TrimSpaces(line.substr(colon + 1));
    }
    
    request.body = raw.substr(headerEnd);
    return true;
}

std::string BuildHTTPResponse(const HttpResponse& response) {
    std::ostringstream ss;
    
    ss << "HTTP/1.1 " << response.status << " " << StatusText(response.status) << "\r\n";
    if (response.status != 204) {
        ss << "Content-Type: " << response.contentType << "\r\n";
    }
    for (const auto& [name, value] : response.headers) {
        ss << name << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << (response.status == 204 ? 0 : response.body.size()) << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    if (response.status != 204) {
        ss << response.body;
    }
    
    return ss.str();
}

// ============================================================================
// HttpServer Implementation
// ============================================================================

HttpServer::HttpServer(const HttpServerConfig& config)
    : config_(config)
    , startTime_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Route(const std::string& method, const std::string& path,
                       HttpHandler handler) {
    std::lock_guard<std::mutex> lock(routesMutex_);
    for (auto& route : routes_) {
        if (route.method == method && route.path == path) {
            route.handler = std::move(handler);
            return;
        }
    }
    routes_.push_back({method, path, std::move(handler)});
}

bool HttpServer::Start() {
    if (running_.load()) {
        return true;
    }
    
    serverSocket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket_ < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to create socket: "
                                           << std::strerror(errno);
        return false;
    }
    
    int opt = 1;
    if (setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_WARN(util::LogCategory::HTTP) << "SO_REUSEADDR failed: " << std::strerror(errno);
    }
    
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    
    if (config_.bindAddress.empty() || config_.bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::HTTP) << "Invalid bind address: "
                                           << config_.bindAddress;
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }
    
    if (bind(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to bind to " << config_.bindAddress
                                           << ":" << config_.port << ": "
                                           << std::strerror(errno);
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }
    
    if (listen(serverSocket_, static_cast<int>(config_.maxConnections)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to listen: " << std::strerror(errno);
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }
    
    struct sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(serverSocket_, reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = config_.port;
    }
    
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config_.threadPoolSize;
    poolConfig.maxQueueSize = config_.maxConnections;
    poolConfig.name = "http";
    threadPool_ = std::make_unique<util::ThreadPool>(poolConfig);
    
    running_.store(true);
    startTime_ = std::chrono::steady_clock::now();
    acceptThread_ = std::thread(&HttpServer::AcceptLoop, this, serverSocket_);
    
    LOG_INFO(util::LogCategory::HTTP) << "HTTP server listening on "
        << config_.bindAddress << ":" << boundPort_
        << " with " << threadPool_->ThreadCount() << " worker threads";
    
    return true;
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    // shutdown() wakes the thread blocked in accept(). The descriptor is
    // closed only after the join so its number cannot be reused under accept().
    if (serverSocket_ >= 0 && shutdown(serverSocket_, SHUT_RDWR) != 0) {
        LOG_DEBUG(util::LogCategory::HTTP) << "shutdown() on listener failed: "
                                           << std::strerror(errno);
    }
    
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    
    if (serverSocket_ >= 0) {
        close(serverSocket_);
        serverSocket_ = -1;
    }
    
    if (threadPool_) {
        threadPool_->Shutdown(util::ThreadPool::StopMode::Drain);
        util::ThreadPool::Stats stats = threadPool_->GetStats();
        LOG_DEBUG(util::LogCategory::HTTP) << "Served " << stats.completed << " connections, rejected "
                                           << stats.rejected;
        threadPool_.reset();
    }
    
    LOG_INFO(util::LogCategory::HTTP) << "HTTP server stopped";
}

int64_t HttpServer::GetUptime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime_).count();
}

void HttpServer::AcceptLoop(int listenSocket) {
    int lastError = 0;
    while (running_.load()) {
        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        
        int clientSocket = accept(listenSocket,
                                  reinterpret_cast<struct sockaddr*>(&clientAddr),
                                  &clientLen);
        if (clientSocket < 0) {
            int error = errno;
            if (error == EINTR || !running_.load()) {
                continue;
            }
            // Repeats of the same failure are only worth a debug line
            if (error != lastError) {
                LOG_WARN(util::LogCategory::HTTP) << "Accept failed: " << std::strerror(error);
                lastError = error;
            } else {
                LOG_DEBUG(util::LogCategory::HTTP) << "Accept failed again: " << std::strerror(error);
            }
            std::this_thread::sleep_for(ACCEPT_BACKOFF);
            continue;
        }
        lastError = 0;
        
        char addrStr[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, addrStr, sizeof(addrStr));
        std::string clientAddress = addrStr;
        
        uint64_t requestId = ++nextRequestId_;
        if (!threadPool_->TrySubmit([this, clientSocket, clientAddress, requestId]() {
                util::ScopedRequestTag tag(requestId);
                HandleConnection(clientSocket, clientAddress);
            })) {
            util::ScopedRequestTag tag(requestId);
            LOG_WARN(util::LogCategory::HTTP) << "Worker queue full, rejecting "
                                              << clientAddress;
            HttpResponse busy = HttpResponse::Error(503, "Server busy");
            ApplyCors(busy);
            SendResponse(clientSocket, busy);
            close(clientSocket);
        }
    }
}

// ============================================================================
// ConnectionGuard
// ============================================================================

ConnectionGuard::ConnectionGuard(int fd, std::atomic<size_t>& active)
    : fd_(fd), active_(active) {
    ++active_;
}

ConnectionGuard::~ConnectionGuard() {
    if (close(fd_) != 0) {
        LOG_DEBUG(util::LogCategory::HTTP) << "close() failed: " << std::strerror(errno);
    }
    --active_;
}

void HttpServer::SendResponse(int clientSocket, const HttpResponse& response) {
    if (!SendAll(clientSocket, BuildHTTPResponse(response))) {
        LOG_DEBUG(util::LogCategory::HTTP) << "Client closed connection before response was sent";
    }
}

void HttpServer::HandleConnection(int clientSocket, std::string clientAddress) {
    ConnectionGuard guard(clientSocket, activeConnections_);
    
    struct timeval tv;
    tv.tv_sec = config_.requestTimeout;
    tv.tv_usec = 0;
    if (setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        LOG_DEBUG(util::LogCategory::HTTP) << "Cannot set receive timeout: " << std::strerror(errno);
    }
    
    std::string buffer;
    std::vector<char> chunk(RECV_CHUNK_SIZE);
    HttpRequest request;
    bool headersParsed = false;
    size_t expectedBody = 0;
    int failStatus = 0;
    std::string failMessage;
    
    while (true) {
        if (headersParsed && request.body.size() >= expectedBody) {
            break;
        }
        
        ssize_t n = recv(clientSocket, chunk.data(), chunk.size(), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (buffer.empty()) {
                return;
            }
            bool timedOut = n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
            failStatus = timedOut ? 408 : 400;
            failMessage = timedOut ? "Request timed out" : "Incomplete request";
            break;
        }
        
        if (headersParsed) {
            request.body.append(chunk.data(), static_cast<size_t>(n));
            continue;
        }
        
        buffer.append(chunk.data(), static_cast<size_t>(n));
        if (FindHeaderEnd(buffer) == std::string::npos) {
            if (buffer.size() > MAX_HEADER_SIZE) {
                failStatus = 431;
                failMessage = "Request headers too large";
                break;
            }
            continue;
        }
        
        if (!ParseHTTPRequest(buffer, request)) {
            failStatus = 400;
            failMessage = "Malformed HTTP request";
            break;
        }
        headersParsed = true;
        
        if (!request.Header("transfer-encoding").empty()) {
            failStatus = 411;
            failMessage = "Chunked requests are not supported, send Content-Length";
            break;
        }
        
        std::string lengthHeader = request.Header("content-length");
        if (!lengthHeader.empty()) {
            if (lengthHeader.find_first_not_of("0123456789") != std::string::npos ||
                lengthHeader.size() > 18) {
                failStatus = 400;
                failMessage = "Invalid Content-Length";
                break;
            }
            expectedBody = static_cast<size_t>(std::stoull(lengthHeader));
        }
        if (expectedBody > config_.maxRequestSize) {
            failStatus = 413;
            failMessage = "Request body exceeds " + std::to_string(config_.maxRequestSize) + " bytes";
            break;
        }
    }
    
    HttpResponse response;
    if (failStatus != 0) {
        ++totalErrors_;
        LOG_DEBUG(util::LogCategory::HTTP) << clientAddress << ": " << failMessage;
        response = HttpResponse::Error(failStatus, failMessage);
        ApplyCors(response);
    } else {
        request.body.resize(expectedBody);
        request.clientAddress = clientAddress;
        response = Dispatch(request);
    }
    
    SendResponse(clientSocket, response);
}

void HttpServer::ApplyCors(HttpResponse& response) const {
    if (!config_.enableCors) {
        return;
    }
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "*";
    response.headers["Access-Control-Max-Age"] = "3600";
}

HttpResponse HttpServer::Dispatch(const HttpRequest& request) const {
    ++totalRequests_;
    
    HttpResponse response;
    HttpHandler handler;
    std::vector<std::string> allowed;
    {
        std::lock_guard<std::mutex> lock(routesMutex_);
        for (const auto& route : routes_) {
            if (route.path != request.path) {
                continue;
            }
            allowed.push_back(route.method);
            if (route.method == request.method) {
                handler = route.handler;
            }
        }
    }
    
    if (request.method == "OPTIONS") {
        response.status = 204;
    } else if (handler) {
        try {
            response = handler(request);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::HTTP) << request.method << " " << request.path
                                               << " failed: " << e.what();
            response = HttpResponse::Error(500, "Internal server error");
        }
    } else if (allowed.empty()) {
        response = HttpResponse::Error(404, "Not found: " + request.path);
    } else {
        std::string allowHeader;
        for (const auto& method : allowed) {
            allowHeader += (allowHeader.empty() ? "" : ", ") + method;
        }
        response = HttpResponse::Error(405, "Method " + request.method +
                                       " not allowed for " + request.path);
        response.headers["Allow"] = allowHeader;
    }
    
    if (response.status >= 400) {
        ++totalErrors_;
    }
    
    LOG_DEBUG(util::LogCategory::HTTP) << request.clientAddress << " " << request.method
                                       << " " << request.path << " -> " << response.status;
    
    ApplyCors(response);
    return response;
}

} // namespace http
} // namespace zproof
