// ZPROOF Daemon - Main Entry Point
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// zproofd serves Sapling proof requests over HTTP for a light-client
// backend. It provides:
// - POST /proofs/generate
// - POST /proofs/build-transaction
// - GET /health
// and locates the Groth16 parameter files on demand.

#include <zproof/http/server.h>
#include <zproof/params/locator.h>
#include <zproof/prover/local_backend.h>
#include <zproof/service/front.h>
#include <zproof/util/config.h>
#include <zproof/util/fs.h>
#include <zproof/util/logging.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace zproof {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZPROOF Sapling Proof Service";

// ============================================================================
// Default Configuration Values
// ============================================================================

namespace defaults {
    constexpr const char* BIND = "127.0.0.1";
    constexpr uint16_t PORT = 8080;
    constexpr int MAX_CONNECTIONS = 128;
    constexpr int REQUEST_TIMEOUT = 30;
    constexpr int64_t MAX_BODY_SIZE = 1024 * 1024;
    constexpr const char* LOG_LEVEL = "info";
}

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

static std::unique_ptr<http::HttpServer> g_httpServer;
static std::unique_ptr<service::ServiceFront> g_front;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);  // Ignore broken pipe
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: zproofd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -conf=FILE                 Config file path (default: <datadir>/zproofd.conf)\n";
    std::cout << "  -datadir=DIR               Data directory path (default: ~/.zproofd)\n";
    std::cout << "\nHTTP Options:\n";
    std::cout << "  -bind=ADDR                 Bind address (default: 127.0.0.1)\n";
    std::cout << "  -port=PORT                 Listen port (default: 8080)\n";
    std::cout << "  -threads=N                 Worker threads (default: hardware concurrency)\n";
    std::cout << "  -maxconnections=N          Max queued connections (default: 128)\n";
    std::cout << "  -rpctimeout=SECONDS        Socket receive timeout (default: 30)\n";
    std::cout << "  -maxbodysize=BYTES         Largest accepted request body (default: 1m)\n";
    std::cout << "\nProver Options:\n";
    std::cout << "  -paramsdir=DIR             Search DIR for Sapling parameters first\n";
    std::cout << "  -cacheprover=0/1           Build the prover once and share it (default: 0)\n";
    std::cout << "  -verifyparams=0/1          Check SHA-256 of parameter files (default: 0)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -debug=CATEGORY            Enable category: http, params, prover, service (can list)\n";
    std::cout << "  -printtoconsole=0/1        Print to console (default: 1)\n";
    std::cout << "  -logfile=FILE              Also log to FILE (relative to datadir)\n";
    std::cout << "  -logtimestamps=0/1         Prefix log lines with timestamps (default: 1)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 ZPROOF Developers\n";
    std::cout << "MIT License\n";
}

void RegisterKnownOptions(util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    for (const char* key : {keys::DATADIR, keys::CONF, keys::HELP, keys::VERSION,
                            keys::BIND, keys::PORT, keys::THREADS, keys::MAXCONNECTIONS,
                            keys::RPCTIMEOUT, keys::MAXBODYSIZE, keys::PARAMSDIR,
                            keys::CACHEPROVER, keys::VERIFYPARAMS, keys::LOGLEVEL,
                            keys::DEBUG, keys::PRINTTOCONSOLE, keys::LOGFILE,
                            keys::LOGTIMESTAMPS, "h", "v"}) {
        config.AllowKey(key);
    }
}

// ============================================================================
// Daemon Initialization
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();
    
    util::LogLevel level = util::LogLevelFromString(
        config.GetString(keys::LOGLEVEL, defaults::LOG_LEVEL));
    logger.SetLevel(level);
    logger.SetCategories(config.GetList(keys::DEBUG));
    
    bool timestamps = config.GetBool(keys::LOGTIMESTAMPS, true);
    
    if (config.GetBool(keys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = timestamps;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }
    
    std::string logFile = config.GetPath(keys::LOGFILE);
    if (!logFile.empty()) {
        util::fs::Path dataDir(config.GetDataDir());
        util::fs::Path logPath = util::fs::Path(logFile).IsAbsolute()
                               ? util::fs::Path(logFile) : dataDir / logFile;
        if (!util::fs::CreateDirectories(logPath.Parent())) {
            std::cerr << "Error: Cannot create log directory: " << logPath.Parent().String() << "\n";
            return false;
        }
        
        util::FileSink::Config fileConfig;
        fileConfig.path = logPath.String();
        fileConfig.showTimestamp = timestamps;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (!fileSink->IsOpen()) {
            std::cerr << "Error: Cannot open log file: " << logPath.String() << "\n";
            return false;
        }
        logger.AddSink(fileSink);
    }
    
    return true;
}

params::SearchEnvironment BuildSearchEnvironment(const util::ConfigManager& config) {
    params::SearchEnvironment env = params::SearchEnvironment::FromProcess();
    std::string paramsDir = config.GetPath(util::ConfigKeys::PARAMSDIR);
    if (!paramsDir.empty()) {
        env.extraDirectory = util::fs::AbsolutePath(paramsDir);
    }
    return env;
}

bool StartHttpServer(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    
    int64_t port = config.GetInt(keys::PORT, defaults::PORT);
    if (port < 0 || port > 65535) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid port: " << port;
        return false;
    }
    
    http::HttpServerConfig serverConfig;
    serverConfig.bindAddress = config.GetString(keys::BIND, defaults::BIND);
    serverConfig.port = static_cast<uint16_t>(port);
    serverConfig.threadPoolSize = static_cast<size_t>(config.GetUInt(keys::THREADS, 0));
    serverConfig.maxConnections = static_cast<size_t>(
        config.GetUInt(keys::MAXCONNECTIONS, defaults::MAX_CONNECTIONS));
    serverConfig.requestTimeout = static_cast<int>(
        config.GetInt(keys::RPCTIMEOUT, defaults::REQUEST_TIMEOUT));
    serverConfig.maxRequestSize = static_cast<size_t>(
        config.GetUInt(keys::MAXBODYSIZE, defaults::MAX_BODY_SIZE));
    
    if (serverConfig.maxConnections == 0) {
        LOG_ERROR(util::LogCategory::CONFIG) << "maxconnections must be positive";
        return false;
    }
    
    params::SearchEnvironment env = BuildSearchEnvironment(config);
    
    prover::LocalProverBackend::Options backendOptions;
    backendOptions.verifyChecksums = config.GetBool(keys::VERIFYPARAMS, false);
    auto backend = std::make_shared<prover::LocalProverBackend>(backendOptions);
    
    bool cacheProver = config.GetBool(keys::CACHEPROVER, false);
    LOG_INFO(util::LogCategory::PROVER) << (cacheProver ? "Prover is built once and shared"
                                                        : "Prover is built per request");
    
    g_front = std::make_unique<service::ServiceFront>(
        service::MakeProverProvider(backend, env, cacheProver));
    g_httpServer = std::make_unique<http::HttpServer>(serverConfig);
    g_front->Register(*g_httpServer);
    
    if (!g_httpServer->Start()) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to start HTTP server on "
                                           << serverConfig.bindAddress << ":" << serverConfig.port;
        return false;
    }
    
    LOG_INFO(util::LogCategory::DEFAULT) << "Endpoints: POST " << service::PATH_GENERATE
                                         << ", POST " << service::PATH_BUILD_TRANSACTION
                                         << ", GET " << service::PATH_HEALTH;
    return true;
}

void StopHttpServer() {
    if (g_httpServer) {
        LOG_INFO(util::LogCategory::HTTP) << "Stopping HTTP server...";
        g_httpServer->Stop();
        g_httpServer.reset();
    }
    g_front.reset();
}

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!g_shutdownRequested.load()) {
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
}

void Shutdown() {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";
    StopHttpServer();
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager& config = util::GetConfig();
    RegisterKnownOptions(config);
    
    util::ConfigParseResult parsed = util::InitConfig(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage;
        if (!parsed.errorFile.empty()) {
            std::cerr << " (" << parsed.errorFile << ":" << parsed.errorLine << ")";
        }
        std::cerr << "\nTry 'zproofd --help' for usage.\n";
        return 1;
    }
    
    if (config.GetBool(util::ConfigKeys::HELP, false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool(util::ConfigKeys::VERSION, false) || config.GetBool("v", false)) {
        PrintVersion();
        return 0;
    }
    
    if (!SetupLogging(config)) {
        return 1;
    }
    
    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }
    for (const auto& unknown : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << unknown;
    }
    
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Working directory: " << util::fs::CurrentPath().String();
    
    SetupSignalHandlers();
    
    if (!StartHttpServer(config)) {
        util::Logger::Instance().Shutdown();
        return 1;
    }
    
    // Report parameter availability up front; requests search again anyway
    params::ParameterLocator locator(BuildSearchEnvironment(config));
    if (!config.GetPath(util::ConfigKeys::PARAMSDIR).empty()) {
        LOG_INFO(util::LogCategory::PARAMS) << "Configured parameter directory: "
                                            << locator.GetEnvironment().extraDirectory.String();
    }
    if (!locator.Locate()) {
        LOG_WARN(util::LogCategory::PARAMS) << "Sapling parameters not found yet. "
                                            << "Proof requests will fail until they are installed.";
    }
    
    LOG_INFO(util::LogCategory::DEFAULT) << "zproofd started successfully";
    
    WaitForShutdown();
    Shutdown();
    
    return 0;
}

} // namespace zproof

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return zproof::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
