// ZPROOF - Service Front
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#ifndef ZPROOF_SERVICE_FRONT_H
#define ZPROOF_SERVICE_FRONT_H

#include <zproof/http/server.h>
#include <zproof/prover/handle.h>
#include <zproof/service/proof_router.h>
#include <zproof/service/tx_builder.h>

#include <memory>

namespace zproof {
namespace service {

/// Route paths
constexpr const char* PATH_GENERATE = "/proofs/generate";
constexpr const char* PATH_BUILD_TRANSACTION = "/proofs/build-transaction";
constexpr const char* PATH_HEALTH = "/health";

/**
 * Provider for request handlers.
 * With `shared` false every call builds a new prover; with `shared` true a
 * SharedProverHandle builds it once and retries after failures.
 */
prover::ProverProvider MakeProverProvider(std::shared_ptr<prover::ProverBackend> backend,
                                          params::SearchEnvironment env,
                                          bool shared);

/// Binds the proof routes and the health check to an HttpServer
class ServiceFront {
public:
    explicit ServiceFront(prover::ProverProvider provider);
    
    void Register(http::HttpServer& server) const;
    
    http::HttpResponse HandleGenerate(const http::HttpRequest& request) const;
    http::HttpResponse HandleBuildTransaction(const http::HttpRequest& request) const;
    http::HttpResponse HandleHealth(const http::HttpRequest& request) const;

private:
    ProofRequestRouter router_;
    TransactionBuildOrchestrator orchestrator_;
};

} // namespace service
} // namespace zproof

#endif // ZPROOF_SERVICE_FRONT_H
