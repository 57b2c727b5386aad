// ZPROOF - Service Front Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/service/front.h>
#include <zproof/util/logging.h>

namespace zproof {
namespace service {

prover::ProverProvider MakeProverProvider(std::shared_ptr<prover::ProverBackend> backend,
                                          params::SearchEnvironment env,
                                          bool shared) {
    prover::ProverHandle handle(std::move(backend), std::move(env));
    if (shared) {
        auto holder = std::make_shared<prover::SharedProverHandle>(std::move(handle));
        return [holder]() { return holder->Acquire(); };
    }
    return [handle]() { return handle.Acquire(); };
}

// ============================================================================
// ServiceFront
// ============================================================================

ServiceFront::ServiceFront(prover::ProverProvider provider)
    : router_(provider)
    , orchestrator_(provider) {}

void ServiceFront::Register(http::HttpServer& server) const {
    server.Route("POST", PATH_GENERATE, [this](const http::HttpRequest& request) {
        return HandleGenerate(request);
    });
    server.Route("POST", PATH_BUILD_TRANSACTION, [this](const http::HttpRequest& request) {
        return HandleBuildTransaction(request);
    });
    server.Route("GET", PATH_HEALTH, [this](const http::HttpRequest& request) {
        return HandleHealth(request);
    });
}

http::HttpResponse ServiceFront::HandleGenerate(const http::HttpRequest& request) const {
    auto body = http::JSONValue::TryParse(request.body);
    if (!body) {
        return http::HttpResponse::Json(400, ProofResponse::Failure("Invalid JSON body").ToJSON());
    }
    
    RouteResult result = router_.Handle(*body);
    return http::HttpResponse::Json(result.status, result.response.ToJSON());
}

http::HttpResponse ServiceFront::HandleBuildTransaction(const http::HttpRequest& request) const {
    auto body = http::JSONValue::TryParse(request.body);
    if (!body) {
        TransactionBuildResponse response;
        response.error = "Invalid JSON body";
        return http::HttpResponse::Json(400, response.ToJSON());
    }
    
    BuildOutcome outcome = orchestrator_.Run(*body);
    LOG_DEBUG(util::LogCategory::SERVICE) << "Build request ended in "
                                          << BuildStateToString(outcome.finalState)
                                          << " with status " << outcome.status;
    return http::HttpResponse::Json(outcome.status, outcome.response.ToJSON());
}

http::HttpResponse ServiceFront::HandleHealth(const http::HttpRequest&) const {
    return http::HttpResponse::Json(200, http::JSONValue("OK"));
}

} // namespace service
} // namespace zproof
