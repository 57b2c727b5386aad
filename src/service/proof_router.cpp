// ZPROOF - Proof Request Router Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/service/proof_router.h>
#include <zproof/service/amount.h>
#include <zproof/util/logging.h>

namespace zproof {
namespace service {

std::optional<ProofKind> ParseProofKind(const std::string& name) {
    if (name == "spend") return ProofKind::Spend;
    if (name == "output") return ProofKind::Output;
    return std::nullopt;
}

const char* ProofKindToString(ProofKind kind) {
    switch (kind) {
        case ProofKind::Spend: return "spend";
        case ProofKind::Output: return "output";
        default: return "unknown";
    }
}

http::JSONValue BytesToJSON(const std::vector<uint8_t>& bytes) {
    http::JSONValue::Array array;
    array.reserve(bytes.size());
    for (uint8_t b : bytes) {
        array.emplace_back(static_cast<int>(b));
    }
    return http::JSONValue(std::move(array));
}

http::JSONValue ProofResponse::ToJSON() const {
    http::JSONValue out;
    out["proof"] = error ? BytesToJSON({}) : BytesToJSON(proof);
    out["error"] = error ? http::JSONValue(*error) : http::JSONValue();
    return out;
}

// ============================================================================
// ProofRequestRouter
// ============================================================================

ProofRequestRouter::ProofRequestRouter(prover::ProverProvider provider)
    : provider_(std::move(provider)) {}

RouteResult ProofRequestRouter::Handle(const http::JSONValue& body) const {
    auto fail = [](const ServiceError& e) {
        return RouteResult{e.HttpStatus(), ProofResponse::Failure(e.message)};
    };
    
    if (!body.IsObject()) {
        return fail(ServiceError::Client("Request body must be a JSON object"));
    }
    
    const http::JSONValue& type = body["type"];
    std::optional<ProofKind> kind;
    if (type.IsString()) {
        kind = ParseProofKind(type.GetString());
    }
    if (!kind) {
        std::string shown = type.IsString() ? type.GetString()
                          : type.IsNull() ? std::string("(missing)") : type.ToJSON();
        LOG_DEBUG(util::LogCategory::SERVICE) << "Rejected proof request with type " << shown;
        return fail(ServiceError::Client("Invalid proof type: " + shown));
    }
    
    const http::JSONValue& params = body["params"];
    if (!params.IsObject()) {
        return fail(ServiceError::Client("Missing or invalid params object"));
    }
    
    LOG_INFO(util::LogCategory::SERVICE) << "Received proof request: type="
                                         << ProofKindToString(*kind);
    
    prover::AcquireResult acquired = provider_();
    if (!acquired.Ok()) {
        std::string message = acquired.error ? acquired.error->message
                                             : "Prover initialization failed";
        LOG_WARN(util::LogCategory::SERVICE) << "Prover unavailable for "
                                             << ProofKindToString(*kind) << " proof";
        return fail(ServiceError::Configuration(message));
    }
    
    RouteResult result;
    std::optional<ServiceError> error;
    switch (*kind) {
        case ProofKind::Spend:
            error = GenerateSpend(*acquired.prover, params, result.response.proof);
            break;
        case ProofKind::Output:
            error = GenerateOutput(*acquired.prover, params, result.response.proof);
            break;
    }
    
    if (error) {
        LOG_INFO(util::LogCategory::SERVICE) << ProofKindToString(*kind) << " proof not produced ("
                                             << ErrorCategoryToString(error->category) << ")";
        return fail(*error);
    }
    
    LOG_INFO(util::LogCategory::SERVICE) << "Generated " << ProofKindToString(*kind) << " proof ("
                                         << result.response.proof.size() << " bytes)";
    return result;
}

std::optional<ServiceError> ProofRequestRouter::GenerateSpend(const prover::Prover& prover,
                                                              const http::JSONValue& params,
                                                              std::vector<uint8_t>& proof) const {
    const http::JSONValue& key = params["spendingKey"];
    if (!key.IsString()) {
        return ServiceError::Client("Missing spendingKey parameter");
    }
    std::optional<uint64_t> amount = ParseAmount(params["amount"]);
    if (!amount) {
        return ServiceError::Client("Missing or invalid amount parameter");
    }
    
    // A spend proof needs a witness path and anchor from the note commitment
    // tree. Only a light-client backend that follows the chain has those.
    LOG_DEBUG(util::LogCategory::SERVICE) << "Spend proof with " << prover.Name()
                                          << " prover: no witness source available";
    proof.clear();
    return ServiceError::Structural(
        "Spend proof generation failed: spend proofs require the note commitment tree "
        "witness and anchor for the spent note, which this service does not have.\n"
        "\n"
        "Build the transaction through lightwalletd instead. Its gRPC SendTransaction "
        "path handles witness, anchor and proof generation.\n"
        "\n"
        "Current params: spendingKey (" + std::to_string(key.GetString().size()) +
        " chars), amount=" + std::to_string(*amount));
}

std::optional<ServiceError> ProofRequestRouter::GenerateOutput(const prover::Prover& prover,
                                                               const http::JSONValue& params,
                                                               std::vector<uint8_t>& proof) const {
    const http::JSONValue& address = params["toAddress"];
    if (!address.IsString()) {
        return ServiceError::Client("Missing toAddress parameter");
    }
    std::optional<uint64_t> amount = ParseAmount(params["amount"]);
    if (!amount) {
        return ServiceError::Client("Missing or invalid amount parameter");
    }
    
    LOG_DEBUG(util::LogCategory::SERVICE) << "Output proof with " << prover.Name()
                                          << " prover: no address decoder available";
    proof.clear();
    return ServiceError::Structural(
        "Output proof generation failed: output proofs require payment address decoding "
        "and note construction, which this service does not provide.\n"
        "\n"
        "Build the transaction through lightwalletd instead. Its gRPC SendTransaction "
        "path handles address decoding, note construction and proof generation.\n"
        "\n"
        "Current params: toAddress=" + address.GetString() +
        ", amount=" + std::to_string(*amount));
}

} // namespace service
} // namespace zproof
