// ZPROOF - Proof Request Router
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Handles POST /proofs/generate bodies of the form
//   {"type": "spend" | "output", "params": {...}}
// and folds every outcome into a ProofResponse plus an HTTP status.

#ifndef ZPROOF_SERVICE_PROOF_ROUTER_H
#define ZPROOF_SERVICE_PROOF_ROUTER_H

#include <zproof/http/json.h>
#include <zproof/prover/handle.h>
#include <zproof/service/errors.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace service {

enum class ProofKind {
    Spend,
    Output
};

/// "spend" / "output", nullopt for anything else
std::optional<ProofKind> ParseProofKind(const std::string& name);
const char* ProofKindToString(ProofKind kind);

/// Response envelope; proof is empty whenever error is set
struct ProofResponse {
    std::vector<uint8_t> proof;
    std::optional<std::string> error;
    
    http::JSONValue ToJSON() const;
    
    static ProofResponse Failure(std::string message) {
        ProofResponse r;
        r.error = std::move(message);
        return r;
    }
};

struct RouteResult {
    int status{200};
    ProofResponse response;
};

/// Byte vector as a JSON array of numbers
http::JSONValue BytesToJSON(const std::vector<uint8_t>& bytes);

class ProofRequestRouter {
public:
    explicit ProofRequestRouter(prover::ProverProvider provider);
    
    /// Never throws. The proof kind is validated before a prover is acquired.
    RouteResult Handle(const http::JSONValue& body) const;

private:
    std::optional<ServiceError> GenerateSpend(const prover::Prover& prover,
                                              const http::JSONValue& params,
                                              std::vector<uint8_t>& proof) const;
    std::optional<ServiceError> GenerateOutput(const prover::Prover& prover,
                                               const http::JSONValue& params,
                                               std::vector<uint8_t>& proof) const;
    
    prover::ProverProvider provider_;
};

} // namespace service
} // namespace zproof

#endif // ZPROOF_SERVICE_PROOF_ROUTER_H
