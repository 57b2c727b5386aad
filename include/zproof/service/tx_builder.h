// ZPROOF - Transaction Build Orchestrator
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// State machine behind POST /proofs/build-transaction:
//
//   ReceivedRequest -> ProverAcquired -> WitnessGathering -> NoteSelection -> Built
//
// Only the first two states can be reached. ProverAcquired ends the run with
// a structured 501 response naming what a light-client backend must supply.

#ifndef ZPROOF_SERVICE_TX_BUILDER_H
#define ZPROOF_SERVICE_TX_BUILDER_H

#include <zproof/http/json.h>
#include <zproof/prover/handle.h>
#include <zproof/service/errors.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace service {

/// Largest memo a Sapling output can carry
constexpr size_t MAX_MEMO_SIZE = 512;

/// Bytes of an address shown in logs and messages
constexpr size_t ADDRESS_PREVIEW_LENGTH = 20;

enum class BuildState {
    ReceivedRequest,
    ProverAcquired,
    WitnessGathering,
    NoteSelection,
    Built
};

const char* BuildStateToString(BuildState state);

struct TransactionBuildRequest {
    std::string spendingKey;
    std::string fromAddress;
    std::string toAddress;
    uint64_t amount{0};
    std::vector<uint8_t> memo;
    std::optional<std::string> lightwalletdEndpoint;
};

/// Fill `out` from a request body. Accepts camelCase and snake_case names.
std::optional<ServiceError> ParseBuildRequest(const http::JSONValue& body,
                                              TransactionBuildRequest& out);

struct TransactionBuildResponse {
    std::vector<uint8_t> rawTransaction;
    std::optional<std::string> txid;
    std::optional<std::string> error;
    
    http::JSONValue ToJSON() const;
};

struct BuildOutcome {
    int status{200};
    BuildState finalState{BuildState::ReceivedRequest};
    TransactionBuildResponse response;
};

/**
 * First `maxBytes` bytes of an address, shortened further if the cut
 * would split a UTF-8 sequence. Empty input gives an empty preview.
 */
std::string AddressPreview(const std::string& address,
                           size_t maxBytes = ADDRESS_PREVIEW_LENGTH);

class TransactionBuildOrchestrator {
public:
    explicit TransactionBuildOrchestrator(prover::ProverProvider provider);
    
    /// Drive the state machine to a terminal response. Never throws.
    BuildOutcome Run(const http::JSONValue& body) const;

private:
    BuildOutcome NotImplemented(BuildState state, const TransactionBuildRequest& request) const;
    
    prover::ProverProvider provider_;
};

} // namespace service
} // namespace zproof

#endif // ZPROOF_SERVICE_TX_BUILDER_H
