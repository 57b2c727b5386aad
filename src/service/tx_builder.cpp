// ZPROOF - Transaction Build Orchestrator Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/service/tx_builder.h>
#include <zproof/service/amount.h>
#include <zproof/service/proof_router.h>
#include <zproof/util/logging.h>

#include <algorithm>
#include <sstream>

namespace zproof {
namespace service {

namespace {

/// Value under camelCase or snake_case name, camelCase preferred
const http::JSONValue& Field(const http::JSONValue& body, const char* camel, const char* snake) {
    if (body.HasKey(camel)) {
        return body[camel];
    }
    return body[snake];
}

std::optional<ServiceError> RequireString(const http::JSONValue& body, const char* camel,
                                          const char* snake, std::string& out) {
    const http::JSONValue& value = Field(body, camel, snake);
    if (!value.IsString()) {
        return ServiceError::Client(std::string("Missing or invalid ") + camel + " field");
    }
    out = value.GetString();
    return std::nullopt;
}

} // namespace

const char* BuildStateToString(BuildState state) {
    switch (state) {
        case BuildState::ReceivedRequest: return "ReceivedRequest";
        case BuildState::ProverAcquired: return "ProverAcquired";
        case BuildState::WitnessGathering: return "WitnessGathering";
        case BuildState::NoteSelection: return "NoteSelection";
        case BuildState::Built: return "Built";
        default: return "Unknown";
    }
}

std::string AddressPreview(const std::string& address, size_t maxBytes) {
    size_t len = std::min(maxBytes, address.size());
    // Back off over continuation bytes so the cut lands on a character start
    while (len > 0 && len < address.size() &&
           (static_cast<unsigned char>(address[len]) & 0xC0) == 0x80) {
        --len;
    }
    return address.substr(0, len);
}

// ============================================================================
// Request / Response
// ============================================================================

std::optional<ServiceError> ParseBuildRequest(const http::JSONValue& body,
                                              TransactionBuildRequest& out) {
    if (!body.IsObject()) {
        return ServiceError::Client("Request body must be a JSON object");
    }
    
    if (auto e = RequireString(body, "spendingKey", "spending_key", out.spendingKey)) return e;
    if (auto e = RequireString(body, "fromAddress", "from_address", out.fromAddress)) return e;
    if (auto e = RequireString(body, "toAddress", "to_address", out.toAddress)) return e;
    
    std::optional<uint64_t> amount = ParseAmount(body["amount"]);
    if (!amount) {
        return ServiceError::Client("Missing or invalid amount field");
    }
    out.amount = *amount;
    
    const http::JSONValue& memo = body["memo"];
    if (!memo.IsArray()) {
        return ServiceError::Client("Missing or invalid memo field, expected an array of bytes");
    }
    if (memo.Size() > MAX_MEMO_SIZE) {
        return ServiceError::Client("Memo is " + std::to_string(memo.Size()) +
                                    " bytes, at most " + std::to_string(MAX_MEMO_SIZE) +
                                    " are allowed");
    }
    out.memo.clear();
    for (const auto& byte : memo.GetArray()) {
        if (!byte.IsInteger() || byte.GetUInt(256) > 255) {
            return ServiceError::Client("Memo entries must be integers between 0 and 255");
        }
        out.memo.push_back(static_cast<uint8_t>(byte.GetUInt()));
    }
    
    const http::JSONValue& endpoint = Field(body, "lightwalletdEndpoint", "lightwalletd_endpoint");
    if (endpoint.IsString()) {
        out.lightwalletdEndpoint = endpoint.GetString();
    } else if (!endpoint.IsNull()) {
        return ServiceError::Client("lightwalletdEndpoint must be a string");
    } else {
        out.lightwalletdEndpoint.reset();
    }
    
    return std::nullopt;
}

http::JSONValue TransactionBuildResponse::ToJSON() const {
    http::JSONValue out;
    out["rawTransaction"] = BytesToJSON(rawTransaction);
    out["txid"] = txid ? http::JSONValue(*txid) : http::JSONValue();
    out["error"] = error ? http::JSONValue(*error) : http::JSONValue();
    return out;
}

// ============================================================================
// TransactionBuildOrchestrator
// ============================================================================

TransactionBuildOrchestrator::TransactionBuildOrchestrator(prover::ProverProvider provider)
    : provider_(std::move(provider)) {}

BuildOutcome TransactionBuildOrchestrator::NotImplemented(BuildState state,
                                                          const TransactionBuildRequest& request) const {
    std::ostringstream ss;
    ss << "Transaction building is not available in this service.\n"
       << "\n"
       << "The remaining steps need chain state from a light-client backend:\n"
       << "1. Fetch compact blocks from lightwalletd\n"
       << "2. Build the note commitment tree and witnesses from those blocks\n"
       << "3. Select spendable notes for the spending key\n"
       << "4. Build and prove the transaction with the Sapling transaction builder\n"
       << "5. Serialize the raw transaction for broadcast\n"
       << "\n"
       << "Current request:\n"
       << "- Spending key: " << request.spendingKey.size() << " chars\n"
       << "- From address: " << AddressPreview(request.fromAddress) << "...\n"
       << "- To address: " << AddressPreview(request.toAddress) << "...\n"
       << "- Amount: " << request.amount << " zatoshi\n"
       << "- Memo: " << request.memo.size() << " bytes\n"
       << "- Lightwalletd endpoint: "
       << (request.lightwalletdEndpoint ? *request.lightwalletdEndpoint : "(none)") << "\n"
       << "\n"
       << "Required capability: a witness-supplying light-client backend "
       << "(lightwalletd gRPC SendTransaction can build the transaction instead).";
    
    ServiceError error = ServiceError::Unimplemented(ss.str());
    BuildOutcome outcome;
    outcome.finalState = state;
    outcome.status = error.HttpStatus();
    outcome.response.error = std::move(error.message);
    return outcome;
}

BuildOutcome TransactionBuildOrchestrator::Run(const http::JSONValue& body) const {
    TransactionBuildRequest request;
    BuildState state = BuildState::ReceivedRequest;
    
    while (true) {
        LOG_TRACE(util::LogCategory::SERVICE) << "Build state " << BuildStateToString(state);
        
        switch (state) {
            case BuildState::ReceivedRequest: {
                if (auto error = ParseBuildRequest(body, request)) {
                    BuildOutcome outcome;
                    outcome.finalState = state;
                    outcome.status = error->HttpStatus();
                    outcome.response.error = error->message;
                    return outcome;
                }
                
                LOG_INFO(util::LogCategory::SERVICE) << "Received transaction building request";
                LOG_INFO(util::LogCategory::SERVICE) << "From: " << AddressPreview(request.fromAddress) << "...";
                LOG_INFO(util::LogCategory::SERVICE) << "To: " << AddressPreview(request.toAddress) << "...";
                LOG_INFO(util::LogCategory::SERVICE) << "Amount: " << request.amount << " zatoshi";
                
                prover::AcquireResult acquired = provider_();
                if (!acquired.Ok()) {
                    ServiceError error = ServiceError::Configuration(
                        "Prover initialization failed: " +
                        (acquired.error ? acquired.error->message : std::string("unknown error")));
                    BuildOutcome outcome;
                    outcome.finalState = state;
                    outcome.status = error.HttpStatus();
                    outcome.response.error = error.message;
                    return outcome;
                }
                state = BuildState::ProverAcquired;
                break;
            }
            
            case BuildState::ProverAcquired:
            case BuildState::WitnessGathering:
            case BuildState::NoteSelection:
            case BuildState::Built:
                return NotImplemented(state, request);
        }
    }
}

} // namespace service
} // namespace zproof
