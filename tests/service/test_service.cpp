// ZPROOF - Service Layer Tests
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <gtest/gtest.h>
#include <zproof/service/amount.h>
#include <zproof/service/errors.h>
#include <zproof/service/front.h>
#include <zproof/service/proof_router.h>
#include <zproof/service/tx_builder.h>
#include <zproof/prover/local_backend.h>

#include <atomic>
#include <memory>

using namespace zproof;
using namespace zproof::service;
using zproof::http::JSONValue;

namespace fs = zproof::util::fs;

namespace {

class StubProver : public prover::Prover {
public:
    const params::ParameterSet& GetParameters() const override { return set_; }
    prover::ProverSource GetSource() const override { return prover::ProverSource::ExplicitPaths; }
    std::string Name() const override { return "stub"; }

private:
    params::ParameterSet set_;
};

/// Provider that counts calls and fails when `available` is false
struct StubProvider {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
    bool available{true};
    
    prover::ProverProvider Get() const {
        auto counter = calls;
        bool ok = available;
        return [counter, ok]() {
            ++*counter;
            if (!ok) {
                prover::InitError error;
                error.message = "parameter files missing";
                return prover::AcquireResult::Error(error);
            }
            return prover::AcquireResult::Success(std::make_shared<StubProver>());
        };
    }
};

JSONValue Body(const std::string& json) {
    return JSONValue::Parse(json);
}

std::string BuildBody(const std::string& extra = "") {
    return "{\"spendingKey\":\"secret-extended-key\",\"fromAddress\":\"zs1from\","
           "\"toAddress\":\"zs1to\",\"amount\":\"1000\",\"memo\":[1,2,3]" + extra + "}";
}

} // namespace

// ============================================================================
// Amount Parsing
// ============================================================================

TEST(AmountTest, ParsesDecimalStrings) {
    EXPECT_EQ(ParseAmountString("1000"), std::optional<uint64_t>(1000));
    EXPECT_EQ(ParseAmountString("0"), std::optional<uint64_t>(0));
    EXPECT_EQ(ParseAmountString("+5"), std::optional<uint64_t>(5));
    EXPECT_EQ(ParseAmountString("007"), std::optional<uint64_t>(7));
    EXPECT_EQ(ParseAmountString("18446744073709551615"),
              std::optional<uint64_t>(18446744073709551615ULL));
}

TEST(AmountTest, RejectsMalformedStrings) {
    EXPECT_FALSE(ParseAmountString("").has_value());
    EXPECT_FALSE(ParseAmountString("+").has_value());
    EXPECT_FALSE(ParseAmountString("-1").has_value());
    EXPECT_FALSE(ParseAmountString("abc").has_value());
    EXPECT_FALSE(ParseAmountString("1.5").has_value());
    EXPECT_FALSE(ParseAmountString("1e3").has_value());
    EXPECT_FALSE(ParseAmountString(" 1").has_value());
    EXPECT_FALSE(ParseAmountString("1 ").has_value());
    EXPECT_FALSE(ParseAmountString("18446744073709551616").has_value());
}

TEST(AmountTest, ParsesJsonValues) {
    EXPECT_EQ(ParseAmount(JSONValue("42")), std::optional<uint64_t>(42));
    EXPECT_EQ(ParseAmount(Body("[42]").GetArray().front()), std::optional<uint64_t>(42));
    EXPECT_EQ(ParseAmount(Body("[18446744073709551615]").GetArray().front()),
              std::optional<uint64_t>(18446744073709551615ULL));
    
    EXPECT_FALSE(ParseAmount(Body("[-1]").GetArray().front()).has_value());
    EXPECT_FALSE(ParseAmount(Body("[1.5]").GetArray().front()).has_value());
    EXPECT_FALSE(ParseAmount(Body("[18446744073709551616]").GetArray().front()).has_value());
    EXPECT_FALSE(ParseAmount(JSONValue(true)).has_value());
    EXPECT_FALSE(ParseAmount(JSONValue()).has_value());
}

// ============================================================================
// Error Categories
// ============================================================================

TEST(ErrorCategoryTest, StatusMapping) {
    EXPECT_EQ(HttpStatusFor(ErrorCategory::ClientFault), 400);
    EXPECT_EQ(HttpStatusFor(ErrorCategory::NotImplemented), 501);
    EXPECT_EQ(HttpStatusFor(ErrorCategory::ConfigurationFault), 500);
    EXPECT_EQ(HttpStatusFor(ErrorCategory::StructuralLimitation), 500);
    EXPECT_EQ(HttpStatusFor(ErrorCategory::ServerFault), 500);
    
    EXPECT_EQ(ServiceError::Client("x").HttpStatus(), 400);
    EXPECT_EQ(ServiceError::Unimplemented("x").HttpStatus(), 501);
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::ClientFault), "client fault");
}

// ============================================================================
// Proof Request Router
// ============================================================================

TEST(ProofRouterTest, ParseProofKind) {
    EXPECT_EQ(ParseProofKind("spend"), std::optional<ProofKind>(ProofKind::Spend));
    EXPECT_EQ(ParseProofKind("output"), std::optional<ProofKind>(ProofKind::Output));
    EXPECT_FALSE(ParseProofKind("Spend").has_value());
    EXPECT_FALSE(ParseProofKind("").has_value());
}

TEST(ProofRouterTest, SpendNeedsWitness) {
    StubProvider provider;
    ProofRequestRouter router(provider.Get());
    
    RouteResult result = router.Handle(Body(
        "{\"type\":\"spend\",\"params\":{\"spendingKey\":\"abcd\",\"amount\":\"1000\"}}"));
    EXPECT_EQ(result.status, 500);
    ASSERT_TRUE(result.response.error.has_value());
    EXPECT_NE(result.response.error->find("note commitment tree witness"), std::string::npos);
    EXPECT_NE(result.response.error->find("lightwalletd"), std::string::npos);
    EXPECT_NE(result.response.error->find("spendingKey (4 chars), amount=1000"), std::string::npos);
    EXPECT_EQ(result.response.error->find("abcd"), std::string::npos);
    EXPECT_TRUE(result.response.proof.empty());
    EXPECT_EQ(provider.calls->load(), 1);
}

TEST(ProofRouterTest, OutputNeedsAddressDecoding) {
    StubProvider provider;
    ProofRequestRouter router(provider.Get());
    
    RouteResult result = router.Handle(Body(
        "{\"type\":\"output\",\"params\":{\"toAddress\":\"zs1abc\",\"amount\":5}}"));
    EXPECT_EQ(result.status, 500);
    ASSERT_TRUE(result.response.error.has_value());
    EXPECT_NE(result.response.error->find("payment address decoding"), std::string::npos);
}

TEST(ProofRouterTest, UnknownTypeRejectedBeforeAcquisition) {
    StubProvider provider;
    ProofRequestRouter router(provider.Get());
    
    RouteResult result = router.Handle(Body("{\"type\":\"bogus\",\"params\":{}}"));
    EXPECT_EQ(result.status, 400);
    ASSERT_TRUE(result.response.error.has_value());
    EXPECT_EQ(*result.response.error, "Invalid proof type: bogus");
    
    result = router.Handle(Body("{\"params\":{}}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Invalid proof type: (missing)");
    
    result = router.Handle(Body("{\"type\":7,\"params\":{}}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Invalid proof type: 7");
    
    EXPECT_EQ(provider.calls->load(), 0);
}

TEST(ProofRouterTest, MissingFieldsAreClientErrors) {
    StubProvider provider;
    ProofRequestRouter router(provider.Get());
    
    RouteResult result = router.Handle(Body("[1,2]"));
    EXPECT_EQ(result.status, 400);
    
    result = router.Handle(Body("{\"type\":\"spend\"}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Missing or invalid params object");
    
    result = router.Handle(Body("{\"type\":\"spend\",\"params\":{\"amount\":\"1\"}}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Missing spendingKey parameter");
    
    result = router.Handle(Body("{\"type\":\"spend\",\"params\":{\"spendingKey\":\"k\",\"amount\":\"-1\"}}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Missing or invalid amount parameter");
    
    result = router.Handle(Body("{\"type\":\"output\",\"params\":{\"amount\":\"1\"}}"));
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(*result.response.error, "Missing toAddress parameter");
}

TEST(ProofRouterTest, AcquisitionFailureIs500) {
    StubProvider provider;
    provider.available = false;
    ProofRequestRouter router(provider.Get());
    
    RouteResult result = router.Handle(Body(
        "{\"type\":\"spend\",\"params\":{\"spendingKey\":\"k\",\"amount\":\"1\"}}"));
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(*result.response.error, "parameter files missing");
    EXPECT_EQ(provider.calls->load(), 1);
}

TEST(ProofRouterTest, ResponseShape) {
    JSONValue failed = ProofResponse::Failure("nope").ToJSON();
    EXPECT_TRUE(failed["proof"].IsArray());
    EXPECT_EQ(failed["proof"].Size(), 0u);
    EXPECT_EQ(failed["error"].GetString(), "nope");
    
    ProofResponse ok;
    ok.proof = {0, 127, 255};
    JSONValue json = ok.ToJSON();
    ASSERT_EQ(json["proof"].Size(), 3u);
    EXPECT_EQ(json["proof"][2].GetUInt(), 255u);
    EXPECT_TRUE(json["error"].IsNull());
}

// ============================================================================
// Transaction Build Orchestrator
// ============================================================================

TEST(TxBuilderTest, ValidRequestEndsNotImplemented) {
    StubProvider provider;
    TransactionBuildOrchestrator orchestrator(provider.Get());
    
    BuildOutcome outcome = orchestrator.Run(Body(BuildBody()));
    EXPECT_EQ(outcome.status, 501);
    EXPECT_EQ(outcome.finalState, BuildState::ProverAcquired);
    ASSERT_TRUE(outcome.response.error.has_value());
    const std::string& message = *outcome.response.error;
    EXPECT_NE(message.find("Required capability"), std::string::npos);
    EXPECT_NE(message.find("Amount: 1000 zatoshi"), std::string::npos);
    EXPECT_NE(message.find("Memo: 3 bytes"), std::string::npos);
    EXPECT_NE(message.find("Spending key: 19 chars"), std::string::npos);
    EXPECT_EQ(message.find("secret-extended-key"), std::string::npos);
    EXPECT_TRUE(outcome.response.rawTransaction.empty());
    EXPECT_FALSE(outcome.response.txid.has_value());
    EXPECT_EQ(provider.calls->load(), 1);
}

TEST(TxBuilderTest, EmptyAddressesStillReachNotImplemented) {
    StubProvider provider;
    TransactionBuildOrchestrator orchestrator(provider.Get());
    
    BuildOutcome outcome = orchestrator.Run(Body(
        "{\"spendingKey\":\"\",\"fromAddress\":\"\",\"toAddress\":\"\","
        "\"amount\":0,\"memo\":[]}"));
    EXPECT_EQ(outcome.status, 501);
    EXPECT_EQ(outcome.finalState, BuildState::ProverAcquired);
}

TEST(TxBuilderTest, SnakeCaseAliases) {
    TransactionBuildRequest request;
    auto error = ParseBuildRequest(Body(
        "{\"spending_key\":\"k\",\"from_address\":\"a\",\"to_address\":\"b\","
        "\"amount\":7,\"memo\":[],\"lightwalletd_endpoint\":\"https://lwd:9067\"}"), request);
    ASSERT_FALSE(error.has_value()) << error->message;
    EXPECT_EQ(request.spendingKey, "k");
    EXPECT_EQ(request.fromAddress, "a");
    EXPECT_EQ(request.toAddress, "b");
    EXPECT_EQ(request.amount, 7u);
    ASSERT_TRUE(request.lightwalletdEndpoint.has_value());
    EXPECT_EQ(*request.lightwalletdEndpoint, "https://lwd:9067");
}

TEST(TxBuilderTest, MemoValidation) {
    auto bodyWithMemo = [](const std::string& memo) {
        return Body("{\"spendingKey\":\"k\",\"fromAddress\":\"a\",\"toAddress\":\"b\","
                    "\"amount\":1,\"memo\":" + memo + "}");
    };
    TransactionBuildRequest request;
    
    std::string full = "[0";
    for (size_t i = 1; i < MAX_MEMO_SIZE; ++i) {
        full += ",255";
    }
    EXPECT_FALSE(ParseBuildRequest(bodyWithMemo(full + "]"), request).has_value());
    EXPECT_EQ(request.memo.size(), MAX_MEMO_SIZE);
    EXPECT_EQ(request.memo.back(), 255);
    
    auto error = ParseBuildRequest(bodyWithMemo(full + ",0]"), request);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->category, ErrorCategory::ClientFault);
    EXPECT_NE(error->message.find("513 bytes"), std::string::npos);
    
    EXPECT_TRUE(ParseBuildRequest(bodyWithMemo("[256]"), request).has_value());
    EXPECT_TRUE(ParseBuildRequest(bodyWithMemo("[-1]"), request).has_value());
    EXPECT_TRUE(ParseBuildRequest(bodyWithMemo("[1.5]"), request).has_value());
    EXPECT_TRUE(ParseBuildRequest(bodyWithMemo("\"hello\""), request).has_value());
}

TEST(TxBuilderTest, InvalidRequestIs400) {
    StubProvider provider;
    TransactionBuildOrchestrator orchestrator(provider.Get());
    
    BuildOutcome outcome = orchestrator.Run(Body("{\"fromAddress\":\"a\"}"));
    EXPECT_EQ(outcome.status, 400);
    EXPECT_EQ(outcome.finalState, BuildState::ReceivedRequest);
    
    outcome = orchestrator.Run(Body(BuildBody(",\"lightwalletdEndpoint\":5")));
    EXPECT_EQ(outcome.status, 400);
    
    outcome = orchestrator.Run(Body("{\"spendingKey\":\"k\",\"fromAddress\":\"a\","
                                    "\"toAddress\":\"b\",\"amount\":\"x\",\"memo\":[]}"));
    EXPECT_EQ(outcome.status, 400);
    EXPECT_EQ(provider.calls->load(), 0);
}

TEST(TxBuilderTest, ProverFailureIs500) {
    StubProvider provider;
    provider.available = false;
    TransactionBuildOrchestrator orchestrator(provider.Get());
    
    BuildOutcome outcome = orchestrator.Run(Body(BuildBody()));
    EXPECT_EQ(outcome.status, 500);
    EXPECT_EQ(outcome.finalState, BuildState::ReceivedRequest);
    ASSERT_TRUE(outcome.response.error.has_value());
    EXPECT_EQ(outcome.response.error->rfind("Prover initialization failed: ", 0), 0u);
    EXPECT_NE(outcome.response.error->find("parameter files missing"), std::string::npos);
}

TEST(TxBuilderTest, AddressPreview) {
    EXPECT_EQ(AddressPreview(""), "");
    EXPECT_EQ(AddressPreview("zs1short"), "zs1short");
    EXPECT_EQ(AddressPreview("zs1qqqqqqqqqqqqqqqqqqqqqqqqqqqq"), "zs1qqqqqqqqqqqqqqqqq");
    
    // 19 ASCII bytes then a 3-byte character straddling the cut
    std::string address = std::string(19, 'a') + "\xE2\x82\xAC" + "tail";
    EXPECT_EQ(AddressPreview(address), std::string(19, 'a'));
    EXPECT_EQ(AddressPreview(address, 22), address.substr(0, 22));
}

TEST(TxBuilderTest, ResponseShape) {
    TransactionBuildResponse response;
    response.error = "failed";
    JSONValue json = response.ToJSON();
    EXPECT_TRUE(json["rawTransaction"].IsArray());
    EXPECT_EQ(json["rawTransaction"].Size(), 0u);
    EXPECT_TRUE(json["txid"].IsNull());
    EXPECT_EQ(json["error"].GetString(), "failed");
}

// ============================================================================
// Service Front
// ============================================================================

class ServiceFrontTest : public ::testing::Test {
protected:
    void SetUp() override {
        front_ = std::make_unique<ServiceFront>(provider_.Get());
        front_->Register(server_);
    }
    
    http::HttpResponse Post(const std::string& path, const std::string& body) {
        http::HttpRequest request;
        request.method = "POST";
        request.path = path;
        request.body = body;
        return server_.Dispatch(request);
    }
    
    StubProvider provider_;
    http::HttpServer server_;
    std::unique_ptr<ServiceFront> front_;
};

TEST_F(ServiceFrontTest, Health) {
    http::HttpRequest request;
    request.method = "GET";
    request.path = PATH_HEALTH;
    http::HttpResponse response = server_.Dispatch(request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "\"OK\"");
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");
}

TEST_F(ServiceFrontTest, InvalidJsonBody) {
    http::HttpResponse response = Post(PATH_GENERATE, "{not json");
    EXPECT_EQ(response.status, 400);
    JSONValue body = JSONValue::Parse(response.body);
    EXPECT_EQ(body["error"].GetString(), "Invalid JSON body");
    EXPECT_EQ(body["proof"].Size(), 0u);
    
    response = Post(PATH_BUILD_TRANSACTION, "");
    EXPECT_EQ(response.status, 400);
    body = JSONValue::Parse(response.body);
    EXPECT_EQ(body["error"].GetString(), "Invalid JSON body");
    EXPECT_TRUE(body["txid"].IsNull());
    EXPECT_EQ(provider_.calls->load(), 0);
}

TEST_F(ServiceFrontTest, EndToEndStatuses) {
    EXPECT_EQ(Post(PATH_GENERATE, "{\"type\":\"bogus\",\"params\":{}}").status, 400);
    EXPECT_EQ(Post(PATH_GENERATE, "{\"type\":\"spend\",\"params\":"
                                  "{\"spendingKey\":\"k\",\"amount\":\"1\"}}").status, 500);
    EXPECT_EQ(Post(PATH_BUILD_TRANSACTION, BuildBody()).status, 501);
}

TEST(ProverProviderTest, PerRequestAndShared) {
    fs::TempDirectory root("zproof_service_");
    ASSERT_TRUE(root.IsValid());
    fs::Path dir = root.GetPath() / "params";
    ASSERT_TRUE(fs::CreateDirectories(dir));
    ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_SPEND.name, "spend"));
    ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_OUTPUT.name, "output"));
    
    params::SearchEnvironment env;
    env.workingDirectory = root.GetPath();
    prover::LocalProverBackend::Options options;
    options.verifySizes = false;
    auto backend = std::make_shared<prover::LocalProverBackend>(options);
    
    prover::ProverProvider perRequest = MakeProverProvider(backend, env, false);
    prover::AcquireResult a = perRequest();
    prover::AcquireResult b = perRequest();
    ASSERT_TRUE(a.Ok());
    ASSERT_TRUE(b.Ok());
    EXPECT_NE(a.prover.get(), b.prover.get());
    
    prover::ProverProvider shared = MakeProverProvider(backend, env, true);
    prover::AcquireResult c = shared();
    prover::AcquireResult d = shared();
    ASSERT_TRUE(c.Ok());
    EXPECT_EQ(c.prover.get(), d.prover.get());
}
