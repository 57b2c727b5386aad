// ZPROOF - Prover Handle Tests
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <gtest/gtest.h>
#include <zproof/prover/handle.h>
#include <zproof/prover/local_backend.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace zproof;
using namespace zproof::prover;
using zproof::util::fs::Path;

namespace fs = zproof::util::fs;

namespace {

class FakeProver : public Prover {
public:
    FakeProver(params::ParameterSet set, ProverSource source)
        : set_(std::move(set)), source_(source) {}
    
    const params::ParameterSet& GetParameters() const override { return set_; }
    ProverSource GetSource() const override { return source_; }
    std::string Name() const override { return "fake"; }

private:
    params::ParameterSet set_;
    ProverSource source_;
};

/// Counts calls; succeeds on explicit sets unless told otherwise
class CountingBackend : public ProverBackend {
public:
    ConstructResult Construct(const params::ParameterSet& set) override {
        ++constructCalls;
        if (failConstruct) {
            return ConstructResult::Error("construct refused");
        }
        return ConstructResult::Success(
            std::make_shared<FakeProver>(set, ProverSource::ExplicitPaths));
    }
    
    ConstructResult FromDefaultLocation() override {
        ++defaultCalls;
        if (!defaultAvailable) {
            return ConstructResult::Error("no default parameters");
        }
        return ConstructResult::Success(
            std::make_shared<FakeProver>(params::ParameterSet{}, ProverSource::DefaultLocation));
    }
    
    std::string Name() const override { return "counting"; }
    
    std::atomic<int> constructCalls{0};
    std::atomic<int> defaultCalls{0};
    bool failConstruct{false};
    bool defaultAvailable{false};
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ProverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(root_.IsValid());
        cwd_ = root_.GetPath() / "svc";
        home_ = root_.GetPath() / "home";
        ASSERT_TRUE(fs::CreateDirectories(cwd_));
        ASSERT_TRUE(fs::CreateDirectories(home_));
        
        env_.workingDirectory = cwd_;
        env_.executablePath = cwd_ / "bin/zproofd";
        env_.homeDirectory = home_;
        backend_ = std::make_shared<CountingBackend>();
    }
    
    /// Files with the published sizes (sparse, so cheap)
    static void MakeFullSizeParams(const Path& dir) {
        ASSERT_TRUE(fs::CreateDirectories(dir));
        ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_SPEND.name, ""));
        ASSERT_TRUE(fs::ResizeFile(dir / params::SAPLING_SPEND.name, params::SAPLING_SPEND.size));
        ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_OUTPUT.name, ""));
        ASSERT_TRUE(fs::ResizeFile(dir / params::SAPLING_OUTPUT.name, params::SAPLING_OUTPUT.size));
    }
    
    static void MakeTinyParams(const Path& dir, bool spend = true, bool output = true) {
        ASSERT_TRUE(fs::CreateDirectories(dir));
        if (spend) ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_SPEND.name, "spend"));
        if (output) ASSERT_TRUE(fs::WriteFile(dir / params::SAPLING_OUTPUT.name, "output"));
    }
    
    fs::TempDirectory root_{"zproof_prover_"};
    Path cwd_;
    Path home_;
    params::SearchEnvironment env_;
    std::shared_ptr<CountingBackend> backend_;
};

// ============================================================================
// LocalProverBackend
// ============================================================================

TEST_F(ProverTest, LocalBackendAcceptsPublishedSizes) {
    MakeFullSizeParams(cwd_ / "params");
    auto set = params::ParameterSet::FromDirectory(cwd_ / "params");
    ASSERT_TRUE(set.has_value());
    
    LocalProverBackend backend;
    ConstructResult result = backend.Construct(*set);
    ASSERT_TRUE(result.Ok()) << result.error;
    EXPECT_EQ(result.prover->GetSource(), ProverSource::ExplicitPaths);
    EXPECT_EQ(result.prover->GetParameters().directory, cwd_ / "params");
    EXPECT_EQ(result.prover->GetParameters().spend.size, params::SAPLING_SPEND.size);
}

TEST_F(ProverTest, LocalBackendRejectsTruncatedFile) {
    MakeTinyParams(cwd_ / "params");
    auto set = params::ParameterSet::FromDirectory(cwd_ / "params");
    ASSERT_TRUE(set.has_value());
    
    LocalProverBackend backend;
    ConstructResult result = backend.Construct(*set);
    EXPECT_FALSE(result.Ok());
    EXPECT_NE(result.error.find("expected 47958396"), std::string::npos) << result.error;
}

TEST_F(ProverTest, LocalBackendSizeCheckCanBeDisabled) {
    MakeTinyParams(cwd_ / "params");
    auto set = params::ParameterSet::FromDirectory(cwd_ / "params");
    ASSERT_TRUE(set.has_value());
    
    LocalProverBackend::Options options;
    options.verifySizes = false;
    LocalProverBackend backend(options);
    EXPECT_TRUE(backend.Construct(*set).Ok());
}

TEST_F(ProverTest, LocalBackendChecksumMismatch) {
    MakeTinyParams(cwd_ / "params");
    auto set = params::ParameterSet::FromDirectory(cwd_ / "params");
    ASSERT_TRUE(set.has_value());
    
    LocalProverBackend::Options options;
    options.verifySizes = false;
    options.verifyChecksums = true;
    LocalProverBackend backend(options);
    ConstructResult result = backend.Construct(*set);
    EXPECT_FALSE(result.Ok());
    EXPECT_NE(result.error.find("checksum mismatch"), std::string::npos) << result.error;
}

TEST_F(ProverTest, LocalBackendMissingFile) {
    MakeTinyParams(cwd_ / "params");
    auto set = params::ParameterSet::FromDirectory(cwd_ / "params");
    ASSERT_TRUE(set.has_value());
    ASSERT_TRUE(fs::RemoveFile(set->output.path));
    
    LocalProverBackend backend;
    ConstructResult result = backend.Construct(*set);
    EXPECT_FALSE(result.Ok());
    EXPECT_NE(result.error.find("Parameter file not found"), std::string::npos);
}

#ifndef __APPLE__
TEST_F(ProverTest, LocalBackendDefaultLocation) {
    LocalProverBackend::Options options;
    options.homeDirectory = home_;
    LocalProverBackend backend(options);
    
    EXPECT_FALSE(backend.FromDefaultLocation().Ok());
    
    MakeFullSizeParams(home_ / ".zcash-params");
    ConstructResult result = backend.FromDefaultLocation();
    ASSERT_TRUE(result.Ok()) << result.error;
    EXPECT_EQ(result.prover->GetSource(), ProverSource::DefaultLocation);
}
#endif

TEST_F(ProverTest, DefaultParamsDirectoryNeedsHome) {
    EXPECT_TRUE(LocalProverBackend::DefaultParamsDirectory(Path()).Empty());
    EXPECT_FALSE(LocalProverBackend::DefaultParamsDirectory(home_).Empty());
}

// ============================================================================
// ProverHandle
// ============================================================================

TEST_F(ProverTest, StrategyOrder) {
    ProverHandle handle(backend_, env_);
    ASSERT_EQ(handle.GetStrategies().size(), 2u);
    EXPECT_EQ(handle.GetStrategies()[0], AcquireStrategy::ExplicitSearch);
    EXPECT_EQ(handle.GetStrategies()[1], AcquireStrategy::BackendDefault);
}

TEST_F(ProverTest, ExplicitSearchWins) {
    MakeTinyParams(cwd_ / "params");
    backend_->defaultAvailable = true;
    
    AcquireResult result = ProverHandle(backend_, env_).Acquire();
    ASSERT_TRUE(result.Ok());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.prover->GetSource(), ProverSource::ExplicitPaths);
    EXPECT_EQ(result.prover->GetParameters().directory, cwd_ / "params");
    EXPECT_EQ(backend_->constructCalls.load(), 1);
    EXPECT_EQ(backend_->defaultCalls.load(), 0);
}

TEST_F(ProverTest, FallsBackToBackendDefault) {
    backend_->defaultAvailable = true;
    
    AcquireResult result = ProverHandle(backend_, env_).Acquire();
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.prover->GetSource(), ProverSource::DefaultLocation);
    EXPECT_EQ(backend_->constructCalls.load(), 0);
    EXPECT_EQ(backend_->defaultCalls.load(), 1);
}

TEST_F(ProverTest, FallsBackWhenConstructionFails) {
    MakeTinyParams(cwd_ / "params");
    backend_->failConstruct = true;
    backend_->defaultAvailable = true;
    
    AcquireResult result = ProverHandle(backend_, env_).Acquire();
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(backend_->constructCalls.load(), 1);
    EXPECT_EQ(backend_->defaultCalls.load(), 1);
}

TEST_F(ProverTest, RejectedSetDoesNotHideLaterSet) {
    // Truncated download in the working directory, good set beside the binary
    MakeTinyParams(cwd_ / "params");
    MakeFullSizeParams(root_.GetPath() / "opt/params");
    env_.executablePath = root_.GetPath() / "opt/bin/zproofd";
    
    LocalProverBackend::Options options;
    options.homeDirectory = home_;
    auto backend = std::make_shared<LocalProverBackend>(options);
    
    AcquireResult result = ProverHandle(backend, env_).Acquire();
    ASSERT_TRUE(result.Ok()) << (result.error ? result.error->message : "");
    EXPECT_EQ(result.prover->GetSource(), ProverSource::ExplicitPaths);
    EXPECT_EQ(result.prover->GetParameters().directory, root_.GetPath() / "opt/params");
}

TEST_F(ProverTest, EveryRejectedSetIsReported) {
    MakeTinyParams(cwd_ / "params");
    MakeTinyParams(root_.GetPath() / "params");
    backend_->failConstruct = true;
    
    AcquireResult result = ProverHandle(backend_, env_).Acquire();
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(backend_->constructCalls.load(), 2);
    EXPECT_EQ(backend_->defaultCalls.load(), 1);
    
    const std::string& message = result.error->message;
    EXPECT_NE(message.find((cwd_ / "params").String() + ": construct refused"), std::string::npos)
        << message;
    EXPECT_NE(message.find((root_.GetPath() / "params").String() + ": construct refused"),
              std::string::npos) << message;
}

TEST_F(ProverTest, InitErrorIsActionable) {
    MakeTinyParams(cwd_ / "params", true, false);
    
    AcquireResult result = ProverHandle(backend_, env_).Acquire();
    ASSERT_FALSE(result.Ok());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(backend_->constructCalls.load(), 0);
    
    const std::string& message = result.error->message;
    EXPECT_NE(message.find("Current working directory: " + cwd_.String()), std::string::npos);
    EXPECT_NE(message.find("Executable path: " + (cwd_ / "bin/zproofd").String()), std::string::npos);
    EXPECT_NE(message.find("Checked:"), std::string::npos);
    EXPECT_NE(message.find((home_ / ".zcash-params").String()), std::string::npos);
    EXPECT_NE(message.find("Closest match: " + (cwd_ / "params").String()), std::string::npos);
    EXPECT_NE(message.find("present: sapling-spend.params"), std::string::npos);
    EXPECT_NE(message.find("missing: " + (cwd_ / "params/sapling-output.params").String()),
              std::string::npos);
    EXPECT_NE(message.find("To fix this"), std::string::npos);
    EXPECT_NE(message.find("no default parameters"), std::string::npos);
    
    const params::LocationProbe* best = result.error->report.Best();
    ASSERT_NE(best, nullptr);
    EXPECT_TRUE(best->spend.present);
    EXPECT_FALSE(best->output.present);
}

TEST_F(ProverTest, HandleRebuildsEveryTime) {
    MakeTinyParams(cwd_ / "params");
    ProverHandle handle(backend_, env_);
    
    AcquireResult first = handle.Acquire();
    AcquireResult second = handle.Acquire();
    ASSERT_TRUE(first.Ok());
    ASSERT_TRUE(second.Ok());
    EXPECT_NE(first.prover.get(), second.prover.get());
    EXPECT_EQ(backend_->constructCalls.load(), 2);
}

TEST_F(ProverTest, HandlePicksUpFilesPlacedLater) {
    ProverHandle handle(backend_, env_);
    EXPECT_FALSE(handle.Acquire().Ok());
    
    MakeTinyParams(cwd_ / "params");
    EXPECT_TRUE(handle.Acquire().Ok());
}

// ============================================================================
// SharedProverHandle
// ============================================================================

TEST_F(ProverTest, SharedHandleBuildsOnce) {
    MakeTinyParams(cwd_ / "params");
    SharedProverHandle shared(ProverHandle(backend_, env_));
    EXPECT_FALSE(shared.IsInitialized());
    
    AcquireResult first = shared.Acquire();
    AcquireResult second = shared.Acquire();
    ASSERT_TRUE(first.Ok());
    ASSERT_TRUE(second.Ok());
    EXPECT_EQ(first.prover.get(), second.prover.get());
    EXPECT_TRUE(shared.IsInitialized());
    EXPECT_EQ(backend_->constructCalls.load(), 1);
}

TEST_F(ProverTest, SharedHandleRetriesAfterFailure) {
    SharedProverHandle shared(ProverHandle(backend_, env_));
    
    AcquireResult failed = shared.Acquire();
    EXPECT_FALSE(failed.Ok());
    EXPECT_FALSE(shared.IsInitialized());
    
    MakeTinyParams(cwd_ / "params");
    AcquireResult recovered = shared.Acquire();
    ASSERT_TRUE(recovered.Ok());
    EXPECT_TRUE(shared.IsInitialized());
}

TEST_F(ProverTest, SharedHandleReset) {
    MakeTinyParams(cwd_ / "params");
    SharedProverHandle shared(ProverHandle(backend_, env_));
    ASSERT_TRUE(shared.Acquire().Ok());
    
    shared.Reset();
    EXPECT_FALSE(shared.IsInitialized());
    ASSERT_TRUE(shared.Acquire().Ok());
    EXPECT_EQ(backend_->constructCalls.load(), 2);
}

TEST_F(ProverTest, SharedHandleConcurrentFirstUse) {
    MakeTinyParams(cwd_ / "params");
    SharedProverHandle shared(ProverHandle(backend_, env_));
    
    std::vector<std::thread> threads;
    std::vector<ProverPtr> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&shared, &results, i]() {
            results[i] = shared.Acquire().prover;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    
    EXPECT_EQ(backend_->constructCalls.load(), 1);
    for (const auto& p : results) {
        ASSERT_NE(p, nullptr);
        EXPECT_EQ(p.get(), results[0].get());
    }
}
