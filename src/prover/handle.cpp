// ZPROOF - Prover Handle Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/prover/handle.h>
#include <zproof/util/logging.h>

#include <sstream>

namespace zproof {
namespace prover {

namespace {

std::string FormatMB(uint64_t bytes) {
    std::ostringstream ss;
    ss << (bytes / (1024 * 1024)) << " MB";
    return ss.str();
}

std::string DescribeFile(const params::FileProbe& probe) {
    std::ostringstream ss;
    if (probe.present) {
        ss << "  present: " << probe.name << " (" << FormatMB(probe.size) << ", "
           << probe.size << " bytes)\n";
    } else {
        ss << "  missing: " << probe.path.String() << "\n";
    }
    return ss.str();
}

} // namespace

const char* AcquireStrategyToString(AcquireStrategy strategy) {
    switch (strategy) {
        case AcquireStrategy::ExplicitSearch: return "explicit search";
        case AcquireStrategy::BackendDefault: return "backend default location";
        default: return "unknown";
    }
}

std::string DescribeLocation(const params::LocationProbe& probe) {
    return DescribeFile(probe.spend) + DescribeFile(probe.output);
}

// ============================================================================
// ProverHandle
// ============================================================================

ProverHandle::ProverHandle(std::shared_ptr<ProverBackend> backend, params::SearchEnvironment env)
    : backend_(std::move(backend))
    , env_(std::move(env))
    , strategies_{AcquireStrategy::ExplicitSearch, AcquireStrategy::BackendDefault} {}

ConstructResult ProverHandle::TryStrategy(AcquireStrategy strategy) const {
    switch (strategy) {
        case AcquireStrategy::ExplicitSearch: {
            params::ParameterLocator locator(env_);
            std::vector<params::ParameterSet> sets = locator.LocateAll();
            if (sets.empty()) {
                return ConstructResult::Error("no complete parameter set in any search location");
            }
            // A set the backend rejects must not hide a usable one further down
            std::string rejected;
            for (const auto& set : sets) {
                LOG_INFO(util::LogCategory::PROVER) << "Using parameter files:";
                LOG_INFO(util::LogCategory::PROVER) << "  " << params::SAPLING_SPEND.name << ": "
                    << FormatMB(set.spend.size) << " at " << set.spend.path.String();
                LOG_INFO(util::LogCategory::PROVER) << "  " << params::SAPLING_OUTPUT.name << ": "
                    << FormatMB(set.output.size) << " at " << set.output.path.String();

                ConstructResult result = backend_->Construct(set);
                if (result.Ok()) {
                    return result;
                }
                LOG_WARN(util::LogCategory::PROVER) << "Rejected parameters in "
                                                    << set.directory.String() << ": " << result.error;
                if (!rejected.empty()) {
                    rejected += "; ";
                }
                rejected += set.directory.String() + ": " + result.error;
            }
            return ConstructResult::Error(rejected);
        }
        case AcquireStrategy::BackendDefault:
            LOG_INFO(util::LogCategory::PROVER) << "No local parameters found, trying "
                                                << backend_->Name() << " default location";
            return backend_->FromDefaultLocation();
    }
    return ConstructResult::Error("unknown strategy");
}

AcquireResult ProverHandle::Acquire() const {
    util::ScopedLogTimer timer(util::LogCategory::PROVER, "Prover acquisition");
    std::vector<std::string> failures;

    for (AcquireStrategy strategy : strategies_) {
        ConstructResult result = TryStrategy(strategy);
        if (result.Ok()) {
            LOG_INFO(util::LogCategory::PROVER) << "Prover initialized via "
                                                << AcquireStrategyToString(strategy);
            return AcquireResult::Success(result.prover);
        }
        failures.push_back(std::string(AcquireStrategyToString(strategy)) + ": " + result.error);
    }

    LOG_WARN(util::LogCategory::PROVER) << "Prover initialization failed after "
                                        << failures.size() << " strategies";
    return AcquireResult::Error(BuildInitError(failures));
}

InitError ProverHandle::BuildInitError(const std::vector<std::string>& failures) const {
    InitError error;
    error.report = params::ParameterLocator(env_).Diagnose();

    std::ostringstream ss;
    ss << "Prover initialization failed. This usually means the Groth16 proving "
       << "parameters are not downloaded.\n\n";

    ss << "Current working directory: "
       << (env_.workingDirectory.Empty() ? "<unknown>" : env_.workingDirectory.String()) << "\n";
    ss << "Executable path: "
       << (env_.executablePath.Empty() ? "<unknown>" : env_.executablePath.String()) << "\n";

    ss << "Checked:\n";
    for (const auto& location : error.report.locations) {
        ss << "  " << location.candidate.path.String() << " ("
           << params::CandidateKindToString(location.candidate.kind) << ")\n";
    }

    if (const params::LocationProbe* best = error.report.Best()) {
        ss << "\nClosest match: " << best->candidate.path.String() << "\n";
        ss << DescribeLocation(*best);
    }

    if (!failures.empty()) {
        ss << "\nAttempts:\n";
        for (const auto& failure : failures) {
            ss << "  " << failure << "\n";
        }
    }

    ss << "\nTo fix this:\n";
    ss << "1. Put " << params::SAPLING_SPEND.name << " and " << params::SAPLING_OUTPUT.name
       << " in a 'params' directory at the project root or next to zproofd"
       << " (or point -paramsdir at them)\n";
    ss << "2. Or download them to ~/" << params::USER_PARAMS_DIR
       << " with the zcash fetch-params script\n";
    ss << "3. Retry the request, parameters are searched again without a restart\n";

    error.message = ss.str();
    return error;
}

// ============================================================================
// SharedProverHandle
// ============================================================================

SharedProverHandle::SharedProverHandle(ProverHandle handle)
    : handle_(std::move(handle)) {}

AcquireResult SharedProverHandle::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (prover_) {
        return AcquireResult::Success(prover_);
    }

    AcquireResult result = handle_.Acquire();
    if (result.Ok()) {
        prover_ = result.prover;
        LOG_INFO(util::LogCategory::PROVER) << "Shared prover cached for subsequent requests";
    }
    return result;
}

void SharedProverHandle::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    prover_.reset();
}

bool SharedProverHandle::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prover_ != nullptr;
}

} // namespace prover
} // namespace zproof
