// ZPROOF - Local Parameter Backend Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/prover/local_backend.h>
#include <zproof/util/logging.h>

namespace zproof {
namespace prover {

const char* ProverSourceToString(ProverSource source) {
    switch (source) {
        case ProverSource::ExplicitPaths: return "explicit paths";
        case ProverSource::DefaultLocation: return "default location";
        default: return "unknown";
    }
}

namespace {

class LocalProver : public Prover {
public:
    LocalProver(params::ParameterSet set, ProverSource source)
        : set_(std::move(set)), source_(source) {}
    
    const params::ParameterSet& GetParameters() const override { return set_; }
    ProverSource GetSource() const override { return source_; }
    std::string Name() const override { return "local"; }

private:
    params::ParameterSet set_;
    ProverSource source_;
};

} // namespace

// ============================================================================
// LocalProverBackend
// ============================================================================

LocalProverBackend::LocalProverBackend()
    : LocalProverBackend(Options{}) {}

LocalProverBackend::LocalProverBackend(Options options)
    : options_(std::move(options)) {}

util::fs::Path LocalProverBackend::DefaultParamsDirectory(const util::fs::Path& home) {
    if (home.Empty()) {
        return util::fs::Path();
    }
#ifdef __APPLE__
    return home / "Library/Application Support/ZcashParams";
#else
    return home / params::USER_PARAMS_DIR;
#endif
}

std::string LocalProverBackend::VerifyFile(const params::ParamLocation& location,
                                           const params::ParamFile& expected) const {
    util::fs::FileStatus status = util::fs::Status(location.path);
    if (!status.IsFile() || !util::fs::IsReadable(location.path)) {
        return "Parameter file not found: " + location.path.String();
    }
    
    if (options_.verifySizes && status.size != expected.size) {
        return std::string(expected.name) + " has size " + std::to_string(status.size) +
               " bytes, expected " + std::to_string(expected.size) +
               " (incomplete download?): " + location.path.String();
    }
    
    if (options_.verifyChecksums) {
        util::ScopedLogTimer timer(util::LogCategory::PROVER,
                                   std::string("SHA-256 of ") + expected.name);
        std::string digest = util::fs::FileChecksum(location.path);
        if (digest.empty()) {
            return "Failed to read " + location.path.String();
        }
        if (digest != expected.sha256) {
            return std::string(expected.name) + " checksum mismatch: got " + digest +
                   ", expected " + expected.sha256;
        }
    }
    
    return "";
}

ConstructResult LocalProverBackend::Build(const params::ParameterSet& set, ProverSource source) {
    std::string error = VerifyFile(set.spend, params::SAPLING_SPEND);
    if (error.empty()) {
        error = VerifyFile(set.output, params::SAPLING_OUTPUT);
    }
    if (!error.empty()) {
        LOG_WARN(util::LogCategory::PROVER) << error;
        return ConstructResult::Error(error);
    }
    
    LOG_DEBUG(util::LogCategory::PROVER) << "Local prover bound to " << set.directory.String()
                                         << " (" << ProverSourceToString(source) << ")";
    return ConstructResult::Success(std::make_shared<LocalProver>(set, source));
}

ConstructResult LocalProverBackend::Construct(const params::ParameterSet& set) {
    return Build(set, ProverSource::ExplicitPaths);
}

ConstructResult LocalProverBackend::FromDefaultLocation() {
    util::fs::Path home = options_.homeDirectory.Empty() ? util::fs::HomeDirectory()
                                                         : options_.homeDirectory;
    util::fs::Path dir = DefaultParamsDirectory(home);
    if (dir.Empty()) {
        return ConstructResult::Error("No home directory to look for default parameters in");
    }
    
    auto set = params::ParameterSet::FromDirectory(dir);
    if (!set) {
        return ConstructResult::Error("Parameters not found in default location " + dir.String());
    }
    return Build(*set, ProverSource::DefaultLocation);
}

} // namespace prover
} // namespace zproof
