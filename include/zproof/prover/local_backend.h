// ZPROOF - Local Parameter Backend
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#ifndef ZPROOF_PROVER_LOCAL_BACKEND_H
#define ZPROOF_PROVER_LOCAL_BACKEND_H

#include <zproof/prover/prover.h>

namespace zproof {
namespace prover {

/**
 * Backend that validates the parameter files on local disk.
 *
 * It checks presence, expected sizes and (optionally) SHA-256 digests of
 * sapling-spend.params and sapling-output.params. Groth16 proof creation is
 * not available through it.
 */
class LocalProverBackend : public ProverBackend {
public:
    struct Options {
        /// Reject files whose size differs from the published size
        bool verifySizes{true};
        
        /// Hash both files and compare to the published digests (slow)
        bool verifyChecksums{false};
        
        /// Overrides $HOME for FromDefaultLocation()
        util::fs::Path homeDirectory;
    };
    
    LocalProverBackend();
    explicit LocalProverBackend(Options options);
    
    ConstructResult Construct(const params::ParameterSet& set) override;
    ConstructResult FromDefaultLocation() override;
    std::string Name() const override { return "local"; }
    
    const Options& GetOptions() const { return options_; }
    
    /// Directory the zcash tooling downloads parameters to on this platform
    static util::fs::Path DefaultParamsDirectory(const util::fs::Path& home);

private:
    ConstructResult Build(const params::ParameterSet& set, ProverSource source);
    std::string VerifyFile(const params::ParamLocation& location,
                           const params::ParamFile& expected) const;
    
    Options options_;
};

} // namespace prover
} // namespace zproof

#endif // ZPROOF_PROVER_LOCAL_BACKEND_H
