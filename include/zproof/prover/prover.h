// ZPROOF - Prover Interfaces
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// The proving library is an external collaborator. The service only needs
// to bind it to a parameter set; everything else about it is opaque.

#ifndef ZPROOF_PROVER_PROVER_H
#define ZPROOF_PROVER_PROVER_H

#include <zproof/params/locator.h>

#include <memory>
#include <string>

namespace zproof {
namespace prover {

/// How a prover's parameters were resolved
enum class ProverSource {
    ExplicitPaths,     ///< Parameter set found by ParameterLocator
    DefaultLocation    ///< Backend's own default lookup
};

const char* ProverSourceToString(ProverSource source);

// ============================================================================
// Prover
// ============================================================================

/**
 * A constructed proving backend bound to one parameter set.
 * Read-only after construction, so one instance may serve concurrent requests.
 */
class Prover {
public:
    virtual ~Prover() = default;
    
    virtual const params::ParameterSet& GetParameters() const = 0;
    virtual ProverSource GetSource() const = 0;
    
    /// Backend name for logs
    virtual std::string Name() const = 0;
};

using ProverPtr = std::shared_ptr<const Prover>;

// ============================================================================
// Prover Backend
// ============================================================================

/// Outcome of a backend construction attempt
struct ConstructResult {
    ProverPtr prover;
    std::string error;
    
    bool Ok() const { return prover != nullptr; }
    
    static ConstructResult Success(ProverPtr p) {
        return {std::move(p), ""};
    }
    static ConstructResult Error(const std::string& msg) {
        return {nullptr, msg};
    }
};

/// Factory for provers. Implementations must not throw.
class ProverBackend {
public:
    virtual ~ProverBackend() = default;
    
    /// Bind to explicit parameter file paths
    virtual ConstructResult Construct(const params::ParameterSet& set) = 0;
    
    /// Resolve parameters with the backend's own convention
    virtual ConstructResult FromDefaultLocation() = 0;
    
    virtual std::string Name() const = 0;
};

} // namespace prover
} // namespace zproof

#endif // ZPROOF_PROVER_PROVER_H
