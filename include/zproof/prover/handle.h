// ZPROOF - Prover Handle
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Acquires a prover: explicit parameter search first, then the backend's
// own default lookup. Failures carry a diagnostic an operator can act on.

#ifndef ZPROOF_PROVER_HANDLE_H
#define ZPROOF_PROVER_HANDLE_H

#include <zproof/prover/prover.h>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace prover {

/// Resolution strategies, tried in the order listed
enum class AcquireStrategy {
    ExplicitSearch,
    BackendDefault
};

const char* AcquireStrategyToString(AcquireStrategy strategy);

/// No strategy produced a prover. Recoverable by placing the parameter files.
struct InitError {
    std::string message;
    params::SearchReport report;
};

struct AcquireResult {
    ProverPtr prover;
    std::optional<InitError> error;
    
    bool Ok() const { return prover != nullptr; }
    
    static AcquireResult Success(ProverPtr p) {
        AcquireResult r;
        r.prover = std::move(p);
        return r;
    }
    static AcquireResult Error(InitError e) {
        AcquireResult r;
        r.error = std::move(e);
        return r;
    }
};

/// Source of provers for request handlers
using ProverProvider = std::function<AcquireResult()>;

// ============================================================================
// Prover Handle
// ============================================================================

/**
 * Builds a fresh prover on every Acquire() call.
 *
 * Nothing is retained between calls, so parameter files placed while the
 * service runs are picked up by the next request.
 */
class ProverHandle {
public:
    ProverHandle(std::shared_ptr<ProverBackend> backend, params::SearchEnvironment env);
    
    AcquireResult Acquire() const;
    
    const std::vector<AcquireStrategy>& GetStrategies() const { return strategies_; }
    const params::SearchEnvironment& GetEnvironment() const { return env_; }

private:
    ConstructResult TryStrategy(AcquireStrategy strategy) const;
    InitError BuildInitError(const std::vector<std::string>& failures) const;
    
    std::shared_ptr<ProverBackend> backend_;
    params::SearchEnvironment env_;
    std::vector<AcquireStrategy> strategies_;
};

// ============================================================================
// Shared Prover Handle
// ============================================================================

/**
 * Process-wide prover built at most once.
 *
 * Concurrent first callers wait on the same construction. A failed
 * construction is not remembered: the next call tries again.
 */
class SharedProverHandle {
public:
    explicit SharedProverHandle(ProverHandle handle);
    
    AcquireResult Acquire();
    
    /// Drop the cached prover; the next Acquire() rebuilds it
    void Reset();
    
    bool IsInitialized() const;

private:
    ProverHandle handle_;
    mutable std::mutex mutex_;
    ProverPtr prover_;
};

/// Plain-text "[present|missing] name (size)" lines for one location
std::string DescribeLocation(const params::LocationProbe& probe);

} // namespace prover
} // namespace zproof

#endif // ZPROOF_PROVER_HANDLE_H
