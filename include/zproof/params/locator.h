// ZPROOF - Sapling Parameter Locator
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Finds the two Groth16 parameter files the Sapling prover needs.
// Candidate directories are probed in a fixed order and the first
// directory holding BOTH files wins.

#ifndef ZPROOF_PARAMS_LOCATOR_H
#define ZPROOF_PARAMS_LOCATOR_H

#include <zproof/util/fs.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace params {

// ============================================================================
// Constants
// ============================================================================

/// Name of the directory searched for next to the working directory / binary
constexpr const char* PARAMS_SUBDIR = "params";

/// Per-user directory used by the zcash tooling
constexpr const char* USER_PARAMS_DIR = ".zcash-params";

/// Number of ancestors of the working directory probed after the cwd itself
constexpr int MAX_CWD_ANCESTORS = 5;

/// Number of directories probed starting at the executable's own directory
constexpr int MAX_EXE_ANCESTORS = 5;

// ============================================================================
// Parameter Files
// ============================================================================

/// Static description of a parameter file
struct ParamFile {
    const char* name;
    const char* sha256;
    uint64_t size;
};

constexpr ParamFile SAPLING_SPEND{
    "sapling-spend.params",
    "8e48ffd23abb3a5fd9c5589204f32d9c31285a04b78096ba40a79b75677efc13",
    47958396
};

constexpr ParamFile SAPLING_OUTPUT{
    "sapling-output.params",
    "2f0ebbcbb9bb0bcffe95a397e7eba89c29eb4dde6191c339db88570e3f3fb0e4",
    3592860
};

/// A located parameter file
struct ParamLocation {
    util::fs::Path path;
    uint64_t size{0};
};

/// Both parameter files. Only ever built from a directory holding both.
struct ParameterSet {
    ParamLocation spend;
    ParamLocation output;
    
    /// Directory the files were found in
    util::fs::Path directory;
    
    /// Build a set from a directory, or nullopt if either file is unusable
    static std::optional<ParameterSet> FromDirectory(const util::fs::Path& dir);
};

// ============================================================================
// Candidate Directories
// ============================================================================

enum class CandidateKind {
    Configured,                 ///< -paramsdir from configuration
    WorkingDirectory,           ///< <cwd>/params
    WorkingDirectoryAncestor,   ///< <cwd ancestor>/params
    ExecutableAncestor,         ///< <exe dir or ancestor>/params
    UserDefault                 ///< $HOME/.zcash-params
};

const char* CandidateKindToString(CandidateKind kind);

struct CandidateDirectory {
    CandidateKind kind;
    util::fs::Path path;
};

/// Process facts the search depends on. Injected so tests can use temp trees.
struct SearchEnvironment {
    util::fs::Path workingDirectory;
    util::fs::Path executablePath;
    util::fs::Path homeDirectory;
    
    /// Probed before everything else when set
    util::fs::Path extraDirectory;
    
    /// Capture cwd, /proc/self/exe and $HOME of the running process
    static SearchEnvironment FromProcess();
};

// ============================================================================
// Search Report
// ============================================================================

/// Presence of one parameter file in one directory
struct FileProbe {
    std::string name;
    util::fs::Path path;
    bool present{false};
    uint64_t size{0};
};

struct LocationProbe {
    CandidateDirectory candidate;
    FileProbe spend;
    FileProbe output;
    
    bool Complete() const { return spend.present && output.present; }
    bool AnyPresent() const { return spend.present || output.present; }
};

/// Everything that was looked at, for error messages
struct SearchReport {
    std::vector<LocationProbe> locations;
    
    /// Index into locations of the most useful location to report, if any
    std::optional<size_t> bestCandidate;
    
    bool Found() const;
    const LocationProbe* Best() const;
};

// ============================================================================
// Parameter Locator
// ============================================================================

/**
 * Deterministic parameter search.
 *
 * Order: configured dir, <cwd>/params, cwd ancestors, executable directory
 * and its ancestors, then $HOME/.zcash-params. Each directory is probed once.
 * None of the methods throw; filesystem errors count as "not found".
 */
class ParameterLocator {
public:
    explicit ParameterLocator(SearchEnvironment env);
    
    /// Locator over the current process environment
    ParameterLocator();
    
    const SearchEnvironment& GetEnvironment() const { return env_; }
    
    /// Ordered, de-duplicated list of directories to probe
    std::vector<CandidateDirectory> Candidates() const;
    
    /// First complete parameter set, or nullopt when none exists
    std::optional<ParameterSet> Locate() const;
    
    /// Every complete parameter set, in search order
    std::vector<ParameterSet> LocateAll() const;
    
    /// Probe every candidate and report what was found where
    SearchReport Diagnose() const;

private:
    SearchEnvironment env_;
};

/// Probe one file, logging unexpected errors
FileProbe ProbeFile(const util::fs::Path& dir, const ParamFile& file);

} // namespace params
} // namespace zproof

#endif // ZPROOF_PARAMS_LOCATOR_H
