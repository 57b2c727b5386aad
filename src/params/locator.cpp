// ZPROOF - Sapling Parameter Locator Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/params/locator.h>
#include <zproof/util/logging.h>

#include <cstring>
#include <set>

namespace zproof {
namespace params {

// ============================================================================
// Helpers
// ============================================================================

const char* CandidateKindToString(CandidateKind kind) {
    switch (kind) {
        case CandidateKind::Configured: return "configured";
        case CandidateKind::WorkingDirectory: return "working directory";
        case CandidateKind::WorkingDirectoryAncestor: return "working directory ancestor";
        case CandidateKind::ExecutableAncestor: return "executable directory";
        case CandidateKind::UserDefault: return "user default";
        default: return "unknown";
    }
}

FileProbe ProbeFile(const util::fs::Path& dir, const ParamFile& file) {
    FileProbe probe;
    probe.name = file.name;
    probe.path = dir / file.name;
    
    util::fs::FileStatus status = util::fs::Status(probe.path);
    if (status.IsError()) {
        LOG_WARN(util::LogCategory::PARAMS) << "Cannot stat " << probe.path.String()
                                            << ": " << std::strerror(status.error);
        return probe;
    }
    if (!status.IsFile()) {
        return probe;
    }
    if (!util::fs::IsReadable(probe.path)) {
        LOG_WARN(util::LogCategory::PARAMS) << probe.path.String() << " exists but is not readable";
        return probe;
    }
    
    probe.present = true;
    probe.size = status.size;
    return probe;
}

// ============================================================================
// ParameterSet
// ============================================================================

std::optional<ParameterSet> ParameterSet::FromDirectory(const util::fs::Path& dir) {
    FileProbe spend = ProbeFile(dir, SAPLING_SPEND);
    FileProbe output = ProbeFile(dir, SAPLING_OUTPUT);
    if (!spend.present || !output.present) {
        return std::nullopt;
    }
    
    ParameterSet set;
    set.directory = dir;
    set.spend = {spend.path, spend.size};
    set.output = {output.path, output.size};
    return set;
}

// ============================================================================
// SearchEnvironment
// ============================================================================

SearchEnvironment SearchEnvironment::FromProcess() {
    SearchEnvironment env;
    env.workingDirectory = util::fs::CurrentPath();
    env.executablePath = util::fs::ExecutablePath();
    env.homeDirectory = util::fs::HomeDirectory();
    
    if (env.workingDirectory.Empty()) {
        LOG_WARN(util::LogCategory::PARAMS) << "Could not determine the working directory";
    }
    if (env.executablePath.Empty()) {
        LOG_DEBUG(util::LogCategory::PARAMS) << "Could not determine the executable path";
    }
    return env;
}

// ============================================================================
// SearchReport
// ============================================================================

bool SearchReport::Found() const {
    for (const auto& location : locations) {
        if (location.Complete()) {
            return true;
        }
    }
    return false;
}

const LocationProbe* SearchReport::Best() const {
    if (!bestCandidate || *bestCandidate >= locations.size()) {
        return nullptr;
    }
    return &locations[*bestCandidate];
}

// ============================================================================
// ParameterLocator
// ============================================================================

ParameterLocator::ParameterLocator(SearchEnvironment env)
    : env_(std::move(env)) {}

ParameterLocator::ParameterLocator()
    : env_(SearchEnvironment::FromProcess()) {}

std::vector<CandidateDirectory> ParameterLocator::Candidates() const {
    std::vector<CandidateDirectory> candidates;
    std::set<std::string> seen;
    
    auto add = [&](CandidateKind kind, const util::fs::Path& path) {
        if (path.Empty()) {
            return;
        }
        if (seen.insert(path.Normalize().String()).second) {
            candidates.push_back({kind, path});
        }
    };
    
    add(CandidateKind::Configured, env_.extraDirectory);
    
    if (!env_.workingDirectory.Empty()) {
        add(CandidateKind::WorkingDirectory, env_.workingDirectory / PARAMS_SUBDIR);
        
        util::fs::Path ancestor = env_.workingDirectory;
        for (int level = 1; level <= MAX_CWD_ANCESTORS; ++level) {
            ancestor = ancestor.Parent();
            if (ancestor.Empty()) {
                break;
            }
            add(CandidateKind::WorkingDirectoryAncestor, ancestor / PARAMS_SUBDIR);
        }
    }
    
    if (!env_.executablePath.Empty()) {
        util::fs::Path dir = env_.executablePath.Parent();
        for (int level = 0; level < MAX_EXE_ANCESTORS && !dir.Empty(); ++level) {
            add(CandidateKind::ExecutableAncestor, dir / PARAMS_SUBDIR);
            dir = dir.Parent();
        }
    }
    
    if (!env_.homeDirectory.Empty()) {
        add(CandidateKind::UserDefault, env_.homeDirectory / USER_PARAMS_DIR);
    }
    
    return candidates;
}

std::optional<ParameterSet> ParameterLocator::Locate() const {
    LOG_DEBUG(util::LogCategory::PARAMS) << "Searching for Sapling parameters";
    
    for (const auto& candidate : Candidates()) {
        LOG_DEBUG(util::LogCategory::PARAMS) << "Checking " << CandidateKindToString(candidate.kind)
                                             << " params: " << candidate.path.String();
        
        auto set = ParameterSet::FromDirectory(candidate.path);
        if (set) {
            LOG_INFO(util::LogCategory::PARAMS) << "Found parameters in "
                                                << CandidateKindToString(candidate.kind)
                                                << " location: " << candidate.path.String();
            return set;
        }
    }
    
    LOG_INFO(util::LogCategory::PARAMS) << "Parameters not found in any search location";
    return std::nullopt;
}

std::vector<ParameterSet> ParameterLocator::LocateAll() const {
    std::vector<ParameterSet> sets;
    for (const auto& candidate : Candidates()) {
        auto set = ParameterSet::FromDirectory(candidate.path);
        if (set) {
            LOG_DEBUG(util::LogCategory::PARAMS) << "Complete set in "
                                                 << CandidateKindToString(candidate.kind)
                                                 << " location: " << candidate.path.String();
            sets.push_back(std::move(*set));
        }
    }
    return sets;
}

SearchReport ParameterLocator::Diagnose() const {
    SearchReport report;
    
    for (const auto& candidate : Candidates()) {
        LocationProbe probe;
        probe.candidate = candidate;
        probe.spend = ProbeFile(candidate.path, SAPLING_SPEND);
        probe.output = ProbeFile(candidate.path, SAPLING_OUTPUT);
        
        if (!report.bestCandidate && probe.AnyPresent()) {
            report.bestCandidate = report.locations.size();
        }
        report.locations.push_back(std::move(probe));
    }
    
    if (!report.bestCandidate && !report.locations.empty()) {
        report.bestCandidate = 0;
    }
    return report;
}

} // namespace params
} // namespace zproof
