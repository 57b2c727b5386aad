// ZPROOF - Configuration
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Parses zproofd.conf and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optional [section] headers
// - Values can be quoted: key="value with spaces"
// - A bare key is a true flag, "nokey" is a false flag
// - Environment variables are expanded: ${VAR_NAME} or $VAR_NAME

#ifndef ZPROOF_UTIL_CONFIG_H
#define ZPROOF_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zproof {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".zproofd";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "zproofd.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;
    
    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file (-conf, or <datadir>/zproofd.conf)
 * 3. Built-in defaults registered with SetDefault()
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and $VAR are expanded)
     * @param overwrite If false, keys already set from the command line are kept
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);
    
    /// Parse configuration text. sourceName is used in error messages.
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);
    
    /**
     * Parse command-line arguments.
     *
     * Accepts -key=value, --key=value, --key value and -nokey.
     * Positional arguments are rejected.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    /**
     * Load the config file named by -conf, or <datadir>/zproofd.conf when
     * it exists. A missing default file is not an error; a missing file
     * named explicitly with -conf is.
     */
    ConfigParseResult LoadConfigFile();
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Integer value. Accepts k/m/g suffixes (powers of 1024).
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;
    
    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    /// Comma-separated list
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;
    
    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Set only if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    /// Register a known key. Once any key is registered, Validate() reports others.
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Messages for unknown keys
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// -datadir if given, otherwise ~/.zproofd
    std::string GetDataDir() const;
    
    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& source,
                                  bool overwrite);
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection,
                   ConfigParseResult& result);
    void Store(ConfigEntry entry, bool overwrite);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key, char& badChar);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Process-wide configuration
ConfigManager& GetConfig();

/// Parse the command line, then the config file, into GetConfig()
ConfigParseResult InitConfig(int argc, const char* const argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
    
    // HTTP server
    constexpr const char* BIND = "bind";
    constexpr const char* PORT = "port";
    constexpr const char* THREADS = "threads";
    constexpr const char* MAXCONNECTIONS = "maxconnections";
    constexpr const char* RPCTIMEOUT = "rpctimeout";
    constexpr const char* MAXBODYSIZE = "maxbodysize";
    
    // Parameters and prover
    constexpr const char* PARAMSDIR = "paramsdir";
    constexpr const char* CACHEPROVER = "cacheprover";
    constexpr const char* VERIFYPARAMS = "verifyparams";
    
    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGTIMESTAMPS = "logtimestamps";
}

} // namespace util
} // namespace zproof

#endif // ZPROOF_UTIL_CONFIG_H
