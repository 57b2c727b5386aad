// ZPROOF - Configuration Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include "zproof/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace zproof {
namespace util {

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }
    
    char first = str.front();
    char last = str.back();
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }
    
    // Double quotes support \n \t \\ \"
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key, char& badChar) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            badChar = c;
            return false;
        }
    }
    return !key.empty();
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            if (value[i + 1] == '{') {
                size_t end = value.find('}', i + 2);
                if (end != std::string::npos) {
                    std::string name = value.substr(i + 2, end - i - 2);
                    if (const char* env = std::getenv(name.c_str())) {
                        result += env;
                    }
                    i = end + 1;
                    continue;
                }
            } else {
                size_t end = i + 1;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > i + 1) {
                    std::string name = value.substr(i + 1, end - i - 1);
                    if (const char* env = std::getenv(name.c_str())) {
                        result += env;
                    }
                    i = end;
                    continue;
                }
            }
        }
        result += value[i];
        ++i;
    }
    
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }
    
    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    std::string home = ExpandTilde("~");
    if (home == "~") {
        return DEFAULT_DATADIR_NAME;
    }
    return home + "/" + DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        const ConfigEntry& existing = it->second;
        bool sameSource = existing.source == entry.source;
        bool replaceable = overwrite && existing.source != COMMAND_LINE_SOURCE;
        if (!sameSource && !replaceable) {
            return;
        }
    }
    entries_[fullKey] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }
    
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }
    
    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        entry.key = trimmed;
        entry.value = "1";
        if (entry.key.size() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "0";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    char badChar = 0;
    if (!IsValidKey(entry.key, badChar)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? std::string("Empty key")
                              : "Invalid character in key: " + std::string(1, badChar),
            source, lineNum);
        return false;
    }
    
    Store(std::move(entry), overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, overwrite, currentSection, result)) {
            return result;
        }
    }
    
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path, path);
    }
    
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }
    
    return ParseStream(file, path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string original = argv[i] ? argv[i] : "";
        std::string arg = original;
        
        if (arg.empty() || arg[0] != '-') {
            return ConfigParseResult::Error("Unexpected argument: " + original,
                                            COMMAND_LINE_SOURCE, i);
        }
        
        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            continue;
        }
        arg = arg.substr(start);
        
        ConfigEntry entry;
        entry.source = COMMAND_LINE_SOURCE;
        entry.lineNumber = i;
        
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "0";
        } else {
            entry.key = arg;
            if (i + 1 < argc && argv[i + 1] && argv[i + 1][0] != '-' &&
                argv[i + 1][0] != '\0') {
                entry.value = argv[++i];
            } else {
                entry.value = "1";
            }
        }
        
        char badChar = 0;
        if (!IsValidKey(entry.key, badChar)) {
            return ConfigParseResult::Error("Invalid option: " + original,
                                            COMMAND_LINE_SOURCE, i);
        }
        
        entries_[entry.key] = entry;
    }
    
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    auto explicitConf = TryGetString(ConfigKeys::CONF);
    if (explicitConf) {
        return ParseFile(*explicitConf, false);
    }
    
    std::string path = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    std::ifstream probe(path);
    if (!probe.is_open()) {
        ConfigParseResult result = ConfigParseResult::Success();
        result.warnings.push_back("No config file at " + path + ", using defaults");
        return result;
    }
    probe.close();
    
    return ParseFile(path, false);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        std::string suffix = ToLower(Trim(str->substr(pos)));
        if (suffix.empty()) {
            return value;
        }
        if (suffix.size() != 1) {
            return std::nullopt;
        }
        switch (suffix[0]) {
            case 'k': return value * 1024;
            case 'm': return value * 1024 * 1024;
            case 'g': return value * 1024LL * 1024 * 1024;
            default: return std::nullopt;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    auto str = TryGetString(key, section);
    if (!str) {
        return items;
    }
    std::istringstream ss(*str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[MakeKey(key, section)] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey)) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& [fullKey, entry] : entries_) {
        if (!allowedKeys_.count(fullKey)) {
            std::string where = entry.source;
            if (entry.lineNumber > 0 && entry.source != COMMAND_LINE_SOURCE) {
                where += ":" + std::to_string(entry.lineNumber);
            }
            errors.push_back("Unknown option: " + fullKey + " (" + where + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
}

std::string ConfigManager::GetDataDir() const {
    auto dir = TryGetString(ConfigKeys::DATADIR);
    if (dir && !dir->empty()) {
        return ExpandEnvVars(ExpandTilde(*dir));
    }
    return GetDefaultDataDir();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager config;
    return config;
}

ConfigParseResult InitConfig(int argc, const char* const argv[]) {
    ConfigManager& config = GetConfig();
    
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        return cmdResult;
    }
    
    // File values never replace command-line values
    return config.LoadConfigFile();
}

} // namespace util
} // namespace zproof
