// CONCORD - Configuration File Parser
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Parses INI-style configuration files for a concord node.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line overrides use -key=value or -section.key=value.

#ifndef CONCORD_UTIL_CONFIG_H
#define CONCORD_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".concord";
constexpr const char* DEFAULT_CONFIG_FILENAME = "concord.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

/// Recognised keys, grouped by section
namespace ConfigKeys {
    // global
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* STORAGE = "storage";

    constexpr const char* SECTION_KNOWLEDGE = "knowledge";
    constexpr const char* ENABLED = "enabled";
    constexpr const char* GOVERNANCE_ENABLED = "governance_enabled";
    constexpr const char* GROUP = "group";
    constexpr const char* SCHEMA_VERSION = "schema_version";

    constexpr const char* SECTION_VOTING = "voting";
    constexpr const char* MIN_POOL_SIZE = "min_pool_size";
    constexpr const char* QUORUM_YES = "quorum_yes";
    constexpr const char* QUORUM_NO = "quorum_no";
    constexpr const char* TIMEOUT_SEC = "timeout_sec";
    constexpr const char* ALLOW_SELF_VOTE = "allow_self_vote";

    constexpr const char* SECTION_NODE = "node";
    constexpr const char* CLAW_ID = "claw_id";
    constexpr const char* INSTANCE_ID = "instance_id";

    constexpr const char* SECTION_CASCADE = "cascade";
    constexpr const char* MAX_RETRIES = "max_retries";
}

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

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" style description
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration gathered from files, the command line and defaults.
 *
 * Later sources override earlier ones, except SetDefault() which never
 * replaces an existing value.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Consume leading -key=value / -section.key=value options.
     *
     * Parsing stops at the first argument that does not start with '-'
     * or that has no '='. Returns the index of that argument, or -1 with
     * `error` set if an option is malformed.
     */
    int ParseCommandLine(int argc, char* argv[], std::string* error = nullptr);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Comma-separated list, entries trimmed, empty entries dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    std::vector<std::string> GetSections() const;

    std::vector<ConfigEntry> GetEntries(const std::string& section = "") const;

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    /// ~/.concord
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace concord

#endif // CONCORD_UTIL_CONFIG_H
