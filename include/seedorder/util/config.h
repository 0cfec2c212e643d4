// SEEDORDER - Configuration
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Options come from the command line and, optionally, an INI-style file.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs; a bare key is a boolean flag, "nokey" negates it
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - "include <path>" pulls in another file
//
// Command-line values always win over file values.

#ifndef SEEDORDER_UTIL_CONFIG_H
#define SEEDORDER_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace seedorder {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Directory under $HOME holding the default config file
constexpr const char* DEFAULT_DATADIR_NAME = ".seedorder";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "seedorder.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;        // Empty for global section
    std::string source;         // File path, or "<command-line>"
    int lineNumber{0};
    bool fromCommandLine{false};
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

    /// "file:line: message" (location parts omitted when unknown)
    std::string Describe() const;
};

// ============================================================================
// Command-Line Description
// ============================================================================

/**
 * What the command-line parser needs to know about the options.
 *
 * Keys in valueKeys take a value, either as --key=value or as the next
 * argument. Any other --key is a boolean flag. Aliases map a single-dash
 * short name ("l") to its long key ("language").
 */
struct CommandLineSpec {
    std::set<std::string> valueKeys;
    std::map<std::string, std::string> aliases;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * Entries set on the command line are never replaced. Between files,
     * an existing key is only replaced when overwrite is set.
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration text (same rules as ParseFile)
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments (argv[0] is skipped).
     *
     * Accepts --key=value, --key value (value keys only), -a value for
     * aliases, --flag, --noflag, and "--" to end option parsing.
     * Non-option arguments are collected in order as positionals.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       const CommandLineSpec& spec);

    /// Positional arguments from the last ParseCommandLine
    const std::vector<std::string>& GetPositional() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; accepts decimal k/m/g suffixes (10k = 10000).
    /// nullopt if missing, malformed or out of range.
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Where a key was set ("<command-line>", a file path, or empty)
    std::string GetSource(const std::string& key, const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Validation and Utilities
    // ========================================================================

    /// Global-section keys not in the known set
    std::vector<std::string> UnknownKeys(const std::set<std::string>& known) const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// ~/.seedorder/seedorder.conf
    static std::string GetDefaultConfigPath();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Parse an integer with an optional decimal k/m/g suffix
    static std::optional<int64_t> ParseInt(const std::string& str);

    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseLines(std::istream& in, const std::string& source, bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite,
                   ConfigParseResult& result);

    void Store(ConfigEntry entry, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key, char& badChar);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Search
    constexpr const char* MAX_PERMUTATIONS = "max-permutations";
    constexpr const char* LANGUAGE = "language";
    constexpr const char* DERIVATION = "derivation";
    constexpr const char* BIP44 = "bip44";
    constexpr const char* BIP49 = "bip49";
    constexpr const char* BIP84 = "bip84";
    constexpr const char* START = "start";
    constexpr const char* THREADS = "threads";
    constexpr const char* BATCHSIZE = "batchsize";
    constexpr const char* PROGRESSINTERVAL = "progressinterval";

    // Wordlists
    constexpr const char* WORDLISTDIR = "wordlistdir";
    constexpr const char* STRICTLANGUAGE = "strictlanguage";

    // General
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

} // namespace util
} // namespace seedorder

#endif // SEEDORDER_UTIL_CONFIG_H
