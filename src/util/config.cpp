// SEEDORDER - Configuration Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace seedorder {
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
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::Describe() const {
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
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
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Escapes are honored in double quotes only
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
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

std::optional<int64_t> ConfigManager::ParseInt(const std::string& str) {
    std::string s = Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (s[pos] == '+' || s[pos] == '-') {
        negative = s[pos] == '-';
        ++pos;
    }

    const uint64_t limit = negative
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    uint64_t magnitude = 0;
    size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        uint64_t d = static_cast<uint64_t>(s[pos] - '0');
        if (magnitude > (limit - d) / 10) {
            return std::nullopt;
        }
        magnitude = magnitude * 10 + d;
        ++pos;
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }

    std::string suffix = ToLower(Trim(s.substr(pos)));
    uint64_t multiplier = 1;
    if (suffix == "k") {
        multiplier = 1000ULL;
    } else if (suffix == "m") {
        multiplier = 1000000ULL;
    } else if (suffix == "g") {
        multiplier = 1000000000ULL;
    } else if (!suffix.empty()) {
        return std::nullopt;
    }

    if (magnitude != 0 && multiplier > limit / magnitude) {
        return std::nullopt;
    }
    magnitude *= multiplier;

    if (negative) {
        return magnitude == limit
            ? std::numeric_limits<int64_t>::min()
            : -static_cast<int64_t>(magnitude);
    }
    return static_cast<int64_t>(magnitude);
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t next;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value[i++];
                    continue;
                }
                next = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                if (nameEnd == nameStart) {
                    result += value[i++];
                    continue;
                }
                next = nameEnd;
            }

            std::string name = value.substr(nameStart, nameEnd - nameStart);
            if (const char* env = std::getenv(name.c_str())) {
                result += env;
            }
            i = next;
            continue;
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultConfigPath() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME + "/" + DEFAULT_CONFIG_FILENAME);
}

bool ConfigManager::IsValidKey(const std::string& key, char& badChar) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            badChar = c;
            return false;
        }
    }
    return !key.empty();
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    return section.empty() ? key : section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end()) {
        if (it->second.fromCommandLine && !entry.fromCommandLine) {
            return;
        }
        if (!overwrite && !entry.fromCommandLine) {
            return;
        }
    }
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// File Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection, bool overwrite,
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

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error("Maximum include depth exceeded", source, lineNum);
            return false;
        }
        std::string includePath = ExpandEnvVars(ExpandTilde(Unquote(Trim(trimmed.substr(8)))));

        ++includeDepth_;
        ConfigParseResult included = ParseFile(includePath, overwrite);
        --includeDepth_;

        if (!included.success) {
            result = included;
            return false;
        }
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nokey" negates it
        std::string key = trimmed;
        std::string value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
        entry.key = key;
        entry.value = value;
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    char bad = 0;
    if (!IsValidKey(entry.key, bad)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? "Empty key"
                              : "Invalid character in key: " + std::string(1, bad),
            source, lineNum);
        return false;
    }

    Store(std::move(entry), overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& source,
                                            bool overwrite) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, overwrite, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, overwrite, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    return ParseLines(file, path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseLines(stream, sourceName, overwrite);
}

// ============================================================================
// Command-Line Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  const CommandLineSpec& spec) {
    positional_.clear();
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";

        if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        bool isShort = arg[1] != '-';
        std::string body = arg.substr(isShort ? 1 : 2);

        std::string key;
        std::string value;
        bool hasValue = false;

        size_t eqPos = body.find('=');
        if (eqPos != std::string::npos) {
            key = body.substr(0, eqPos);
            value = body.substr(eqPos + 1);
            hasValue = true;
        } else {
            key = body;
        }

        if (isShort) {
            auto alias = spec.aliases.find(key);
            if (alias == spec.aliases.end()) {
                return ConfigParseResult::Error("Unknown option: " + arg, COMMAND_LINE_SOURCE);
            }
            key = alias->second;
        }

        if (!hasValue && spec.valueKeys.count(key) != 0) {
            if (i + 1 >= argc) {
                return ConfigParseResult::Error("Option --" + key + " requires a value",
                                                COMMAND_LINE_SOURCE);
            }
            value = argv[++i];
            hasValue = true;
        }

        if (!hasValue) {
            value = "true";
            if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
                spec.valueKeys.count(key) == 0 && std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }

        char bad = 0;
        if (!IsValidKey(key, bad)) {
            return ConfigParseResult::Error("Invalid option: " + arg, COMMAND_LINE_SOURCE);
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = COMMAND_LINE_SOURCE;
        entry.fromCommandLine = true;
        Store(std::move(entry), true);
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) != 0;
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
    return ParseInt(*str);
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

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

std::string ConfigManager::GetSource(const std::string& key, const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    return it == entries_.end() ? std::string() : it->second.source;
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
    entries_[MakeKey(key, section)] = std::move(entry);
}

// ============================================================================
// Validation and Utilities
// ============================================================================

std::vector<std::string> ConfigManager::UnknownKeys(const std::set<std::string>& known) const {
    std::vector<std::string> unknown;
    for (const auto& kv : entries_) {
        if (kv.second.section.empty() && known.count(kv.second.key) == 0) {
            unknown.push_back(kv.second.key);
        }
    }
    return unknown;
}

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
    includeDepth_ = 0;
}

} // namespace util
} // namespace seedorder
