// DOGEPROV - Configuration File Parser
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// INI-style configuration for the provider core.
//
// Format:
// - Lines starting with # or ; are comments
// - Section headers: [section]
// - key=value pairs; a bare key is a boolean flag set to true
// - Values can be quoted: key="value with spaces"
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef DOGEPROV_UTIL_CONFIG_H
#define DOGEPROV_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dogeprov {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;
    int lineNumber{0};
};

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
};

/**
 * Holds parsed configuration keyed by (section, key). A key defined twice
 * keeps the later value.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt when missing or not a base-10 integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Accepts true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");

    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys, and unknown keys when an allow-list is set
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::string ExpandEnvVars(const std::string& value);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

} // namespace util
} // namespace dogeprov

#endif // DOGEPROV_UTIL_CONFIG_H
