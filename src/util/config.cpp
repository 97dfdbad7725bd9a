// DOGEPROV - Configuration File Parser Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/util/config.h"
#include "dogeprov/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dogeprov {
namespace util {

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
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Escapes are honoured in double-quoted values only
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
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t resume;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                resume = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }

            if (nameEnd > nameStart) {
                const char* env = std::getenv(value.substr(nameStart, nameEnd - nameStart).c_str());
                if (env) {
                    result += env;
                }
                i = resume;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
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

    size_t eqPos = trimmed.find('=');
    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = eqPos == std::string::npos
        ? "true"
        : ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[MakeKey(key, currentSection)] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
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
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            LOG_WARN(LogCategory::CONFIG) << source << ":" << lineNum << ": "
                                          << result.errorMessage;
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(filePath);

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
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
    if (!str || str->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        if (pos != str->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
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

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[MakeKey(key, section)] = entry;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;

    for (const auto& requiredKey : requiredKeys_) {
        if (entries_.find(requiredKey) == entries_.end()) {
            errors.push_back("Required key missing: " + requiredKey);
        }
    }

    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.count(fullKey) == 0 && requiredKeys_.count(fullKey) == 0) {
                errors.push_back("Unknown key: " + fullKey + " (defined in " + entry.source + ")");
            }
        }
    }
    return errors;
}

void ConfigManager::Clear() {
    entries_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace dogeprov
