// ZKANCHOR - Configuration File Parser
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Parses INI-style configuration used to fix protocol parameters per
// deployment.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - A bare key is a flag (true); "nokey" sets it to false
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef ZKANCHOR_UTIL_CONFIG_H
#define ZKANCHOR_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkanchor {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// A single configuration entry
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<string>"
    int lineNumber{0};
    bool isDefault{false};
};

/// Result of parsing configuration text
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

    /// "file:line: message" for diagnostics
    std::string Describe() const;
};

/**
 * Key/value store fed from INI text. Later definitions of a key replace
 * earlier ones; defaults never replace explicit values.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Decimal or 0x-prefixed hex; nullopt if missing or malformed
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

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if none is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void RequireKey(const std::string& key, const std::string& section = "");

    /// Messages for every required key that is missing
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseLines(std::istream& input, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
};

} // namespace util
} // namespace zkanchor

#endif // ZKANCHOR_UTIL_CONFIG_H
