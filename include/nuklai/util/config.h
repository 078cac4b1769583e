// NUKLAI - Configuration File Parser
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// INI-style settings for the ledger and its node:
//
//   # comment            ; comment
//   [emission]
//   epochlength = 1200
//   emissionaddress = "nai1..."
//   [log]
//   file = ${HOME}/nuklai/ledger.log
//
// Section and key names are case-insensitive. Values may be quoted and may
// reference environment variables as ${VAR} or $VAR.

#ifndef NUKLAI_UTIL_CONFIG_H
#define NUKLAI_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nuklai {
namespace util {

/// Files larger than this are refused (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Longest accepted line
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Error(std::string msg, std::string file, int line = 0) {
        return {false, std::move(msg), std::move(file), line};
    }
};

/**
 * Parsed settings. Parsing more than one source layers them: a key seen
 * again replaces the earlier value.
 */
class ConfigManager {
public:
    /// Parse a file; ~ and environment references in the path are expanded
    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Plain decimal value; nullopt if absent, signed, malformed or out of range
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// Comma-separated value split into trimmed, non-empty items
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Expand ${VAR} and $VAR references; unset variables expand to nothing
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand a leading ~ to $HOME
    static std::string ExpandTilde(const std::string& path);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    static std::string FullKey(const std::string& key, const std::string& section);

    /// "section.key" (or "key" for the global section) -> value
    std::map<std::string, std::string> values_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // [emission]
    constexpr const char* SECTION_EMISSION = "emission";
    constexpr const char* MAXSUPPLY = "maxsupply";
    constexpr const char* BASEAPRBPS = "baseaprbps";
    constexpr const char* BASEVALIDATORS = "basevalidators";
    constexpr const char* EPOCHLENGTH = "epochlength";
    constexpr const char* SECONDSPERBLOCK = "secondsperblock";
    constexpr const char* SECONDSPERYEAR = "secondsperyear";
    constexpr const char* EMISSIONADDRESS = "emissionaddress";
    constexpr const char* HRP = "hrp";

    // [log]
    constexpr const char* SECTION_LOG = "log";
    constexpr const char* LEVEL = "level";
    constexpr const char* FILE = "file";
    constexpr const char* CATEGORIES = "categories";
}

} // namespace util
} // namespace nuklai

#endif // NUKLAI_UTIL_CONFIG_H
