// NUKLAI - Configuration File Parser Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nuklai {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* space = " \t\r\n";
    size_t first = str.find_first_not_of(space);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(space) - first + 1);
}

std::string Lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool IsName(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), IsNameChar);
}

/// Strip one pair of matching quotes; "..." also honours \" \\ \n \t
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }
    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            char esc = inner[i + 1];
            if (esc == 'n' || esc == 't' || esc == '\\' || esc == '"') {
                out += esc == 'n' ? '\n' : esc == 't' ? '\t' : esc;
                ++i;
                continue;
            }
        }
        out += inner[i];
    }
    return out;
}

} // namespace

std::string ConfigManager::FullKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 >= value.size()) {
            out += value[i++];
            continue;
        }

        size_t nameBegin = i + 1;
        size_t nameEnd;
        size_t resume;
        if (value[nameBegin] == '{') {
            size_t close = value.find('}', nameBegin);
            if (close == std::string::npos) {
                out += value[i++];
                continue;
            }
            ++nameBegin;
            nameEnd = close;
            resume = close + 1;
        } else {
            nameEnd = nameBegin;
            while (nameEnd < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                    value[nameEnd] == '_')) {
                ++nameEnd;
            }
            resume = nameEnd;
        }

        if (nameEnd == nameBegin) {
            out += value[i++];
            continue;
        }
        if (const char* env = std::getenv(value.substr(nameBegin, nameEnd - nameBegin).c_str())) {
            out += env;
        }
        i = resume;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + path.substr(1) : path;
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string section;
    std::string raw;
    int lineNum = 0;

    while (std::getline(in, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error("line longer than " +
                                            std::to_string(MAX_LINE_LENGTH) + " characters",
                                            source, lineNum);
        }

        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return ConfigParseResult::Error("unterminated section header", source, lineNum);
            }
            section = Lower(Trim(line.substr(1, line.size() - 2)));
            if (!section.empty() && !IsName(section)) {
                return ConfigParseResult::Error("bad section name '" + section + "'",
                                                source, lineNum);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return ConfigParseResult::Error("expected key=value", source, lineNum);
        }
        std::string key = Lower(Trim(line.substr(0, eq)));
        if (!IsName(key)) {
            return ConfigParseResult::Error("bad key '" + key + "'", source, lineNum);
        }
        values_[FullKey(key, section)] = ExpandEnvVars(Unquote(Trim(line.substr(eq + 1))));
    }
    return ConfigParseResult();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::ate);
    if (!file.is_open()) {
        return ConfigParseResult::Error("cannot open " + path, path);
    }
    if (file.tellg() > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error("file larger than " +
                                        std::to_string(MAX_CONFIG_SIZE) + " bytes", path);
    }
    file.seekg(0);
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseStream(in, sourceName);
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return values_.count(FullKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = values_.find(FullKey(key, section));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty() ||
        !std::all_of(str->begin(), str->end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(*str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    auto str = TryGetString(key, section);
    if (!str) {
        return items;
    }
    std::istringstream in(*str);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace util
} // namespace nuklai
