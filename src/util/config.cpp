// CONCORD - Configuration File Parser Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/util/config.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace concord {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) out += ":" + std::to_string(errorLine);
        out += ": ";
    }
    return out + errorMessage;
}

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
    if (str.size() < 2) {
        return str;
    }
    char first = str.front();
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (first == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
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

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

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
    result.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool isDefault) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = isDefault;
    entries_[MakeKey(key, section)] = std::move(entry);
}

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
        std::string section = Trim(trimmed.substr(1, end - 1));
        if (!IsValidKey(section)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + section, source, lineNum);
            return false;
        }
        currentSection = section;
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    std::string value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    Store(key, value, currentSection, source, lineNum, false);
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseString(buffer.str(), path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return ConfigParseResult::Success();
}

int ConfigManager::ParseCommandLine(int argc, char* argv[], std::string* error) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-' || arg.find('=') == std::string::npos) {
            break;
        }
        arg = arg.substr(arg[1] == '-' ? 2 : 1);

        size_t eqPos = arg.find('=');
        std::string name = arg.substr(0, eqPos);
        std::string value = arg.substr(eqPos + 1);

        std::string section;
        size_t dot = name.find('.');
        if (dot != std::string::npos) {
            section = name.substr(0, dot);
            name = name.substr(dot + 1);
        }
        if (!IsValidKey(name) || (!section.empty() && !IsValidKey(section))) {
            if (error) *error = "Invalid option: " + std::string(argv[i]);
            return -1;
        }
        Store(name, value, section, "<command-line>", 0, false);
    }
    return i;
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
        if (!Trim(str->substr(pos)).empty()) {
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

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto str = TryGetString(key, section);
    if (!str) {
        return result;
    }
    std::istringstream ss(*str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
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
    Store(key, value, section, "<programmatic>", 0, false);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (!HasKey(key, section)) {
        Store(key, value, section, "<default>", 0, true);
    }
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<ConfigEntry> ConfigManager::GetEntries(const std::string& section) const {
    std::vector<ConfigEntry> result;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace util
} // namespace concord
