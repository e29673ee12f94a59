#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kbase::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Scalar parsing; nullopt when the text is empty or malformed
std::optional<bool> parse_bool(std::string_view s);
std::optional<long long> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);

// Split "a, b,c" or ["a", "b"] into trimmed, unquoted items
std::vector<std::string> parse_list(const std::string& raw);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// All key/value pairs of one section; the first occurrence of a key wins
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

// Names of sections starting with prefix (e.g. "models." yields "models.foo")
std::vector<std::string> list_config_sections(const std::filesystem::path& config_path,
                                              const std::string& prefix);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// $XDG_DATA_HOME/kbase or ~/.local/share/kbase
std::filesystem::path get_data_dir();

} // namespace kbase::config
