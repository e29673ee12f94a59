#include <kbase/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <set>

namespace kbase::config {

namespace {

// Iterates "[section]" headers and "key = value" lines, stripping comments.
template <typename Fn> void scan_config(const std::filesystem::path& config_path, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                fn(currentSection, std::string{}, std::string{});
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        bool inQuote = false;
        char quote = 0;
        for (size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if ((c == '"' || c == '\'') && (!inQuote || c == quote)) {
                inQuote = !inQuote;
                quote = c;
            } else if (c == '#' && !inQuote) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        fn(currentSection, k, unquote(v));
    }
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    try {
        size_t consumed = 0;
        double out = std::stod(v, &consumed);
        if (consumed != v.size())
            return std::nullopt;
        return out;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item =
            s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty())
            out.push_back(item);
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string found;
    bool done = false;
    scan_config(config_path,
                [&](const std::string& sec, const std::string& k, const std::string& v) {
                    if (done || k.empty())
                        return;
                    // Support both "[section] key" and dotted "section.key" at top level
                    if ((sec == section && k == key) ||
                        (sec.empty() && k == section + "." + key)) {
                        found = v;
                        done = true;
                    }
                });
    return found;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> out;
    scan_config(config_path,
                [&](const std::string& sec, const std::string& k, const std::string& v) {
                    if (!k.empty() && sec == section) {
                        out.emplace(k, v);
                    }
                });
    return out;
}

std::vector<std::string> list_config_sections(const std::filesystem::path& config_path,
                                              const std::string& prefix) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    scan_config(config_path,
                [&](const std::string& sec, const std::string& k, const std::string&) {
                    if (k.empty() && sec.rfind(prefix, 0) == 0 && seen.insert(sec).second) {
                        out.push_back(sec);
                    }
                });
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "kbase" / "config.toml";
    }

    return configHome / "kbase" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "kbase";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "kbase";
    }
    return std::filesystem::current_path() / "kbase_data";
}

} // namespace kbase::config
