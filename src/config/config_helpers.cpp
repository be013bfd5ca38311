/*
 * rangefetch/src/config/config_helpers.cpp
 *
 * Config file location and the flat `[section] key = value` parser.
 */

#include <charconv>
#include <fstream>
#include <rangefetch/config/config_helpers.h>

namespace rangefetch::config {

namespace {

// Removes a trailing `# comment` that is not inside quotes.
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

std::optional<std::string> ConfigFile::get(const std::string& section,
                                           const std::string& key) const {
    auto s = sections.find(section);
    if (s == sections.end())
        return std::nullopt;
    auto k = s->second.find(key);
    if (k == s->second.end())
        return std::nullopt;
    return k->second;
}

ConfigFile parse_config_file(const std::filesystem::path& config_path) {
    ConfigFile out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                if (!out.hasSection(currentSection)) {
                    out.order.push_back(currentSection);
                    out.sections[currentSection];
                }
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);
        if (k.empty())
            continue;

        if (!out.hasSection(currentSection)) {
            out.order.push_back(currentSection);
        }
        out.sections[currentSection][k] = unquote(v);
    }

    return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size() || s.empty())
        return std::nullopt;
    return v;
}

std::optional<double> parse_double(std::string_view s) {
    if (s.empty())
        return std::nullopt;
    std::string tmp(s);
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size())
        return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "rangefetch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "rangefetch";
    }
    return std::filesystem::path("~/.config") / "rangefetch";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace rangefetch::config
