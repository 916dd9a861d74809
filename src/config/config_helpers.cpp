#include <cloak/config/config_helpers.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace cloak::config {

namespace {

// Strip a trailing "# comment" that is not inside quotes
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            std::string out = v.substr(0, i);
            trim(out);
            return out;
        }
    }
    return v;
}

} // namespace

ConfigSections parse_config_text(std::string_view text) {
    ConfigSections sections;
    std::istringstream in{std::string(text)};

    std::string line;
    std::string currentSection;
    while (std::getline(in, line)) {
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
        v = strip_inline_comment(v);

        // Support both "extraction.chunk_size" and "[extraction] chunk_size"
        std::string section = currentSection;
        if (currentSection.empty()) {
            if (auto dot = k.rfind('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        sections[section][unquote(k)] = unquote(v);
    }
    return sections;
}

Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "cannot open config file: " + config_path.string()};
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return parse_config_text(buf.str());
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    std::string item;
    std::istringstream in(body);
    while (std::getline(in, item, ',')) {
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

Result<bool> parse_bool(const std::string& raw) {
    std::string v = raw;
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "expected a boolean, got '" + raw + "'"};
}

Result<std::size_t> parse_size(const std::string& raw) {
    std::string v = raw;
    trim(v);
    std::size_t out = 0;
    const auto* first = v.data();
    const auto* last = v.data() + v.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (v.empty() || ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     "expected a non-negative integer, got '" + raw + "'"};
    }
    return out;
}

Result<float> parse_float(const std::string& raw) {
    std::string v = raw;
    trim(v);
    try {
        std::size_t consumed = 0;
        const float out = std::stof(v, &consumed);
        if (consumed != v.size() || !std::isfinite(out)) {
            return Error{ErrorCode::InvalidArgument, "expected a number, got '" + raw + "'"};
        }
        return out;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, "expected a number, got '" + raw + "'"};
    }
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "cloak";
    }
    if (const char* homeEnv = std::getenv("HOME")) {
        return std::filesystem::path(homeEnv) / ".config" / "cloak";
    }
    return std::filesystem::path("~/.config") / "cloak";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace cloak::config
