#include <drape/config/config_helpers.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cmath>
#include <fstream>

namespace drape::config {

std::optional<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }

    std::map<std::string, std::string> values;
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
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Both "[retrieval] min_similarity" and "retrieval.min_similarity" are accepted
        std::string fullKey = (currentSection.empty() || k.find('.') != std::string::npos)
                                  ? k
                                  : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }

    return values;
}

std::optional<size_t> parse_size(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
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
        return std::filesystem::path("drape") / "config.toml";
    }

    return configHome / "drape" / "config.toml";
}

} // namespace drape::config
