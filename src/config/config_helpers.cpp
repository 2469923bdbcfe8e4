#include <fstream>
#include <gcrdl/config/config_helpers.h>

namespace gcrdl::config {

ConfigSections parse_config_file(const std::filesystem::path& config_path) {
    ConfigSections sections;
    std::ifstream file(config_path);
    if (!file) {
        return sections;
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

        // Support both "download.max_concurrent" and "[download] max_concurrent"
        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        sections[section][k] = unquote(v);
    }
    return sections;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto sections = parse_config_file(config_path);
    auto s = sections.find(section);
    if (s == sections.end()) {
        return "";
    }
    auto v = s->second.find(key);
    return v == s->second.end() ? "" : v->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("GCRDL_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "gcrdl" / "config.toml";
    }

    return configHome / "gcrdl" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("GCRDL_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "gcrdl";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "gcrdl";
    }
    return std::filesystem::current_path() / "gcrdl_data";
}

} // namespace gcrdl::config
