#include <fstream>
#include <mlget/config/config_helpers.h>

namespace mlget::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();
    const std::string dotted = section.empty() ? key : section + "." + key;

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
                in_target_section = (section.empty() || currentSection == section);
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

        // Remove inline comments (not inside a quoted value)
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        if ((in_target_section && k == key) || (currentSection.empty() && k == dotted)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "mlget";
    }
    if (const char* homeEnv = std::getenv("HOME")) {
        return std::filesystem::path(homeEnv) / ".config" / "mlget";
    }
    return std::filesystem::path("~/.config") / "mlget";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("MLGET_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace mlget::config
