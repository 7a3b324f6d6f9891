// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <charconv>
#include <fstream>
#include <docmem/config/config_helpers.h>

namespace docmem::config {

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty()) {
        return std::nullopt;
    }
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<std::string> get_env(const char* name) {
    if (const char* env = std::getenv(name); env && *env) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

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

        // Remove inline comments (outside of quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "queue.fetch_batch_size" and "[queue] fetch_batch_size"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = get_env("DOCMEM_CONFIG")) {
        return expand_tilde(*env);
    }

    if (auto xdg = get_env("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "docmem" / "config.toml";
    }
    if (auto home = get_env("HOME")) {
        return std::filesystem::path(*home) / ".config" / "docmem" / "config.toml";
    }
    return std::filesystem::path("docmem.toml");
}

std::filesystem::path get_data_dir() {
    if (auto xdg = get_env("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "docmem";
    }
    if (auto home = get_env("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "docmem";
    }
    return std::filesystem::current_path() / "docmem_data";
}

} // namespace docmem::config
