/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <type_traits>

namespace invoiceauditor::infrastructure {

namespace {

std::string TrimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) return;
    const auto& value = j[key];
    bool accepted = false;
    if constexpr (std::is_same_v<T, bool>) {
        accepted = value.is_boolean();
    } else if constexpr (std::is_same_v<T, std::string>) {
        accepted = value.is_string();
    } else {
        accepted = value.is_number();
    }
    if (accepted) {
        target = value.get<T>();
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': unexpected type" << std::endl;
    }
}

void ReadEnv(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

} // namespace

AuditorConfig ConfigLoader::Load(const std::string& projectRoot) {
    AuditorConfig config;
    ApplySettingsFile(projectRoot, config);

    std::filesystem::path envPath = std::filesystem::path(projectRoot) / ".env";
    if (std::filesystem::exists(envPath)) {
        const int exported = LoadDotEnv(envPath.string());
        std::cout << "[ConfigLoader] Loaded " << exported << " variable(s) from .env" << std::endl;
    }

    ApplyEnvironment(config);
    return config;
}

bool ConfigLoader::ApplySettingsFile(const std::string& projectRoot, AuditorConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return false;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] settings.json is not an object, ignored" << std::endl;
            return false;
        }
        ApplySettings(j, config);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void ConfigLoader::ApplySettings(const nlohmann::json& settings, AuditorConfig& config) {
    ReadKey(settings, "auth_url", config.authUrl);
    ReadKey(settings, "api_url", config.apiUrl);
    ReadKey(settings, "scope", config.scope);
    ReadKey(settings, "model", config.model);
    ReadKey(settings, "verify_tls", config.verifyTls);
    ReadKey(settings, "auth_timeout_seconds", config.authTimeoutSeconds);
    ReadKey(settings, "completion_timeout_seconds", config.completionTimeoutSeconds);
    ReadKey(settings, "ocr_languages", config.ocrLanguages);
    ReadKey(settings, "tessdata_path", config.tessdataPath);
    ReadKey(settings, "vat_tolerance", config.vatTolerance);
    ReadKey(settings, "default_token_lifetime_minutes", config.defaultTokenLifetimeMinutes);
    ReadKey(settings, "token_refresh_buffer_minutes", config.tokenRefreshBufferMinutes);
}

std::map<std::string, std::string> ConfigLoader::ParseDotEnv(std::istream& in) {
    std::map<std::string, std::string> entries;
    std::string line;
    while (std::getline(in, line)) {
        line = TrimCopy(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = TrimCopy(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = TrimCopy(line.substr(0, eq));
        std::string value = TrimCopy(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            const auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value = TrimCopy(value.substr(0, comment));
            }
        }
        if (!key.empty()) {
            entries[key] = value;
        }
    }
    return entries;
}

int ConfigLoader::LoadDotEnv(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot read " << path << std::endl;
        return 0;
    }

    int exported = 0;
    for (const auto& [key, value] : ParseDotEnv(f)) {
        if (std::getenv(key.c_str()) != nullptr) continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        }
    }
    return exported;
}

void ConfigLoader::ApplyEnvironment(AuditorConfig& config) {
    ReadEnv("GIGACHAT_AUTH_KEY", config.authKey);
    ReadEnv("GIGACHAT_SCOPE", config.scope);
    ReadEnv("GIGACHAT_AUTH_URL", config.authUrl);
    ReadEnv("GIGACHAT_API_URL", config.apiUrl);
    ReadEnv("GIGACHAT_MODEL", config.model);
    ReadEnv("PDF_FILE", config.inputPath);
}

} // namespace invoiceauditor::infrastructure
