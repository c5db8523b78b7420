/**
 * @file ConfigLoader.hpp
 * @brief Static utility for assembling the auditor configuration.
 *
 * Sources, later ones overriding earlier ones: built-in defaults,
 * settings.json in the project root, a .env file, the process environment.
 */

#pragma once

#include <istream>
#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace invoiceauditor::infrastructure {

struct AuditorConfig {
    std::string authUrl = "https://ngw.devices.sberbank.ru:9443/api/v2/oauth";
    std::string apiUrl = "https://gigachat.devices.sberbank.ru/api/v1/chat/completions";
    std::string scope = "GIGACHAT_API_PERS";
    std::string model = "GigaChat";
    std::string authKey;
    bool verifyTls = false;
    int authTimeoutSeconds = 30;
    int completionTimeoutSeconds = 60;
    std::string ocrLanguages = "rus+eng";
    std::string tessdataPath;
    double vatTolerance = 0.01;
    int defaultTokenLifetimeMinutes = 30;
    int tokenRefreshBufferMinutes = 5;
    std::string inputPath = "счет-фактура.pdf";
};

class ConfigLoader {
public:
    /**
     * @brief Full load: defaults, settings.json, .env, environment.
     * @param projectRoot Directory holding settings.json and .env.
     */
    static AuditorConfig Load(const std::string& projectRoot);

    /**
     * @brief Applies settings.json from @p projectRoot onto @p config.
     * @return false if the file is absent or malformed (logged, config untouched).
     */
    static bool ApplySettingsFile(const std::string& projectRoot, AuditorConfig& config);

    /** @brief Applies the recognized keys of a parsed settings object. Wrong-typed keys are skipped. */
    static void ApplySettings(const nlohmann::json& settings, AuditorConfig& config);

    /** @brief Parses KEY=VALUE lines; '#' comments, "export " prefixes and quotes are handled. */
    static std::map<std::string, std::string> ParseDotEnv(std::istream& in);

    /**
     * @brief Exports the entries of @p path into the environment without overriding set variables.
     * @return Number of variables exported.
     */
    static int LoadDotEnv(const std::string& path);

    /** @brief Applies GIGACHAT_* and PDF_FILE environment variables. */
    static void ApplyEnvironment(AuditorConfig& config);
};

} // namespace invoiceauditor::infrastructure
