#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/CompletionClient.hpp"
#include "application/ConsistencyValidator.hpp"
#include "application/CredentialBroker.hpp"
#include "application/DocumentTextAcquirer.hpp"
#include "application/InvoiceAuditService.hpp"
#include "domain/AuditErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GigaChatGateway.hpp"
#include "infrastructure/ImagePreprocessor.hpp"
#include "infrastructure/MuPdfPageRenderer.hpp"
#include "infrastructure/PopplerPageRenderer.hpp"
#include "infrastructure/PopplerTextLayer.hpp"
#include "infrastructure/ResultWriter.hpp"
#include "infrastructure/TesseractRecognizer.hpp"

namespace fs = std::filesystem;
using namespace invoiceauditor;

namespace {

constexpr const char* kRule = "============================================================";

bool CheckDependencies(const infrastructure::AuditorConfig& config,
                       infrastructure::TesseractRecognizer& recognizer) {
    std::cout << "[Main] Checking dependencies..." << std::endl;
    bool ok = true;

    std::string error;
    if (!recognizer.initialize(error)) {
        std::cerr << "[Main] Tesseract: " << error << std::endl;
        ok = false;
    } else if (!recognizer.hasLanguage("rus")) {
        std::cerr << "[Main] Tesseract: Russian traineddata (rus) not installed" << std::endl;
        ok = false;
    } else {
        std::cout << "[Main] Tesseract: OK" << std::endl;
    }

    if (config.authKey.empty()) {
        std::cerr << "[Main] GIGACHAT_AUTH_KEY is not set (environment or .env)" << std::endl;
        ok = false;
    } else {
        std::cout << "[Main] GigaChat key: OK" << std::endl;
    }
    return ok;
}

void PrintReport(const application::ConsistencyValidator::Report& report) {
    if (report.clean()) {
        std::cout << "[Main] Validation: pass" << std::endl;
        return;
    }
    std::cout << "[Main] Validation: " << report.json.value("status", "pass-with-warnings") << std::endl;
    for (const auto& warning : report.json.value("warnings", nlohmann::json::array())) {
        std::cout << "  - " << warning.get<std::string>() << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::cout << kRule << "\nInvoice Auditor\n" << kRule << std::endl;

    const std::string projectRoot = fs::current_path().string();
    infrastructure::AuditorConfig config = infrastructure::ConfigLoader::Load(projectRoot);
    const std::string inputPath = argc > 1 ? argv[1] : config.inputPath;

    auto recognizer = std::make_shared<infrastructure::TesseractRecognizer>(
        config.ocrLanguages, config.tessdataPath, application::DocumentTextAcquirer::kRenderDpi);
    if (!CheckDependencies(config, *recognizer)) {
        std::cerr << "[Main] Dependency check failed." << std::endl;
        return 1;
    }

    try {
        std::vector<std::shared_ptr<domain::PageRenderer>> renderers = {
            std::make_shared<infrastructure::MuPdfPageRenderer>(),
            std::make_shared<infrastructure::PopplerPageRenderer>()
        };
        auto acquirer = std::make_shared<application::DocumentTextAcquirer>(
            std::make_shared<infrastructure::PopplerTextLayer>(),
            renderers,
            recognizer,
            &infrastructure::ImagePreprocessor::Process);

        infrastructure::GigaChatGateway::Endpoints endpoints;
        endpoints.authUrl = config.authUrl;
        endpoints.apiUrl = config.apiUrl;
        endpoints.authTimeoutSeconds = config.authTimeoutSeconds;
        endpoints.completionTimeoutSeconds = config.completionTimeoutSeconds;
        endpoints.verifyTls = config.verifyTls;
        auto gateway = std::make_shared<infrastructure::GigaChatGateway>(endpoints);

        application::CredentialBroker::Settings brokerSettings;
        brokerSettings.authKey = config.authKey;
        brokerSettings.scope = config.scope;
        brokerSettings.refreshBuffer = std::chrono::minutes(config.tokenRefreshBufferMinutes);
        brokerSettings.defaultLifetime = std::chrono::minutes(config.defaultTokenLifetimeMinutes);
        auto broker = std::make_shared<application::CredentialBroker>(gateway, brokerSettings);

        auto client = std::make_shared<application::CompletionClient>(gateway, broker, config.model);
        application::InvoiceAuditService service(acquirer, client,
                                                 application::ConsistencyValidator(config.vatTolerance));

        application::AuditOutcome outcome = service.audit(inputPath);
        const nlohmann::json result = outcome.ToJson();

        std::cout << kRule << "\nRESULT\n" << kRule << std::endl;
        std::cout << infrastructure::ResultWriter::Render(result) << std::endl;
        if (outcome.report) {
            PrintReport(*outcome.report);
        }

        const std::string outputPath = infrastructure::ResultWriter::ResultPathFor(inputPath, projectRoot);
        infrastructure::ResultWriter::Save(result, outputPath);
        std::cout << "[Main] Saved: " << outputPath << std::endl;
        return 0;
    } catch (const domain::NotFoundError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        std::cerr << "[Main] Pass the document path as the first argument or set PDF_FILE." << std::endl;
        return 1;
    } catch (const domain::AuthError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << std::endl;
        return 1;
    }
}
