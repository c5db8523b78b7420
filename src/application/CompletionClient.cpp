/**
 * @file CompletionClient.cpp
 * @brief Implementation of CompletionClient.
 */

#include "application/CompletionClient.hpp"
#include "domain/AuditErrors.hpp"
#include "infrastructure/Utf8.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace invoiceauditor::application {

using json = nlohmann::json;
using domain::AttemptOutcome;
using domain::RetryDecision;

namespace {

constexpr std::size_t kLoggedReplyLimit = 500;

std::string AttemptLabel(int attempt, int maxAttempts) {
    return std::to_string(attempt) + "/" + std::to_string(maxAttempts);
}

} // namespace

RetryDecision DecideRetry(AttemptOutcome outcome, int attempt, int timeoutsSoFar, const RetryPolicy& policy) {
    if (outcome == AttemptOutcome::Success) {
        return {RetryDecision::Action::Accept, std::chrono::milliseconds(0)};
    }
    if (attempt >= policy.maxAttempts) {
        return {RetryDecision::Action::Fail, std::chrono::milliseconds(0)};
    }
    switch (outcome) {
        case AttemptOutcome::AuthExpired:
            return {RetryDecision::Action::RetryImmediately, std::chrono::milliseconds(0)};
        case AttemptOutcome::Timeout:
            return {RetryDecision::Action::RetryAfterDelay, policy.timeoutBackoffStep * std::max(1, timeoutsSoFar)};
        case AttemptOutcome::OtherFailure:
        default:
            return {RetryDecision::Action::RetryAfterDelay, policy.failureDelay};
    }
}

CompletionClient::CompletionClient(std::shared_ptr<domain::CompletionGateway> gateway,
                                   std::shared_ptr<CredentialBroker> broker,
                                   std::string model,
                                   RetryPolicy policy,
                                   Sleeper sleeper)
    : m_gateway(std::move(gateway)),
      m_broker(std::move(broker)),
      m_model(std::move(model)),
      m_policy(policy),
      m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string CompletionClient::BuildPrompt(const std::string& text) {
    std::ostringstream ss;
    ss << "Ты эксперт по аудиту счетов-фактур. Извлеки данные из текста счет-фактуры.\n\n"
       << "ВАЖНО: Верни ТОЛЬКО валидный JSON без дополнительного текста, комментариев, markdown или пояснений!\n\n"
       << "ФОРМАТ ОТВЕТА:\n"
       << "{\n"
       << "  \"invoice_number\": \"строка\",\n"
       << "  \"date\": \"YYYY-MM-DD\",\n"
       << "  \"supplier\": \"название организации\",\n"
       << "  \"buyer\": \"название организации\",\n"
       << "  \"amount\": число,\n"
       << "  \"vat\": число,\n"
       << "  \"vat_rate\": число,\n"
       << "  \"contract_number\": \"строка или null\",\n"
       << "  \"payment_date\": \"YYYY-MM-DD или null\",\n"
       << "  \"meter_number\": \"строка или null\"\n"
       << "}\n\n"
       << "ПРАВИЛА:\n"
       << "- invoice_number - номер счет-фактуры\n"
       << "- date - дата выставления счет-фактуры (формат YYYY-MM-DD)\n"
       << "- supplier - организация, выставившая счет\n"
       << "- buyer - организация, получившая счет\n"
       << "- amount - сумма БЕЗ НДС (число без кавычек)\n"
       << "- vat - сумма НДС (число без кавычек)\n"
       << "- vat_rate - ставка НДС в процентах (число без кавычек, например 20)\n"
       << "- Если данные не найдены, используй null\n"
       << "- НЕ добавляй пояснения, комментарии или дополнительный текст\n\n"
       << "ТЕКСТ СЧЕТ-ФАКТУРЫ:\n"
       << infrastructure::Utf8::Truncate(text, kPromptTextLimit) << "\n\n"
       << "JSON:";
    return ss.str();
}

std::string CompletionClient::buildRequest(const std::string& prompt) const {
    json requestData = {
        {"model", m_model},
        {"messages", json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", kTemperature},
        {"max_tokens", kMaxTokens}
    };
    return requestData.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string CompletionClient::ReadReplyContent(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        const auto& content = parsed.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            throw domain::TransportError("Reply content is not a string");
        }
        return content.get<std::string>();
    } catch (const json::exception& e) {
        throw domain::TransportError(std::string("Malformed completion reply: ") + e.what());
    }
}

domain::CompletionResult CompletionClient::extract(const std::string& normalizedText) {
    m_attempts.clear();
    const std::string request = buildRequest(BuildPrompt(normalizedText));

    int timeouts = 0;
    for (int attempt = 1; attempt <= m_policy.maxAttempts; ++attempt) {
        const std::string label = AttemptLabel(attempt, m_policy.maxAttempts);
        AttemptOutcome outcome = AttemptOutcome::OtherFailure;
        std::optional<domain::InvoiceRecord> record;
        std::optional<domain::TransportError> transportFailure;
        std::string replyText;

        // AuthError from the broker is a configuration problem and escapes the loop;
        // a timed-out or failed exchange is retried like a failed completion.
        try {
            const std::string token = m_broker->token();
            auto reply = m_gateway->postCompletion(token, request);
            if (reply.httpStatus == 401) {
                outcome = AttemptOutcome::AuthExpired;
                std::cerr << "[CompletionClient] Credential expired, refreshing..." << std::endl;
                m_broker->invalidate();
            } else if (reply.httpStatus != 200) {
                throw domain::TransportError("HTTP Error " + std::to_string(reply.httpStatus) + ": " + reply.body);
            } else {
                replyText = ReadReplyContent(reply.body);
                std::cout << "[CompletionClient] Reply received (" << infrastructure::Utf8::Length(replyText)
                          << " chars)" << std::endl;

                auto recovery = m_parser.Recover(replyText);
                if (recovery.record.IsEmpty()) {
                    std::cerr << "[CompletionClient] Empty result (attempt " << label << ")" << std::endl;
                } else {
                    std::cout << "[CompletionClient] Record recovered via " << TierToString(recovery.tier)
                              << " tier" << std::endl;
                    outcome = AttemptOutcome::Success;
                    record = std::move(recovery.record);
                }
            }
        } catch (const domain::TimeoutError& e) {
            outcome = AttemptOutcome::Timeout;
            ++timeouts;
            std::cerr << "[CompletionClient] Timeout (" << label << "): " << e.what() << std::endl;
        } catch (const domain::TransportError& e) {
            outcome = AttemptOutcome::OtherFailure;
            transportFailure = e;
            std::cerr << "[CompletionClient] Error (" << label << "): " << e.what() << std::endl;
        }

        m_attempts.push_back({attempt, outcome});
        const auto decision = DecideRetry(outcome, attempt, timeouts, m_policy);
        if (outcome != AttemptOutcome::Success) {
            std::cerr << "[CompletionClient] Attempt " << label << ": " << domain::OutcomeToString(outcome)
                      << std::endl;
        }

        switch (decision.action) {
            case RetryDecision::Action::Accept:
                return *record;
            case RetryDecision::Action::RetryImmediately:
                continue;
            case RetryDecision::Action::RetryAfterDelay:
                m_sleeper(decision.delay);
                continue;
            case RetryDecision::Action::Fail:
                break;
        }

        if (outcome == AttemptOutcome::OtherFailure) {
            if (transportFailure) {
                throw *transportFailure;
            }
            std::cerr << "[CompletionClient] Raw reply: "
                      << infrastructure::Utf8::Truncate(replyText, kLoggedReplyLimit) << std::endl;
            domain::DiagnosticFailure failure;
            failure.rawReply = replyText;
            failure.sourceSample = infrastructure::Utf8::Truncate(normalizedText, kDiagnosticTextLimit);
            return failure;
        }
        break;
    }

    throw domain::CompletionExhausted("No answer after " + std::to_string(m_policy.maxAttempts) + " attempts");
}

} // namespace invoiceauditor::application
