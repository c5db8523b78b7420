#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/TextNormalizer.hpp"

using invoiceauditor::application::TextNormalizer;

int main() {
    std::cout << "[Test] Starting TextNormalizer Test..." << std::endl;

    // Inter-letter spacing inside Cyrillic runs
    assert(TextNormalizer::CollapseLetterSpacing("С ч е т") == "Счет");
    assert(TextNormalizer::CollapseLetterSpacing("И Т О Г О:") == "ИТОГО:");
    assert(TextNormalizer::CollapseLetterSpacing("Invoice No 5") == "Invoice No 5");
    assert(TextNormalizer::CollapseLetterSpacing("Сумма 100 руб") == "Сумма 100 руб");
    std::cout << "[PASS] Letter spacing collapsed only between Cyrillic letters." << std::endl;

    // Punctuation
    assert(TextNormalizer::RemoveSpaceBeforePunctuation("Итого , 100 .") == "Итого, 100.");
    assert(TextNormalizer::RemoveSpaceBeforePunctuation("a ;b  :c") == "a;b:c");
    std::cout << "[PASS] Spaces before punctuation removed." << std::endl;

    // Split tokens
    assert(TextNormalizer::RepairSplitTokens("500 р уб") == "500 руб");
    assert(TextNormalizer::RepairSplitTokens("э лектроэ нергия") == "электроэнергия");
    assert(TextNormalizer::RepairSplitTokens("сч ё т") == "счёт");
    assert(TextNormalizer::RepairSplitTokens("о снабжение") == "оснабжение");
    assert(TextNormalizer::RepairSplitTokens("о т 01.02") == "от 01.02");
    assert(TextNormalizer::RepairSplitTokens("5о т") == "5о т");
    assert(TextNormalizer::RepairSplitTokens("о т7") == "о т7");
    std::cout << "[PASS] Known split tokens repaired, digit guard honoured." << std::endl;

    // Collapse and trim
    assert(TextNormalizer::CollapseSpaces("a    b  c") == "a b c");
    assert(TextNormalizer::Trim(" \t abc \n") == "abc");
    assert(TextNormalizer::Trim("   ").empty());

    // Full pipeline
    assert(TextNormalizer::Normalize("С ч е т № 15 о т 01.02.2024") == "Счет № 15 от 01.02.2024");
    assert(TextNormalizer::Normalize("  ООО   Ромашка  ,  ИНН 123  ") == "ОООРомашка, ИНН 123");
    assert(TextNormalizer::Normalize("Invoice  total :  42") == "Invoice total: 42");
    assert(TextNormalizer::Normalize("").empty());
    std::cout << "[PASS] Normalize applies the rules in order." << std::endl;

    // Invalid UTF-8 passes through
    const std::string invalid = "\xFF abc \xD0";
    assert(TextNormalizer::Normalize(invalid) == invalid);

    // Idempotence
    const std::vector<std::string> samples = {
        "С ч е т - ф а к т у р а   № 7 о т 1 2 . 0 3",
        "Э л е к т р о э н е р г и я ,  р уб .",
        "  Поставщик :  ООО  \"Э нерго\"\n\nПокупатель  :  ИП  Петров ",
        "5о т 6 сч ё т",
        "mixed Latin И кириллица\t\t текст",
        "\xFF\xFE Ж  ж \xC3",
        ""
    };
    for (const auto& sample : samples) {
        const std::string once = TextNormalizer::Normalize(sample);
        const std::string twice = TextNormalizer::Normalize(once);
        assert(once == twice && "Normalize must be idempotent");
    }
    std::cout << "[PASS] Normalize is idempotent on " << samples.size() << " samples." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
