#include "infrastructure/RequestId.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace invoiceauditor::infrastructure {

std::string RequestId::Generate() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> byteDist(0, 255);

    std::array<std::uint8_t, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(byteDist(engine));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace invoiceauditor::infrastructure
