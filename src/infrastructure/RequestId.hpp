// RequestId Header
#pragma once
#include <string>

namespace invoiceauditor::infrastructure {

class RequestId {
public:
    /** @brief Random RFC 4122 version-4 identifier, lowercase hex with dashes. */
    static std::string Generate();
};

} // namespace invoiceauditor::infrastructure
