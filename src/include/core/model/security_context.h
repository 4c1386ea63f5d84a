#pragma once

#include <string>

namespace lanbeam::core {

struct SecurityContext {
    std::string private_key_pem;
    std::string public_key_pem;
    std::string certificate_pem;
    std::string fingerprint; // SHA-256 of the DER encoded public key, lowercase hex
};

} // namespace lanbeam::core
