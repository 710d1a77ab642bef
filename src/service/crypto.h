#pragma once

#include <string>
#include <vector>

namespace crypto {
    // Hex encoded, length characters
    std::string generateSecureRandomString(size_t length);

    // Alphanumeric password drawn from a base64 alphabet, with '+' and '/' replaced
    std::string generatePassword(size_t length);

    std::string base64Encode(const std::vector<unsigned char> &data);
}
