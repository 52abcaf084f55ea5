/**
 * @file Digest.hpp
 * @brief SHA-256 and HMAC-SHA-256 helpers over OpenSSL EVP.
 */

#pragma once
#include <string>
#include <optional>

namespace filegate::infrastructure {

class Digest {
public:
    /** @brief Lowercase hex SHA-256 of @p data. */
    static std::string Sha256Hex(const std::string& data);

    /** @brief Lowercase hex SHA-256 of a file's content, or nullopt if it cannot be read. */
    static std::optional<std::string> Sha256FileHex(const std::string& path);

    /** @brief Lowercase hex HMAC-SHA-256 of @p data under @p key. */
    static std::string HmacSha256Hex(const std::string& key, const std::string& data);

    static std::string ToHex(const unsigned char* bytes, std::size_t length);
};

} // namespace filegate::infrastructure
