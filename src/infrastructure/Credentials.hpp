/**
 * @file Credentials.hpp
 * @brief Identifier generation and one-way password hashing.
 */

#pragma once

#include <string>

namespace staffledger::infrastructure {

class Credentials {
public:
    /**
     * @brief Random RFC 4122 version 4 UUID, lowercase, 36 characters.
     * @throws std::runtime_error if the random source fails.
     */
    static std::string NewId();

    /**
     * @brief Lowercase hex SHA-256 of the UTF-8 password bytes. Unsalted.
     * @throws std::runtime_error if the digest cannot be computed.
     */
    static std::string HashPassword(const std::string& password);

    /** @brief True when HashPassword(password) == digest. */
    static bool VerifyPassword(const std::string& password, const std::string& digest);
};

} // namespace staffledger::infrastructure
