#pragma once

/**
 * CredentialProvider.hpp
 *
 * Source of the credentials sent to the transfer daemon.
 */

#include <optional>
#include <string>

namespace soulsync::core::transfer {

/**
 * CredentialProvider - supplies the daemon API key on demand
 *
 * Queried before every request, so a key rotated elsewhere in the
 * application takes effect on the next poll.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    /**
     * @return API key, or std::nullopt to send unauthenticated requests
     */
    virtual std::optional<std::string> apiKey() = 0;
};

/**
 * Fixed key read from configuration
 */
class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(std::string key) : m_key(std::move(key)) {}

    std::optional<std::string> apiKey() override {
        if (m_key.empty()) return std::nullopt;
        return m_key;
    }

private:
    std::string m_key;
};

} // namespace soulsync::core::transfer
