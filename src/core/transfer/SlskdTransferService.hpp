#pragma once

/**
 * SlskdTransferService.hpp
 *
 * TransferService backed by the slskd REST API (api/v0).
 */

#include "TransferService.hpp"
#include "CredentialProvider.hpp"
#include "../../utils/HttpClient.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace soulsync::core::transfer {

/**
 * Connection settings for slskd
 */
struct SlskdSettings {
    std::string baseUrl{"http://localhost:5030"};
    int timeoutSeconds{15};
    int connectTimeoutSeconds{5};
};

/**
 * SlskdTransferService - slskd client
 *
 * Endpoints:
 * - GET    transfers/downloads
 * - DELETE transfers/downloads/{username}/{id}?remove=true|false
 * - DELETE transfers/downloads/all/completed
 */
class SlskdTransferService : public TransferService {
public:
    SlskdTransferService(SlskdSettings settings,
                         std::shared_ptr<CredentialProvider> credentials);

    std::optional<std::vector<TransferRecord>> listTransfers() override;
    bool cancelTransfer(const std::string& id, const std::string& username, bool remove) override;
    bool clearCompleted() override;

    /**
     * Flatten the per-user / per-directory download payload
     * @param payload Parsed body of GET transfers/downloads
     * @return One record per file, username taken from the enclosing user entry
     */
    static std::vector<TransferRecord> parseTransferList(const nlohmann::json& payload);

    const SlskdSettings& settings() const { return m_settings; }

private:
    std::string endpoint(const std::string& path) const;
    utils::HttpOptions requestOptions() const;

    static bool isAccepted(const utils::HttpResponse& response);

private:
    SlskdSettings m_settings;
    std::shared_ptr<CredentialProvider> m_credentials;
    std::unique_ptr<utils::HttpClient> m_http;
};

} // namespace soulsync::core::transfer
