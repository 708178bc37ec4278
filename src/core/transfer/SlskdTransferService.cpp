/**
 * SlskdTransferService.cpp
 *
 * slskd REST client for the reconciliation engine.
 */

#include "SlskdTransferService.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace soulsync::core::transfer {

using json = nlohmann::json;
using utils::JsonUtils;

SlskdTransferService::SlskdTransferService(SlskdSettings settings,
                                           std::shared_ptr<CredentialProvider> credentials)
    : m_settings(std::move(settings))
    , m_credentials(std::move(credentials))
    , m_http(std::make_unique<utils::HttpClient>()) {

    while (!m_settings.baseUrl.empty() && m_settings.baseUrl.back() == '/') {
        m_settings.baseUrl.pop_back();
    }

    utils::HttpOptions defaults;
    defaults.timeoutSeconds = m_settings.timeoutSeconds;
    defaults.connectTimeoutSeconds = m_settings.connectTimeoutSeconds;
    defaults.userAgent = "SoulSync-Queue/1.0";
    defaults.headers["Content-Type"] = "application/json";
    m_http->setDefaultOptions(defaults);

    Logger::instance().info("slskd client configured at {}", m_settings.baseUrl);
}

std::optional<std::vector<TransferRecord>> SlskdTransferService::listTransfers() {
    if (m_settings.baseUrl.empty()) {
        Logger::instance().error("slskd URL not configured");
        return std::nullopt;
    }

    auto response = m_http->get(endpoint("transfers/downloads"), requestOptions());

    if (!isAccepted(response)) {
        if (response.isTransportError()) {
            Logger::instance().warn("Transfer list request failed: {}", response.error);
        } else {
            Logger::instance().warn("Transfer list request failed: HTTP {}", response.statusCode);
        }
        return std::nullopt;
    }

    if (utils::StringUtils::trim(response.body).empty()) {
        return std::vector<TransferRecord>{};
    }

    auto payload = JsonUtils::parse(response.body);
    if (!payload) {
        Logger::instance().warn("Transfer list response is not valid JSON ({} bytes)", response.body.size());
        return std::nullopt;
    }

    auto records = parseTransferList(*payload);
    Logger::instance().trace("Parsed {} transfers from slskd", records.size());
    return records;
}

bool SlskdTransferService::cancelTransfer(const std::string& id, const std::string& username, bool remove) {
    if (id.empty() || username.empty()) {
        Logger::instance().warn("Cannot cancel transfer without id and username (id='{}', user='{}')", id, username);
        return false;
    }

    auto options = requestOptions();
    options.query["remove"] = remove ? "true" : "false";

    std::string path = "transfers/downloads/" +
        utils::HttpClient::urlEncode(username) + "/" + utils::HttpClient::urlEncode(id);

    auto response = m_http->del(endpoint(path), options);
    if (!isAccepted(response)) {
        Logger::instance().warn("{} transfer {} for {} failed: HTTP {} {}",
            remove ? "Removing" : "Cancelling", id, username, response.statusCode, response.error);
        return false;
    }

    Logger::instance().debug("{} transfer {} for {}", remove ? "Removed" : "Cancelled", id, username);
    return true;
}

bool SlskdTransferService::clearCompleted() {
    auto response = m_http->del(endpoint("transfers/downloads/all/completed"), requestOptions());
    if (!isAccepted(response)) {
        Logger::instance().error("Failed to clear completed transfers: HTTP {} {}",
            response.statusCode, response.error);
        return false;
    }

    Logger::instance().info("Cleared completed transfers in slskd");
    return true;
}

std::vector<TransferRecord> SlskdTransferService::parseTransferList(const json& payload) {
    std::vector<TransferRecord> records;

    if (!payload.is_array()) {
        return records;
    }

    for (const auto& user : payload) {
        if (!user.is_object()) continue;

        std::string username = JsonUtils::getString(user, "username");

        for (const auto& directory : JsonUtils::getArray(user, "directories")) {
            if (!directory.is_object()) continue;

            for (const auto& file : JsonUtils::getArray(directory, "files")) {
                if (!file.is_object()) continue;

                TransferRecord record;
                record.id = JsonUtils::getIdString(file, "id");
                record.username = JsonUtils::getString(file, "username", username);
                record.filename = JsonUtils::getString(file, "filename");
                record.state = JsonUtils::getString(file, "state");
                record.size = JsonUtils::getLong(file, "size");
                record.bytesTransferred = JsonUtils::getLong(file, "bytesTransferred");
                record.averageSpeed = JsonUtils::getDouble(file, "averageSpeed");

                if (file.contains("percentComplete")) {
                    record.percentComplete = JsonUtils::getDouble(file, "percentComplete");
                } else if (file.contains("progress")) {
                    record.percentComplete = JsonUtils::getDouble(file, "progress");
                } else if (utils::StringUtils::startsWith(
                               utils::StringUtils::toLower(record.state), "completed")) {
                    record.percentComplete = 100.0;
                } else if (record.size > 0) {
                    record.percentComplete = 100.0 * static_cast<double>(record.bytesTransferred) /
                                             static_cast<double>(record.size);
                }

                records.push_back(std::move(record));
            }
        }
    }

    return records;
}

std::string SlskdTransferService::endpoint(const std::string& path) const {
    return m_settings.baseUrl + "/api/v0/" + path;
}

utils::HttpOptions SlskdTransferService::requestOptions() const {
    utils::HttpOptions options;
    if (m_credentials) {
        if (auto key = m_credentials->apiKey()) {
            options.headers["X-API-Key"] = *key;
        }
    }
    return options;
}

bool SlskdTransferService::isAccepted(const utils::HttpResponse& response) {
    return response.statusCode == 200 || response.statusCode == 201 || response.statusCode == 204;
}

} // namespace soulsync::core::transfer
