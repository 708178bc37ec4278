/**
 * MockTransferService.cpp
 */

#include "MockTransferService.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace soulsync::core::transfer {

std::optional<std::vector<TransferRecord>> MockTransferService::listTransfers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_listCalls;
    if (m_pollFailures > 0) {
        --m_pollFailures;
        return std::nullopt;
    }
    return m_records;
}

bool MockTransferService::cancelTransfer(const std::string& id, const std::string& username, bool remove) {
    std::lock_guard<std::mutex> lock(m_mutex);

    CancelCall call{id, username, remove, false};

    if (m_cancelAlwaysFails) {
        m_cancelCalls.push_back(call);
        return false;
    }
    if (m_cancelFailures > 0) {
        --m_cancelFailures;
        m_cancelCalls.push_back(call);
        return false;
    }

    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const TransferRecord& r) {
        return r.id == id && r.username == username;
    });

    if (it != m_records.end()) {
        if (remove) {
            m_records.erase(it);
        } else if (!utils::StringUtils::startsWith(it->state, "Completed")) {
            it->state = "Completed, Cancelled";
        }
    }

    call.accepted = true;
    m_cancelCalls.push_back(call);
    return true;
}

bool MockTransferService::clearCompleted() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_clearCalls;
    m_records.erase(
        std::remove_if(m_records.begin(), m_records.end(), [](const TransferRecord& r) {
            return utils::StringUtils::startsWith(r.state, "Completed");
        }),
        m_records.end());
    return true;
}

void MockTransferService::setRecords(std::vector<TransferRecord> records) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records = std::move(records);
}

void MockTransferService::upsertRecord(const TransferRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const TransferRecord& r) {
        return r.id == record.id;
    });
    if (it != m_records.end()) {
        *it = record;
    } else {
        m_records.push_back(record);
    }
}

void MockTransferService::removeRecord(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.erase(
        std::remove_if(m_records.begin(), m_records.end(), [&](const TransferRecord& r) {
            return r.id == id;
        }),
        m_records.end());
}

std::vector<TransferRecord> MockTransferService::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

void MockTransferService::failNextPolls(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pollFailures = count;
}

void MockTransferService::failNextCancels(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelFailures = count;
}

void MockTransferService::setCancelAlwaysFails(bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelAlwaysFails = fail;
}

size_t MockTransferService::listCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listCalls;
}

size_t MockTransferService::clearCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clearCalls;
}

std::vector<MockTransferService::CancelCall> MockTransferService::cancelCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelCalls;
}

size_t MockTransferService::cancelCallsFor(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_cancelCalls.begin(), m_cancelCalls.end(),
        [&](const CancelCall& c) { return c.id == id; }));
}

} // namespace soulsync::core::transfer
