#pragma once

/**
 * MockTransferService.hpp
 *
 * In-memory TransferService with scripted behaviour, for tests and
 * offline runs of the engine.
 */

#include "TransferService.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace soulsync::core::transfer {

/**
 * MockTransferService - scripted transfer daemon
 *
 * - setRecords() replaces the list returned by listTransfers()
 * - failNextPolls(n) makes the next n polls fail
 * - failNextCancels(n) makes the next n cancel calls fail
 * - successful cancels with remove=true drop the record from the list
 */
class MockTransferService : public TransferService {
public:
    struct CancelCall {
        std::string id;
        std::string username;
        bool remove{false};
        bool accepted{false};
    };

    std::optional<std::vector<TransferRecord>> listTransfers() override;
    bool cancelTransfer(const std::string& id, const std::string& username, bool remove) override;
    bool clearCompleted() override;

    void setRecords(std::vector<TransferRecord> records);
    void upsertRecord(const TransferRecord& record);
    void removeRecord(const std::string& id);
    std::vector<TransferRecord> records() const;

    void failNextPolls(int count);
    void failNextCancels(int count);
    void setCancelAlwaysFails(bool fail);

    size_t listCalls() const;
    size_t clearCalls() const;
    std::vector<CancelCall> cancelCalls() const;
    size_t cancelCallsFor(const std::string& id) const;

private:
    mutable std::mutex m_mutex;
    std::vector<TransferRecord> m_records;
    int m_pollFailures{0};
    int m_cancelFailures{0};
    bool m_cancelAlwaysFails{false};
    size_t m_listCalls{0};
    size_t m_clearCalls{0};
    std::vector<CancelCall> m_cancelCalls;
};

} // namespace soulsync::core::transfer
