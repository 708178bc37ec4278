/**
 * ReconciliationCycle.cpp
 */

#include "ReconciliationCycle.hpp"
#include "StatusMapper.hpp"
#include "../Logger.hpp"
#include "../cleanup/CleanupAgent.hpp"
#include "../completion/CompletionDispatcher.hpp"

#include <algorithm>
#include <cmath>

namespace soulsync::core::reconcile {

using queue::DownloadItem;
using queue::DownloadItemPtr;
using queue::DownloadStatus;

ReconciliationCycle::ReconciliationCycle(queue::QueueStore& store,
                                         transfer::TransferService& service,
                                         EventBus& bus,
                                         ReconcileSettings settings,
                                         completion::CompletionDispatcher* dispatcher,
                                         cleanup::CleanupAgent* cleanup)
    : m_store(store)
    , m_service(service)
    , m_bus(bus)
    , m_settings(settings)
    , m_dispatcher(dispatcher)
    , m_cleanup(cleanup) {
}

CycleReport ReconciliationCycle::run() {
    CycleReport report;

    auto items = m_store.snapshotActive();
    report.activeBefore = items.size();

    if (items.empty()) {
        report.idle = true;
        report.finishedAfter = m_store.finishedCount();
        return report;
    }

    auto records = m_service.listTransfers();
    if (!records) {
        Logger::instance().warn("Transfer list unavailable; skipping cycle for {} active downloads",
            items.size());
        report.pollFailed = true;
        report.activeAfter = m_store.activeCount();
        report.finishedAfter = m_store.finishedCount();
        return report;
    }

    // Items already paired by id go first so a filename match on another
    // item cannot take their record
    std::stable_partition(items.begin(), items.end(), [](const DownloadItemPtr& item) {
        return item->remoteTransferId().has_value();
    });

    std::unordered_set<std::string> claimed;
    json changes = json::array();

    {
        // Moves to finished report one size change when the batch closes
        queue::QueueStore::NotificationBatch batch(m_store);

        for (const auto& item : items) {
            // Cancelled or moved since the snapshot was taken
            if (item->isTerminal()) continue;

            auto match = m_matcher.match(*item, *records, claimed);
            if (match) {
                claimed.insert(claimKey(*match->record));
                applyMatch(item, *match, report, changes);
            } else {
                handleMissing(item, report, changes);
            }
        }
    }

    report.activeAfter = m_store.activeCount();
    report.finishedAfter = m_store.finishedCount();

    Logger::instance().debug("Cycle: {} records, {} matched, {} missing, {} transitions, {} active",
        records->size(), report.matched, report.missing, report.transitioned, report.activeAfter);

    m_bus.emit(events::QueueUpdated, {
        {"active", report.activeAfter},
        {"finished", report.finishedAfter},
        {"matched", report.matched},
        {"missing", report.missing},
        {"changes", changes}
    });

    return report;
}

void ReconciliationCycle::applyMatch(const DownloadItemPtr& item,
                                     const MatchResult& match,
                                     CycleReport& report,
                                     json& changes) {
    const auto& record = *match.record;
    ++report.matched;

    const auto mapped = StatusMapper::map(record.state);

    if (StatusMapper::isQueuedGroup(mapped)) {
        if (!item->queueEnteredAt()) {
            item->setQueueEnteredAt(DownloadItem::Clock::now());
        }
    } else {
        item->setQueueEnteredAt(std::nullopt);
    }

    item->resetMissingCount();

    if (!record.id.empty()) {
        auto current = item->remoteTransferId();
        if (!current || *current != record.id) {
            Logger::instance().debug("Download {} paired with transfer {} by {}",
                item->id(), record.id, toString(match.kind));
            item->setRemoteTransferId(record.id);
        }
    }

    if (!record.filename.empty() && record.filename != item->filePath()) {
        item->setFilePath(record.filename);
    }

    const double percent = std::isfinite(record.percentComplete)
        ? std::clamp(record.percentComplete, 0.0, 100.0)
        : 0.0;
    item->updateProgress(static_cast<int>(std::floor(percent)));
    item->setSpeed(record.averageSpeed);

    std::string error;
    if (mapped == DownloadStatus::Failed) {
        error = "Transfer failed remotely (" + record.state + ")";
    }

    if (transition(item, mapped, changes, error)) {
        ++report.transitioned;
        if (queue::isTerminal(mapped)) {
            Logger::instance().info("Download '{}' {} (remote state '{}')",
                item->title(), queue::toString(mapped), record.state);
            route(item);
        }
    }
}

void ReconciliationCycle::handleMissing(const DownloadItemPtr& item,
                                        CycleReport& report,
                                        json& changes) {
    ++report.missing;
    const int missing = item->incrementMissingCount();

    bool timedOut = false;
    if (auto entered = item->queueEnteredAt()) {
        timedOut = DownloadItem::Clock::now() - *entered > m_settings.queueTimeout;
    }
    const bool exhausted = missing >= m_settings.missingCycleLimit;

    if (!timedOut && !exhausted) {
        Logger::instance().debug("Download {} missing from transfer list ({}/{})",
            item->id(), missing, m_settings.missingCycleLimit);
        return;
    }

    const std::string reason = timedOut
        ? "Queued remotely for more than " + std::to_string(m_settings.queueTimeout.count()) + "s"
        : "Transfer missing from daemon for " + std::to_string(missing) + " cycles";

    if (!transition(item, DownloadStatus::Failed, changes, reason)) {
        return;
    }

    ++report.transitioned;
    if (timedOut) {
        ++report.failedTimeout;
    } else {
        ++report.failedMissing;
    }

    Logger::instance().warn("Download '{}' failed: {}", item->title(), reason);
    route(item);
}

bool ReconciliationCycle::transition(const DownloadItemPtr& item,
                                     DownloadStatus newStatus,
                                     json& changes,
                                     const std::string& errorMessage) {
    const bool changed = m_store.atomicTransition(item, newStatus,
        [&changes, &errorMessage](const DownloadItemPtr& target,
                                  DownloadStatus oldStatus,
                                  DownloadStatus status) {
            if (!errorMessage.empty()) {
                target->setErrorMessage(errorMessage);
            }
            changes.push_back({
                {"id", target->id()},
                {"from", queue::toString(oldStatus)},
                {"to", queue::toString(status)}
            });
        });

    // Only the winning transition gets here, so the move happens once
    if (changed && queue::isTerminal(newStatus)) {
        m_store.moveToFinished(item);
    }
    return changed;
}

void ReconciliationCycle::route(const DownloadItemPtr& item) {
    const auto status = item->status();

    if (status == DownloadStatus::Completed && item->runPostProcessing() && m_dispatcher) {
        m_dispatcher->dispatch(item);
    }

    if (m_cleanup && item->remoteTransferId()) {
        m_cleanup->schedule(*item, true);
    }
}

} // namespace soulsync::core::reconcile
