#pragma once

// ============================================================================
// LocalSequencer - In-process ordering service for InkDocument replicas
// ============================================================================
// Part of the SpeedyInk document model
//
// Assigns a single global order to operations submitted by any connected
// replica and delivers each one to every replica exactly once, flagging the
// originating replica as local. Used by the CLI replay command and by tests
// that simulate several replicas; a networked deployment provides its own
// ReplicationChannel.
//
// Delivery is explicit (deliverNext/deliverAll) so callers control when
// remote operations become visible.
// ============================================================================

#include "InkOperation.h"
#include "ReplicationChannel.h"

#include <QVector>
#include <deque>
#include <memory>
#include <vector>

class InkDocument;

/**
 * @brief Total-order broadcast between InkDocument replicas in one process.
 */
class LocalSequencer {
public:
    /**
     * @brief One sequenced operation.
     */
    struct Entry {
        qint64 sequenceNumber = 0;
        const InkDocument* origin = nullptr;    ///< nullptr for injected operations
        InkOperation op;
    };

    LocalSequencer();
    ~LocalSequencer();

    LocalSequencer(const LocalSequencer&) = delete;
    LocalSequencer& operator=(const LocalSequencer&) = delete;

    /**
     * @brief Attach a replica: its submissions are sequenced here and it
     *        receives every later delivery.
     * @param doc Not owned; must outlive the connection or be disconnected.
     */
    void connectReplica(InkDocument* doc);

    /**
     * @brief Stop delivering to @p doc and detach its channel.
     *
     * Safe to call from a slot during delivery; @p doc receives nothing
     * further, not even the rest of the current entry.
     */
    void disconnectReplica(InkDocument* doc);

    /**
     * @brief Sequence an operation that no connected replica originated.
     *
     * Every replica receives it as remote.
     */
    void inject(const InkOperation& op);

    /**
     * @brief Deliver the oldest pending operation to every replica.
     * @return False if nothing was pending.
     */
    bool deliverNext();

    /**
     * @brief Deliver until the queue is empty, including operations
     *        submitted while delivering.
     * @return Number of operations delivered.
     */
    int deliverAll();

    int pendingCount() const { return static_cast<int>(m_pending.size()); }
    qint64 sequenceNumber() const { return m_nextSequence - 1; }   ///< Last assigned number

    /**
     * @brief Every delivered operation, in global order.
     */
    const QVector<Entry>& journal() const { return m_journal; }

    /**
     * @brief Apply the journal to a replica that was not connected for it.
     */
    void replayJournal(InkDocument& doc) const;

private:
    class ReplicaChannel;

    void enqueue(const InkDocument* origin, const InkOperation& op);
    bool isConnected(const InkDocument* doc) const;

    std::vector<std::unique_ptr<ReplicaChannel>> m_replicas;    ///< Connection order
    std::deque<Entry> m_pending;
    QVector<Entry> m_journal;
    qint64 m_nextSequence = 1;
};
