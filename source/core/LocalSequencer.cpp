// ============================================================================
// LocalSequencer - Implementation
// ============================================================================
// Part of the SpeedyInk document model
// ============================================================================

#include "LocalSequencer.h"
#include "InkDocument.h"

#include <QDebug>
#include <algorithm>

// Submit endpoint handed to one replica
class LocalSequencer::ReplicaChannel : public ReplicationChannel {
public:
    ReplicaChannel(LocalSequencer& sequencer, InkDocument* doc)
        : m_sequencer(sequencer), m_doc(doc) {}

    void submit(const InkOperation& op) override { m_sequencer.enqueue(m_doc, op); }

    InkDocument* document() const { return m_doc; }

private:
    LocalSequencer& m_sequencer;
    InkDocument* m_doc;
};

LocalSequencer::LocalSequencer() = default;

LocalSequencer::~LocalSequencer()
{
    // Leave no document pointing at a destroyed channel
    for (const auto& replica : m_replicas) {
        if (replica->document()->channel() == replica.get()) {
            replica->document()->attachChannel(nullptr);
        }
    }
}

void LocalSequencer::connectReplica(InkDocument* doc)
{
    if (!doc) {
        return;
    }
    for (const auto& replica : m_replicas) {
        if (replica->document() == doc) {
            return;
        }
    }
    m_replicas.push_back(std::make_unique<ReplicaChannel>(*this, doc));
    doc->attachChannel(m_replicas.back().get());
}

void LocalSequencer::disconnectReplica(InkDocument* doc)
{
    auto it = std::find_if(m_replicas.begin(), m_replicas.end(),
                           [doc](const std::unique_ptr<ReplicaChannel>& replica) {
                               return replica->document() == doc;
                           });
    if (it == m_replicas.end()) {
        return;
    }
    if (doc->channel() == it->get()) {
        doc->attachChannel(nullptr);
    }
    m_replicas.erase(it);
}

bool LocalSequencer::isConnected(const InkDocument* doc) const
{
    return std::any_of(m_replicas.begin(), m_replicas.end(),
                       [doc](const std::unique_ptr<ReplicaChannel>& replica) {
                           return replica->document() == doc;
                       });
}

void LocalSequencer::inject(const InkOperation& op)
{
    enqueue(nullptr, op);
}

void LocalSequencer::enqueue(const InkDocument* origin, const InkOperation& op)
{
    Entry entry;
    entry.sequenceNumber = m_nextSequence++;
    entry.origin = origin;
    entry.op = op;
    m_pending.push_back(std::move(entry));
}

bool LocalSequencer::deliverNext()
{
    if (m_pending.empty()) {
        return false;
    }

    Entry entry = std::move(m_pending.front());
    m_pending.pop_front();

    // A listener may connect or disconnect replicas during delivery. Replicas
    // connected now wait for the next entry; disconnected ones are skipped.
    std::vector<InkDocument*> targets;
    targets.reserve(m_replicas.size());
    for (const auto& replica : m_replicas) {
        targets.push_back(replica->document());
    }

    for (InkDocument* doc : targets) {
        if (!isConnected(doc)) {
            continue;
        }
        doc->onSequenced(entry.op, doc == entry.origin);
    }

    m_journal.append(std::move(entry));
    return true;
}

int LocalSequencer::deliverAll()
{
    int delivered = 0;
    while (deliverNext()) {
        ++delivered;
    }
    return delivered;
}

void LocalSequencer::replayJournal(InkDocument& doc) const
{
    for (const auto& entry : m_journal) {
        doc.applyOperation(entry.op);
    }
}
