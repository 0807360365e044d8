#pragma once

// ============================================================================
// ReplicationChannel - Outbound side of the operation ordering service
// ============================================================================
// Part of the SpeedyInk document model
//
// An InkDocument submits every locally issued operation here. The ordering
// service assigns a global order and later calls
// InkDocument::onSequenced(op, isLocal) on every attached replica, exactly
// once per operation.
//
// Ordering contract: operations issued by one replica are delivered in the
// order that replica issued them. This is what guarantees a stroke's
// createStroke is applied before any of its stylus operations.
// ============================================================================

#include "InkOperation.h"

/**
 * @brief Abstract submit endpoint of the replication substrate.
 */
class ReplicationChannel {
public:
    virtual ~ReplicationChannel() = default;

    /**
     * @brief Enqueue an operation for global ordering. Fire and forget.
     */
    virtual void submit(const InkOperation& op) = 0;
};
