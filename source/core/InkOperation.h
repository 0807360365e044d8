#pragma once

// ============================================================================
// InkOperation - The replicated operation vocabulary of an InkDocument
// ============================================================================
// Part of the SpeedyInk document model
//
// Every change to an InkDocument is expressed as one of these operations.
// The same operation value is applied locally, submitted to the replication
// channel, and replayed by every other replica.
// ============================================================================

#include "../strokes/InkStroke.h"

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QMetaType>
#include <optional>
#include <variant>

/**
 * @brief Remove every stroke and rebuild the index.
 */
struct ClearOperation {
    qint64 time = 0;        ///< Milliseconds on the originating device
};

/**
 * @brief Create an empty stroke with a replica-independent id.
 */
struct CreateStrokeOperation {
    qint64 time = 0;        ///< Milliseconds on the originating device
    QString id;             ///< Stroke id used by all later stylus operations
    Pen pen;
};

/**
 * @brief Append one point to an existing stroke.
 */
struct StylusOperation {
    InkPoint point;
    QString id;             ///< Target stroke id
};

/**
 * @brief Mark strokes inactive (soft delete).
 */
struct EraseStrokesOperation {
    QStringList ids;
};

Q_DECLARE_METATYPE(ClearOperation)
Q_DECLARE_METATYPE(CreateStrokeOperation)
Q_DECLARE_METATYPE(StylusOperation)
Q_DECLARE_METATYPE(EraseStrokesOperation)

using InkOperation = std::variant<ClearOperation, CreateStrokeOperation,
                                  StylusOperation, EraseStrokesOperation>;

/**
 * @brief Wire name of the operation: "clear", "createStroke", "stylus" or "eraseStrokes".
 */
QString operationType(const InkOperation& op);

/**
 * @brief Serialize an operation to its JSON wire form.
 * @return Object with a "type" field plus the operation payload.
 */
QJsonObject operationToJson(const InkOperation& op);

/**
 * @brief Parse an operation from its JSON wire form.
 * @param obj JSON object produced by operationToJson().
 * @return The operation, or nullopt for an unknown or malformed type.
 */
std::optional<InkOperation> operationFromJson(const QJsonObject& obj);
