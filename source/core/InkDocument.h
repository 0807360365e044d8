#pragma once

// ============================================================================
// InkDocument - Replicated collection of ink strokes
// ============================================================================
// Part of the SpeedyInk document model
//
// InkDocument owns:
// - All strokes, in creation order
// - The QuadTree index over every appended point
// - The partition registry (stroke id → leaf regions that recorded it)
//
// Every mutation is an InkOperation applied through applyOperation(). Local
// calls (createStroke, appendPointToStroke, ...) submit the operation to the
// attached ReplicationChannel and then apply it immediately, so operations
// issued from a slot are sequenced after the one that emitted the signal. Operations
// sequenced by other replicas arrive through onSequenced() and go through the
// same apply path. Local operations are never rolled back.
//
// Signals are emitted after the mutation completes.
// ============================================================================

#include "InkOperation.h"
#include "InkSettings.h"
#include "../index/QuadTree.h"
#include "../strokes/InkStroke.h"

#include <QObject>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QByteArray>
#include <QJsonObject>
#include <memory>
#include <vector>

class ReplicationChannel;

/**
 * @brief The authoritative, replicated store of ink strokes.
 */
class InkDocument : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Create an empty document.
     * @param settings Canvas extent and index tuning; the extent is fixed for
     *                 the lifetime of the document.
     */
    explicit InkDocument(const InkSettings& settings = InkSettings(), QObject* parent = nullptr);
    ~InkDocument() override;

    // =========================================================================
    // Operations (applied locally, then submitted for replication)
    // =========================================================================

    /**
     * @brief Create a new empty stroke with a fresh UUID.
     * @param pen Pen for the stroke. Copied; later changes do not affect it.
     * @return The created stroke. Owned by the document.
     */
    const InkStroke* createStroke(const Pen& pen);

    /**
     * @brief Append a point to a stroke and index it.
     * @param point The point to append.
     * @param strokeId Target stroke.
     * @return The updated stroke, or nullptr if no such stroke exists
     *         (e.g. a clear was applied first). Erased strokes still accept points.
     */
    const InkStroke* appendPointToStroke(const InkPoint& point, const QString& strokeId);

    /**
     * @brief Mark strokes inactive. Points, bounds and index are left untouched.
     */
    void eraseStrokes(const QStringList& ids);

    /**
     * @brief Remove every stroke and rebuild an empty index.
     */
    void clear();

    /**
     * @brief Erase every active stroke hit by the eraser box at @p pos.
     * @param pos Top-left corner of the eraser box (size from InkSettings).
     * @return Ids that were erased. No operation is issued if empty.
     */
    QStringList eraseAt(const QPointF& pos);

    // =========================================================================
    // Replication
    // =========================================================================

    /**
     * @brief The single apply path shared by local execution and replay.
     */
    void applyOperation(const InkOperation& op);

    /**
     * @brief Set the channel that receives locally issued operations.
     * @param channel Not owned. Pass nullptr to detach.
     */
    void attachChannel(ReplicationChannel* channel) { m_channel = channel; }
    ReplicationChannel* channel() const { return m_channel; }

    /**
     * @brief Delivery callback from the ordering service.
     * @param op The sequenced operation.
     * @param isLocal True if this replica issued it (already applied).
     */
    void onSequenced(const InkOperation& op, bool isLocal);

    qint64 sequencedCount() const { return m_sequencedCount; }     ///< Operations delivered so far
    int pendingLocalCount() const { return m_pendingLocal; }       ///< Submitted, not yet sequenced

    // =========================================================================
    // Queries (read-only)
    // =========================================================================

    const InkStroke* stroke(const QString& id) const;
    QVector<const InkStroke*> strokes() const;
    int strokeCount() const { return static_cast<int>(m_strokes.size()); }

    qreal width() const { return m_settings.canvasWidth; }
    qreal height() const { return m_settings.canvasHeight; }
    const InkSettings& settings() const { return m_settings; }

    /**
     * @brief Leaf regions of the index intersecting @p viewport.
     */
    void gatherViewportRects(const Rectangle& viewport, QVector<Rectangle>& outRects) const;

    /**
     * @brief Ids of strokes with an indexed point inside @p box.
     * @param includeInactive Also report erased strokes.
     * @return Unique ids in first-hit order.
     */
    QStringList hitTest(const Rectangle& box, bool includeInactive = false) const;

    void searchIndex(const Rectangle& box, const QuadTree::Visitor& visitor) const;
    const QuadTree& strokeIndex() const { return *m_index; }

    /**
     * @brief Leaf regions in which the stroke's points were first recorded.
     *
     * Includes regions that later split.
     */
    QVector<Rectangle> partitionsForStroke(const QString& id) const;

    /**
     * @brief Observe index splits. Survives clear().
     */
    void setSplitListener(QuadTree::SplitListener listener);

    // =========================================================================
    // Persistence
    // =========================================================================

    QJsonObject toJson() const;

    /**
     * @brief Compact JSON snapshot. Deterministic for equal documents.
     */
    QByteArray snapshot() const;

    /**
     * @brief Build a document from toJson() output, rebuilding the index.
     * @param settings Tuning for the new document; width/height come from @p obj.
     * @return The document, or nullptr if @p obj is malformed.
     */
    static std::unique_ptr<InkDocument> fromJson(const QJsonObject& obj,
                                                 InkSettings settings = InkSettings());
    static std::unique_ptr<InkDocument> fromSnapshot(const QByteArray& data,
                                                     const InkSettings& settings = InkSettings());

    bool saveToFile(const QString& path) const;
    static std::unique_ptr<InkDocument> loadFromFile(const QString& path,
                                                     const InkSettings& settings = InkSettings());

signals:
    void strokeCreated(const CreateStrokeOperation& op);
    void stylus(const StylusOperation& op);
    void strokesErased(const EraseStrokesOperation& op);
    void cleared(const ClearOperation& op);

private:
    void submit(const InkOperation& op);
    void initStrokeIndex();
    void loadIndexFromStrokes();
    InkStroke* findStroke(const QString& id) const;

    InkStroke* executeCreateStroke(const CreateStrokeOperation& op);
    InkStroke* executeStylus(const StylusOperation& op);
    void executeEraseStrokes(const EraseStrokesOperation& op);
    void executeClear(const ClearOperation& op);

    InkSettings m_settings;
    std::vector<std::unique_ptr<InkStroke>> m_strokes;     ///< Creation order
    QHash<QString, InkStroke*> m_strokeById;
    std::unique_ptr<QuadTree> m_index;
    QHash<QString, QVector<Rectangle>> m_partitions;
    QuadTree::SplitListener m_splitListener;

    ReplicationChannel* m_channel = nullptr;
    qint64 m_sequencedCount = 0;
    int m_pendingLocal = 0;
};
