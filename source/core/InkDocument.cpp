// ============================================================================
// InkDocument - Implementation
// ============================================================================
// Part of the SpeedyInk document model
// ============================================================================

#include "InkDocument.h"
#include "ReplicationChannel.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>
#include <QUuid>

// ===== Constructor & Destructor =====

InkDocument::InkDocument(const InkSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    initStrokeIndex();

#ifdef QT_DEBUG
    qDebug() << "InkDocument CREATED:" << this << m_settings.canvasWidth << "x" << m_settings.canvasHeight;
#endif
}

InkDocument::~InkDocument()
{
#ifdef QT_DEBUG
    qDebug() << "InkDocument DESTROYED:" << this << "strokes=" << m_strokes.size();
#endif
}

// ===== Index Management =====

void InkDocument::initStrokeIndex()
{
    m_index = std::make_unique<QuadTree>(
        Rectangle(0, 0, m_settings.canvasWidth, m_settings.canvasHeight),
        m_settings.regionCapacity);
    m_partitions.clear();

    m_index->setIdRegistrationListener(
        [this](const QString& id, const Rectangle& leafBounds, const InkPoint&) {
            m_partitions[id].append(leafBounds);
        });
    m_index->setSplitListener([this](const QVector<Rectangle>& children) {
        if (m_splitListener) {
            m_splitListener(children);
        }
    });
}

void InkDocument::loadIndexFromStrokes()
{
    for (const auto& stroke : m_strokes) {
        for (const auto& p : stroke->points) {
            m_index->insert(p, stroke->id);
        }
    }
}

void InkDocument::setSplitListener(QuadTree::SplitListener listener)
{
    m_splitListener = std::move(listener);
}

// =========================================================================
// Operations
// =========================================================================

const InkStroke* InkDocument::createStroke(const Pen& pen)
{
    CreateStrokeOperation op;
    op.time = QDateTime::currentMSecsSinceEpoch();
    op.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    op.pen = pen;

    // Submit first: a slot on strokeCreated may issue follow-up operations
    submit(op);
    return executeCreateStroke(op);
}

const InkStroke* InkDocument::appendPointToStroke(const InkPoint& point, const QString& strokeId)
{
    StylusOperation op;
    op.point = point;
    op.id = strokeId;

    submit(op);
    return executeStylus(op);
}

void InkDocument::eraseStrokes(const QStringList& ids)
{
    EraseStrokesOperation op;
    op.ids = ids;

    submit(op);
    executeEraseStrokes(op);
}

void InkDocument::clear()
{
    ClearOperation op;
    op.time = QDateTime::currentMSecsSinceEpoch();

    submit(op);
    executeClear(op);
}

QStringList InkDocument::eraseAt(const QPointF& pos)
{
    const QStringList ids = hitTest(Rectangle::at(pos, m_settings.eraserWidth, m_settings.eraserHeight));
    if (!ids.isEmpty()) {
        eraseStrokes(ids);
    }
    return ids;
}

// =========================================================================
// Replication
// =========================================================================

void InkDocument::submit(const InkOperation& op)
{
    if (!m_channel) {
        return;
    }
    ++m_pendingLocal;
    m_channel->submit(op);
}

void InkDocument::applyOperation(const InkOperation& op)
{
    if (const auto* create = std::get_if<CreateStrokeOperation>(&op)) {
        executeCreateStroke(*create);
    } else if (const auto* stylusOp = std::get_if<StylusOperation>(&op)) {
        executeStylus(*stylusOp);
    } else if (const auto* erase = std::get_if<EraseStrokesOperation>(&op)) {
        executeEraseStrokes(*erase);
    } else if (const auto* clearOp = std::get_if<ClearOperation>(&op)) {
        executeClear(*clearOp);
    }
}

void InkDocument::onSequenced(const InkOperation& op, bool isLocal)
{
    ++m_sequencedCount;

    // Local operations were applied when they were issued
    if (isLocal) {
        if (m_pendingLocal > 0) {
            --m_pendingLocal;
        }
        return;
    }
    applyOperation(op);
}

// ===== Apply Path =====

InkStroke* InkDocument::executeCreateStroke(const CreateStrokeOperation& op)
{
    if (InkStroke* existing = findStroke(op.id)) {
        qWarning() << "InkDocument: duplicate createStroke ignored" << op.id;
        return existing;
    }

    auto stroke = std::make_unique<InkStroke>(op.id, op.pen);
    InkStroke* raw = stroke.get();
    m_strokes.push_back(std::move(stroke));
    m_strokeById.insert(raw->id, raw);

    emit strokeCreated(op);
    return raw;
}

InkStroke* InkDocument::executeStylus(const StylusOperation& op)
{
    // The stroke may be gone already if a clear was sequenced first
    InkStroke* stroke = findStroke(op.id);
    if (!stroke) {
        qDebug() << "InkDocument: stylus for unknown stroke ignored" << op.id;
        return nullptr;
    }

    stroke->appendPoint(op.point);
    m_index->insert(op.point, op.id);

    emit stylus(op);
    return stroke;
}

void InkDocument::executeEraseStrokes(const EraseStrokesOperation& op)
{
    for (const QString& id : op.ids) {
        InkStroke* stroke = findStroke(id);
        if (!stroke) {
            qDebug() << "InkDocument: erase of unknown stroke ignored" << id;
            continue;
        }
        stroke->inactive = true;
    }

    emit strokesErased(op);
}

void InkDocument::executeClear(const ClearOperation& op)
{
    m_strokeById.clear();
    m_strokes.clear();
    initStrokeIndex();

    emit cleared(op);
}

// =========================================================================
// Queries
// =========================================================================

InkStroke* InkDocument::findStroke(const QString& id) const
{
    return m_strokeById.value(id, nullptr);
}

const InkStroke* InkDocument::stroke(const QString& id) const
{
    return findStroke(id);
}

QVector<const InkStroke*> InkDocument::strokes() const
{
    QVector<const InkStroke*> result;
    result.reserve(static_cast<int>(m_strokes.size()));
    for (const auto& stroke : m_strokes) {
        result.append(stroke.get());
    }
    return result;
}

void InkDocument::gatherViewportRects(const Rectangle& viewport, QVector<Rectangle>& outRects) const
{
    m_index->gatherIntersecting(viewport, outRects);
}

QStringList InkDocument::hitTest(const Rectangle& box, bool includeInactive) const
{
    QStringList result;
    QSet<QString> seen;

    m_index->search(box, [&](const InkPoint&, const QString& id) {
        if (id.isEmpty()) {
            return false;
        }
        // One hit per stroke list is enough; the rest of the leaf still gets scanned
        if (!seen.contains(id)) {
            seen.insert(id);
            const InkStroke* stroke = findStroke(id);
            if (stroke && (includeInactive || !stroke->inactive)) {
                result.append(id);
            }
        }
        return true;
    });

    return result;
}

void InkDocument::searchIndex(const Rectangle& box, const QuadTree::Visitor& visitor) const
{
    m_index->search(box, visitor);
}

QVector<Rectangle> InkDocument::partitionsForStroke(const QString& id) const
{
    return m_partitions.value(id);
}

// =========================================================================
// Persistence
// =========================================================================

QJsonObject InkDocument::toJson() const
{
    QJsonObject obj;
    obj["width"] = m_settings.canvasWidth;
    obj["height"] = m_settings.canvasHeight;

    QJsonArray strokesArray;
    for (const auto& stroke : m_strokes) {
        strokesArray.append(stroke->toJson());
    }
    obj["strokes"] = strokesArray;

    return obj;
}

QByteArray InkDocument::snapshot() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

std::unique_ptr<InkDocument> InkDocument::fromJson(const QJsonObject& obj, InkSettings settings)
{
    if (!obj["strokes"].isArray()) {
        qWarning() << "InkDocument: snapshot has no strokes array";
        return nullptr;
    }

    const qreal w = obj["width"].toDouble(settings.canvasWidth);
    const qreal h = obj["height"].toDouble(settings.canvasHeight);
    if (w <= 0.0 || h <= 0.0) {
        qWarning() << "InkDocument: snapshot has invalid extent" << w << h;
        return nullptr;
    }
    settings.canvasWidth = w;
    settings.canvasHeight = h;

    auto doc = std::make_unique<InkDocument>(settings);

    const QJsonArray strokesArray = obj["strokes"].toArray();
    for (const auto& val : strokesArray) {
        auto stroke = std::make_unique<InkStroke>(InkStroke::fromJson(val.toObject()));
        if (stroke->id.isEmpty()) {
            qWarning() << "InkDocument: snapshot stroke without id skipped";
            continue;
        }
        if (doc->m_strokeById.contains(stroke->id)) {
            qWarning() << "InkDocument: duplicate stroke in snapshot skipped" << stroke->id;
            continue;
        }
        doc->m_strokeById.insert(stroke->id, stroke.get());
        doc->m_strokes.push_back(std::move(stroke));
    }

    // The index is derived data; it is never stored
    doc->loadIndexFromStrokes();
    return doc;
}

std::unique_ptr<InkDocument> InkDocument::fromSnapshot(const QByteArray& data, const InkSettings& settings)
{
    QJsonParseError parseError;
    const QJsonDocument json = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "InkDocument: snapshot parse error" << parseError.errorString();
        return nullptr;
    }
    if (!json.isObject()) {
        qWarning() << "InkDocument: snapshot is not a JSON object";
        return nullptr;
    }
    return fromJson(json.object(), settings);
}

bool InkDocument::saveToFile(const QString& path) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Cannot save ink snapshot: failed to open file" << path << file.errorString();
        return false;
    }

    const QByteArray data = snapshot();
    if (file.write(data) != data.size()) {
        qWarning() << "Cannot save ink snapshot: short write" << path << file.errorString();
        return false;
    }
    return true;
}

std::unique_ptr<InkDocument> InkDocument::loadFromFile(const QString& path, const InkSettings& settings)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot load ink snapshot: failed to open file" << path << file.errorString();
        return nullptr;
    }
    return fromSnapshot(file.readAll(), settings);
}
