#pragma once

// ============================================================================
// InkStroke - A complete stroke (pen down → pen up) and the pen it was drawn with
// ============================================================================
// Part of the SpeedyInk stroke model
// ============================================================================

#include "InkPoint.h"

#include <QString>
#include <QVector>
#include <QColor>
#include <QRectF>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <cmath>
#include <limits>

/**
 * @brief Pen description for a stroke. Immutable once the stroke exists.
 */
struct Pen {
    QColor color = QColor(0, 161, 241);   ///< RGBA stroke color
    qreal thickness = 4.0;                ///< Thickness in pixels

    bool operator==(const Pen& o) const {
        return color == o.color && thickness == o.thickness;
    }
    bool operator!=(const Pen& o) const { return !(*this == o); }

    /**
     * @brief Serialize to JSON.
     *
     * Color is written as {r, g, b, a}: channels 0-255, alpha 0.0-1.0.
     */
    QJsonObject toJson() const {
        QJsonObject c;
        c["r"] = color.red();
        c["g"] = color.green();
        c["b"] = color.blue();
        c["a"] = color.alphaF();
        QJsonObject obj;
        obj["color"] = c;
        obj["thickness"] = thickness;
        return obj;
    }

    static Pen fromJson(const QJsonObject& obj) {
        Pen pen;
        const QJsonObject c = obj["color"].toObject();
        pen.color = QColor(c["r"].toInt(0), c["g"].toInt(0), c["b"].toInt(0));
        pen.color.setAlphaF(c["a"].toDouble(1.0));
        pen.thickness = obj["thickness"].toDouble(4.0);
        return pen;
    }
};

/**
 * @brief A stroke: an append-only list of points sharing one pen.
 *
 * loBound/hiBound enclose every point ever appended. They start inverted
 * (+inf / -inf) so the first point sets both, and they are never shrunk.
 * An erased stroke keeps its points and bounds; only @c inactive changes.
 */
struct InkStroke {
    QString id;                     ///< UUID shared by every replica
    QVector<InkPoint> points;       ///< Append-only
    Pen pen;
    QPointF loBound = QPointF(std::numeric_limits<qreal>::infinity(),
                              std::numeric_limits<qreal>::infinity());
    QPointF hiBound = QPointF(-std::numeric_limits<qreal>::infinity(),
                              -std::numeric_limits<qreal>::infinity());
    bool inactive = false;          ///< Soft-delete flag set by eraseStrokes

    InkStroke() = default;
    InkStroke(const QString& strokeId, const Pen& strokePen) : id(strokeId), pen(strokePen) {}

    /**
     * @brief Append a point and widen the bounds to include it.
     */
    void appendPoint(const InkPoint& p) {
        points.append(p);
        if (p.x() > hiBound.x()) {
            hiBound.setX(p.x());
        }
        if (p.y() > hiBound.y()) {
            hiBound.setY(p.y());
        }
        if (p.x() < loBound.x()) {
            loBound.setX(p.x());
        }
        if (p.y() < loBound.y()) {
            loBound.setY(p.y());
        }
    }

    bool isEmpty() const { return points.isEmpty(); }

    /**
     * @brief Bounds as a rectangle, or an empty QRectF if no points were appended.
     */
    QRectF boundingRect() const {
        if (points.isEmpty()) {
            return QRectF();
        }
        return QRectF(loBound, hiBound);
    }

    bool operator==(const InkStroke& o) const {
        return id == o.id && points == o.points && pen == o.pen &&
               loBound == o.loBound && hiBound == o.hiBound && inactive == o.inactive;
    }
    bool operator!=(const InkStroke& o) const { return !(*this == o); }

    /**
     * @brief Serialize to JSON.
     *
     * Bounds of a stroke without points are infinite; JSON has no infinity,
     * so those components are written as null.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["id"] = id;
        QJsonArray pointsArray;
        for (const auto& pt : points) {
            pointsArray.append(pt.toJson());
        }
        obj["points"] = pointsArray;
        obj["pen"] = pen.toJson();
        obj["loBound"] = boundToJson(loBound);
        obj["hiBound"] = boundToJson(hiBound);
        if (inactive) {
            obj["inactive"] = true;
        }
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     * @param obj JSON object containing stroke data.
     *
     * Bounds are taken from the JSON as stored, not recomputed from points.
     */
    static InkStroke fromJson(const QJsonObject& obj) {
        InkStroke stroke;
        stroke.id = obj["id"].toString();   // Empty if missing; callers reject it

        const QJsonArray pointsArray = obj["points"].toArray();
        stroke.points.reserve(pointsArray.size());
        for (const auto& val : pointsArray) {
            stroke.points.append(InkPoint::fromJson(val.toObject()));
        }
        stroke.pen = Pen::fromJson(obj["pen"].toObject());
        stroke.loBound = boundFromJson(obj["loBound"], std::numeric_limits<qreal>::infinity());
        stroke.hiBound = boundFromJson(obj["hiBound"], -std::numeric_limits<qreal>::infinity());
        stroke.inactive = obj["inactive"].toBool(false);
        return stroke;
    }

private:
    static QJsonValue coordToJson(qreal v) {
        return std::isfinite(v) ? QJsonValue(v) : QJsonValue(QJsonValue::Null);
    }

    static QJsonObject boundToJson(const QPointF& p) {
        QJsonObject obj;
        obj["x"] = coordToJson(p.x());
        obj["y"] = coordToJson(p.y());
        return obj;
    }

    static QPointF boundFromJson(const QJsonValue& val, qreal fallback) {
        const QJsonObject obj = val.toObject();
        return QPointF(obj["x"].toDouble(fallback), obj["y"].toDouble(fallback));
    }
};
