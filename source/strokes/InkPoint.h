#pragma once

// ============================================================================
// InkPoint - A single sampled point of an ink stroke
// ============================================================================
// Part of the SpeedyInk stroke model
// ============================================================================

#include <QPointF>
#include <QJsonObject>
#include <QtGlobal>

/**
 * @brief A single point in a stroke with position, timestamp and pressure.
 *
 * Points are immutable once appended to a stroke. The same value is stored
 * in the stroke and in the spatial index.
 */
struct InkPoint {
    QPointF pos;            ///< Position in canvas coordinates
    qint64 time = 0;        ///< Milliseconds, as reported by the originating device
    qreal pressure = 1.0;   ///< Pen pressure, 0.0 to 1.0

    InkPoint() = default;
    InkPoint(const QPointF& p, qint64 t, qreal pr) : pos(p), time(t), pressure(pr) {}
    InkPoint(qreal x, qreal y, qint64 t = 0, qreal pr = 1.0) : pos(x, y), time(t), pressure(pr) {}

    qreal x() const { return pos.x(); }
    qreal y() const { return pos.y(); }

    bool operator==(const InkPoint& o) const {
        return pos == o.pos && time == o.time && pressure == o.pressure;
    }
    bool operator!=(const InkPoint& o) const { return !(*this == o); }

    /**
     * @brief Serialize to JSON.
     * @return JSON object with x, y, time and pressure fields.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["x"] = pos.x();
        obj["y"] = pos.y();
        obj["time"] = static_cast<double>(time);
        obj["pressure"] = pressure;
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     * @param obj JSON object with x, y and optional time/pressure fields.
     */
    static InkPoint fromJson(const QJsonObject& obj) {
        InkPoint pt;
        pt.pos = QPointF(obj["x"].toDouble(), obj["y"].toDouble());
        pt.time = static_cast<qint64>(obj["time"].toDouble(0));
        pt.pressure = obj["pressure"].toDouble(1.0);  // Default pressure 1.0 if missing
        return pt;
    }
};
