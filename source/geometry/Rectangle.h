#pragma once

// ============================================================================
// Rectangle - Axis-aligned rectangle used by the stroke index
// ============================================================================
// Containment is half-open so the four quadrants of a split region own their
// shared edges exactly once. QRectF is closed on all sides, which is why the
// index does not use it directly.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QJsonObject>
#include <QtGlobal>
#include <optional>

/**
 * @brief Axis-aligned rectangle with origin (x, y) and size (width, height).
 */
struct Rectangle {
    qreal x = 0.0;
    qreal y = 0.0;
    qreal width = 0.0;
    qreal height = 0.0;

    Rectangle() = default;
    Rectangle(qreal rx, qreal ry, qreal rw, qreal rh)
        : x(rx), y(ry), width(rw), height(rh) {}

    /**
     * @brief Build a box of the given size whose origin is at @p origin.
     *
     * Matches how the eraser positions its search box: the pointer is the
     * top-left corner, not the center.
     */
    static Rectangle at(const QPointF& origin, qreal w, qreal h) {
        return Rectangle(origin.x(), origin.y(), w, h);
    }

    qreal right() const { return x + width; }
    qreal bottom() const { return y + height; }
    qreal area() const { return width * height; }
    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }

    /**
     * @brief Overlapping sub-rectangle, or nullopt.
     * @param other The rectangle to intersect with.
     * @return The intersection when it has positive width and height.
     *
     * Edge-touching rectangles do not intersect.
     */
    std::optional<Rectangle> intersection(const Rectangle& other) const {
        const qreal ix = qMax(x, other.x);
        const qreal iy = qMax(y, other.y);
        const qreal iw = qMin(right(), other.right()) - ix;
        const qreal ih = qMin(bottom(), other.bottom()) - iy;
        if (iw <= 0.0 || ih <= 0.0) {
            return std::nullopt;
        }
        return Rectangle(ix, iy, iw, ih);
    }

    /**
     * @brief Half-open containment: x in [x, x+w), y in [y, y+h).
     */
    bool containsPoint(const QPointF& p) const {
        return p.x() >= x && p.x() < right() &&
               p.y() >= y && p.y() < bottom();
    }

    bool contains(const Rectangle& other) const {
        return other.x >= x && other.y >= y &&
               other.right() <= right() && other.bottom() <= bottom();
    }

    QRectF toRectF() const { return QRectF(x, y, width, height); }

    static Rectangle fromRectF(const QRectF& r) {
        return Rectangle(r.x(), r.y(), r.width(), r.height());
    }

    bool operator==(const Rectangle& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rectangle& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["x"] = x;
        obj["y"] = y;
        obj["width"] = width;
        obj["height"] = height;
        return obj;
    }

    static Rectangle fromJson(const QJsonObject& obj) {
        return Rectangle(obj["x"].toDouble(), obj["y"].toDouble(),
                         obj["width"].toDouble(), obj["height"].toDouble());
    }
};
