#pragma once

// ============================================================================
// QuadTree - Quad-partitioned point store for stroke hit testing
// ============================================================================
// Part of the SpeedyInk stroke index
//
// Holds every appended ink point, optionally tagged with the id of the stroke
// that owns it. A leaf region splits into four quadrants once it holds
// `capacity` points; its points are redistributed into the children and the
// leaf storage is dropped. A single stroke's points may end up spread across
// many leaves.
//
// The tree is a pure data structure. InkDocument is the only writer.
// ============================================================================

#include "../geometry/Rectangle.h"
#include "../strokes/InkPoint.h"

#include <QString>
#include <QVector>
#include <array>
#include <functional>
#include <map>
#include <memory>
#include <variant>

/**
 * @brief Recursive quad-partitioned point store.
 *
 * Each region is either a Leaf (anonymous points plus per-stroke point lists)
 * or an Internal node (exactly four owned children). Points live only in
 * leaves.
 */
class QuadTree {
public:
    static constexpr int kDefaultCapacity = 256;   ///< Points per leaf before it splits
    static constexpr int kMaxDepth = 32;           ///< Leaves this deep accept points past capacity

    /**
     * @brief Search callback. Return true to stop scanning the current point list.
     *
     * @p id is empty for anonymous points.
     */
    using Visitor = std::function<bool(const InkPoint& point, const QString& id)>;

    /// Receives the bounds of the four new children in ne, nw, se, sw order.
    using SplitListener = std::function<void(const QVector<Rectangle>& children)>;

    /// Called the first time a leaf records a point for @p id.
    using IdRegistrationListener =
        std::function<void(const QString& id, const Rectangle& leafBounds, const InkPoint& point)>;

    explicit QuadTree(const Rectangle& bounds, int capacity = kDefaultCapacity);
    ~QuadTree();

    QuadTree(const QuadTree&) = delete;
    QuadTree& operator=(const QuadTree&) = delete;
    QuadTree(QuadTree&&);
    QuadTree& operator=(QuadTree&&);

    // ===== Mutation =====

    /**
     * @brief Add a point, splitting the target leaf first if it is full.
     * @param point The point to index.
     * @param id Owning stroke id, or empty for an anonymous point.
     *
     * Points outside the root bounds, or that fit no child during a split,
     * are logged and dropped.
     */
    void insert(const InkPoint& point, const QString& id = QString());

    // ===== Queries =====

    /**
     * @brief Visit every indexed point inside @p box.
     *
     * The visitor's return value stops only the list currently being scanned
     * (the anonymous list of a leaf, or one stroke's list within a leaf).
     * Other lists and leaves are still visited.
     */
    void search(const Rectangle& box, const Visitor& visitor) const;

    /**
     * @brief Append, for every leaf intersecting @p box, the intersecting part.
     * @param box Query rectangle (e.g. the viewport).
     * @param outRects Receives sub-rectangles that tile box ∩ bounds().
     */
    void gatherIntersecting(const Rectangle& box, QVector<Rectangle>& outRects) const;

    // ===== Observers =====

    void setSplitListener(SplitListener listener) { m_splitListener = std::move(listener); }
    void setIdRegistrationListener(IdRegistrationListener listener) {
        m_idRegistrationListener = std::move(listener);
    }

    // ===== Diagnostics =====

    const Rectangle& bounds() const;
    int capacity() const { return m_capacity; }
    bool isLeaf() const;
    int pointCount() const;     ///< Total points across all leaves
    int leafCount() const;
    int depth() const;          ///< Depth of the deepest leaf (root leaf = 0)

private:
    struct Node;

    enum Quadrant { NE = 0, NW = 1, SE = 2, SW = 3 };

    struct Leaf {
        QVector<InkPoint> anonymous;
        std::map<QString, QVector<InkPoint>> byId;
        int count = 0;
    };

    struct Internal {
        std::array<std::unique_ptr<Node>, 4> children;   ///< Indexed by Quadrant
    };

    struct Node {
        Rectangle bounds;
        int depth = 0;
        std::variant<Leaf, Internal> shape;

        Node(const Rectangle& r, int d) : bounds(r), depth(d), shape(Leaf{}) {}
    };

    void insertInto(Node& node, const InkPoint& point, const QString& id);
    void addPoint(Node& node, Leaf& leaf, const InkPoint& point, const QString& id);
    void split(Node& node);
    void distribute(Internal& internal, const InkPoint& point, const QString& id);

    static void searchNode(const Node& node, const Rectangle& box, const Visitor& visitor);
    static void gatherNode(const Node& node, const Rectangle& box, QVector<Rectangle>& outRects);
    static int pointCountOf(const Node& node);
    static int leafCountOf(const Node& node);
    static int depthOf(const Node& node);

    std::unique_ptr<Node> m_root;
    int m_capacity = kDefaultCapacity;
    SplitListener m_splitListener;
    IdRegistrationListener m_idRegistrationListener;
};
