// ============================================================================
// QuadTree - Implementation
// ============================================================================
// Part of the SpeedyInk stroke index
// ============================================================================

#include "QuadTree.h"

#include <QDebug>
#include <algorithm>

// ===== Constructor & Destructor =====

QuadTree::QuadTree(const Rectangle& bounds, int capacity)
    : m_root(std::make_unique<Node>(bounds, 0))
    , m_capacity(std::max(1, capacity))
{
}

QuadTree::~QuadTree() = default;
QuadTree::QuadTree(QuadTree&&) = default;
QuadTree& QuadTree::operator=(QuadTree&&) = default;

// ===== Mutation =====

void QuadTree::insert(const InkPoint& point, const QString& id)
{
    if (!m_root->bounds.containsPoint(point.pos)) {
        qWarning() << "QuadTree: point outside index bounds dropped" << point.pos << id;
        return;
    }
    insertInto(*m_root, point, id);
}

void QuadTree::insertInto(Node& node, const InkPoint& point, const QString& id)
{
    if (auto* leaf = std::get_if<Leaf>(&node.shape)) {
        if (leaf->count < m_capacity || node.depth >= kMaxDepth) {
            addPoint(node, *leaf, point, id);
            return;
        }
        split(node);
    }
    distribute(std::get<Internal>(node.shape), point, id);
}

void QuadTree::addPoint(Node& node, Leaf& leaf, const InkPoint& point, const QString& id)
{
    if (id.isEmpty()) {
        leaf.anonymous.append(point);
    } else {
        auto it = leaf.byId.find(id);
        if (it == leaf.byId.end()) {
            it = leaf.byId.emplace(id, QVector<InkPoint>()).first;
            if (m_idRegistrationListener) {
                m_idRegistrationListener(id, node.bounds, point);
            }
        }
        it->second.append(point);
    }
    ++leaf.count;
}

void QuadTree::split(Node& node)
{
    // Take the leaf storage out before the node turns into an Internal
    Leaf old = std::move(std::get<Leaf>(node.shape));

    const Rectangle& b = node.bounds;
    const qreal halfW = b.width / 2.0;
    const qreal halfH = b.height / 2.0;
    const int childDepth = node.depth + 1;

    // Offsets are relative to this region's origin, not the root
    Internal internal;
    internal.children[NE] = std::make_unique<Node>(Rectangle(b.x + halfW, b.y, halfW, halfH), childDepth);
    internal.children[NW] = std::make_unique<Node>(Rectangle(b.x, b.y, halfW, halfH), childDepth);
    internal.children[SE] = std::make_unique<Node>(Rectangle(b.x + halfW, b.y + halfH, halfW, halfH), childDepth);
    internal.children[SW] = std::make_unique<Node>(Rectangle(b.x, b.y + halfH, halfW, halfH), childDepth);
    node.shape = std::move(internal);

    Internal& children = std::get<Internal>(node.shape);
    for (const auto& p : old.anonymous) {
        distribute(children, p, QString());
    }
    for (const auto& entry : old.byId) {
        for (const auto& p : entry.second) {
            distribute(children, p, entry.first);
        }
    }

    if (m_splitListener) {
        m_splitListener({children.children[NE]->bounds, children.children[NW]->bounds,
                         children.children[SE]->bounds, children.children[SW]->bounds});
    }
}

void QuadTree::distribute(Internal& internal, const InkPoint& point, const QString& id)
{
    for (int q : {NE, NW, SW, SE}) {
        Node& child = *internal.children[q];
        if (child.bounds.containsPoint(point.pos)) {
            insertInto(child, point, id);
            return;
        }
    }
    qWarning() << "QuadTree: no child contained point" << point.pos << id;
}

// ===== Queries =====

void QuadTree::search(const Rectangle& box, const Visitor& visitor) const
{
    searchNode(*m_root, box, visitor);
}

void QuadTree::searchNode(const Node& node, const Rectangle& box, const Visitor& visitor)
{
    const auto isect = node.bounds.intersection(box);
    if (!isect) {
        return;
    }

    if (const auto* internal = std::get_if<Internal>(&node.shape)) {
        for (const auto& child : internal->children) {
            searchNode(*child, *isect, visitor);
        }
        return;
    }

    const Leaf& leaf = std::get<Leaf>(node.shape);
    const QString anonymousId;
    for (const auto& p : leaf.anonymous) {
        if (isect->containsPoint(p.pos) && visitor(p, anonymousId)) {
            break;
        }
    }
    for (const auto& entry : leaf.byId) {
        for (const auto& p : entry.second) {
            if (isect->containsPoint(p.pos) && visitor(p, entry.first)) {
                break;
            }
        }
    }
}

void QuadTree::gatherIntersecting(const Rectangle& box, QVector<Rectangle>& outRects) const
{
    gatherNode(*m_root, box, outRects);
}

void QuadTree::gatherNode(const Node& node, const Rectangle& box, QVector<Rectangle>& outRects)
{
    const auto isect = node.bounds.intersection(box);
    if (!isect) {
        return;
    }

    if (const auto* internal = std::get_if<Internal>(&node.shape)) {
        for (const auto& child : internal->children) {
            gatherNode(*child, *isect, outRects);
        }
    } else {
        outRects.append(*isect);
    }
}

// ===== Diagnostics =====

const Rectangle& QuadTree::bounds() const
{
    return m_root->bounds;
}

bool QuadTree::isLeaf() const
{
    return std::holds_alternative<Leaf>(m_root->shape);
}

int QuadTree::pointCount() const
{
    return pointCountOf(*m_root);
}

int QuadTree::leafCount() const
{
    return leafCountOf(*m_root);
}

int QuadTree::depth() const
{
    return depthOf(*m_root);
}

int QuadTree::pointCountOf(const Node& node)
{
    if (const auto* leaf = std::get_if<Leaf>(&node.shape)) {
        return leaf->count;
    }
    int total = 0;
    for (const auto& child : std::get<Internal>(node.shape).children) {
        total += pointCountOf(*child);
    }
    return total;
}

int QuadTree::leafCountOf(const Node& node)
{
    if (std::holds_alternative<Leaf>(node.shape)) {
        return 1;
    }
    int total = 0;
    for (const auto& child : std::get<Internal>(node.shape).children) {
        total += leafCountOf(*child);
    }
    return total;
}

int QuadTree::depthOf(const Node& node)
{
    if (std::holds_alternative<Leaf>(node.shape)) {
        return node.depth;
    }
    int deepest = node.depth;
    for (const auto& child : std::get<Internal>(node.shape).children) {
        deepest = std::max(deepest, depthOf(*child));
    }
    return deepest;
}
