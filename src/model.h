#pragma once
#include "core.h"
#include <QJsonObject>
#include <QJsonArray>
#include <QVariantMap>
#include <functional>
#include <memory>

namespace vsx {

class Node;
class Slice;
class ResolvedPos;
using NodePtr = std::shared_ptr<const Node>;

// Return false to skip a node's children
using NodeVisitor = std::function<bool(const NodePtr& node, int pos, const Node* parent, int index)>;

// ── Fragment ──

class Fragment {
public:
    Fragment() = default;

    // Joins adjacent text nodes with the same markup and drops empty text
    static Fragment fromArray(const QVector<NodePtr>& nodes);
    static Fragment from(const NodePtr& node);

    int size() const { return m_size; }
    int childCount() const { return m_content.size(); }
    const NodePtr& child(int index) const { return m_content[index]; }
    NodePtr maybeChild(int index) const {
        return (index >= 0 && index < m_content.size()) ? m_content[index] : NodePtr();
    }
    NodePtr firstChild() const { return maybeChild(0); }
    NodePtr lastChild() const { return maybeChild(m_content.size() - 1); }
    const QVector<NodePtr>& nodes() const { return m_content; }

    Fragment cut(int from, int to = -1) const;
    Fragment append(const Fragment& other) const;
    Fragment replaceChild(int index, const NodePtr& node) const;

    struct Index { int index; int offset; };
    // round > 0 moves a position sitting inside a child to after it
    Index findIndex(int pos, int round = -1) const;

    void nodesBetween(int from, int to, const NodeVisitor& f,
                      int nodeStart = 0, const Node* parent = nullptr) const;

    bool eq(const Fragment& other) const;
    QString textContent() const;
    QString toString() const;

    QJsonArray toJson() const;
    static Fragment fromJson(const QJsonArray& arr, QString* error = nullptr);

private:
    explicit Fragment(QVector<NodePtr> content, int size)
        : m_content(std::move(content)), m_size(size) {}

    QVector<NodePtr> m_content;
    int              m_size = 0;
};

// ── Slice ──

// A piece of a document; openStart/openEnd count the nodes cut open on
// each side.
class Slice {
public:
    Slice() = default;
    Slice(Fragment content, int openStart, int openEnd)
        : m_content(std::move(content)), m_openStart(openStart), m_openEnd(openEnd) {}

    const Fragment& content() const { return m_content; }
    int openStart() const { return m_openStart; }
    int openEnd() const { return m_openEnd; }
    int size() const { return m_content.size() - m_openStart - m_openEnd; }

    bool eq(const Slice& other) const {
        return m_openStart == other.m_openStart && m_openEnd == other.m_openEnd
            && m_content.eq(other.m_content);
    }

    QJsonObject toJson() const;
    static Slice fromJson(const QJsonObject& o, QString* error = nullptr);

private:
    Fragment m_content;
    int      m_openStart = 0;
    int      m_openEnd   = 0;
};

// ── Replace result ──

struct ReplaceResult {
    bool    ok = false;
    NodePtr doc;
    QString error;
};

// ── Node ──

class Node : public std::enable_shared_from_this<Node> {
    struct Private {};
public:
    Node(Private, NodeKind kind, QVariantMap attrs, Fragment content, MarkSet marks, QString text);

    static NodePtr create(NodeKind kind, const Fragment& content = {},
                          const QVariantMap& attrs = {}, const MarkSet& marks = {});
    static NodePtr text(const QString& text, const MarkSet& marks = {});

    NodeKind           kind() const    { return m_kind; }
    const KindMeta&    meta() const    { return *kindMeta(m_kind); }
    const QVariantMap& attrs() const   { return m_attrs; }
    const Fragment&    content() const { return m_content; }
    const MarkSet&     marks() const   { return m_marks; }
    const QString&     text() const    { return m_text; }

    bool isText() const      { return m_kind == NodeKind::Text; }
    bool isInline() const    { return isInlineKind(m_kind); }
    bool isBlock() const     { return isBlockKind(m_kind); }
    bool isTextblock() const { return isTextblockKind(m_kind); }
    bool isLeaf() const      { return isLeafKind(m_kind); }
    bool isAtom() const      { return isLeaf(); }

    int nodeSize() const {
        if (isText()) return m_text.size();
        return isLeaf() ? 1 : m_content.size() + 2;
    }
    int childCount() const { return m_content.childCount(); }
    const NodePtr& child(int index) const { return m_content.child(index); }
    NodePtr maybeChild(int index) const { return m_content.maybeChild(index); }

    NodePtr copy(const Fragment& content) const;
    NodePtr withText(const QString& text) const;
    NodePtr mark(const MarkSet& marks) const;

    NodePtr cut(int from, int to = -1) const;
    Slice   slice(int from, int to = -1) const;
    ResolvedPos resolve(int pos) const;

    struct ChildInfo { NodePtr node; int index; int offset; };
    ChildInfo childAfter(int pos) const;
    ChildInfo childBefore(int pos) const;

    void nodesBetween(int from, int to, const NodeVisitor& f) const {
        m_content.nodesBetween(from, to, f, 0, this);
    }

    bool sameMarkup(const Node& other) const {
        return m_kind == other.m_kind && m_attrs == other.m_attrs && m_marks == other.m_marks;
    }
    bool eq(const Node& other) const;

    // Content of this node may be joined with content of `other`
    bool compatibleContent(const Node& other) const {
        return meta().content == other.meta().content;
    }
    bool validContent(const Fragment& content) const;

    ReplaceResult replace(int from, int to, const Slice& slice) const;

    QString textContent() const;
    QString toString() const;

    QJsonObject toJson() const;
    static NodePtr fromJson(const QJsonObject& o, QString* error = nullptr);

private:
    NodeKind    m_kind;
    QVariantMap m_attrs;
    Fragment    m_content;
    MarkSet     m_marks;
    QString     m_text;
};

// ── ResolvedPos ──

class ResolvedPos {
public:
    ResolvedPos() = default;
    static ResolvedPos resolve(const NodePtr& doc, int pos);

    int pos() const          { return m_pos; }
    int depth() const        { return m_path.size() - 1; }
    int parentOffset() const { return m_parentOffset; }

    const NodePtr& node(int depth) const { return m_path[depth].node; }
    const NodePtr& parent() const        { return m_path.last().node; }
    const NodePtr& doc() const           { return m_path.first().node; }

    int index(int depth) const { return m_path[depth].index; }
    int index() const          { return index(depth()); }

    int start(int depth) const { return depth == 0 ? 0 : m_path[depth - 1].offset + 1; }
    int start() const          { return start(depth()); }
    int end(int depth) const   { return start(depth) + node(depth)->content().size(); }
    int end() const            { return end(depth()); }

    // Position directly before/after the ancestor at `depth` (depth >= 1)
    int before(int depth) const;
    int after(int depth) const;

    int textOffset() const { return m_pos - m_path.last().offset; }
    NodePtr nodeAfter() const;
    NodePtr nodeBefore() const;

    bool sameParent(const ResolvedPos& other) const { return parent() == other.parent(); }
    // Shallowest depth at which the two positions point into different children
    int sameDepth(const ResolvedPos& other) const;
    // Deepest depth whose node contains both this position and `pos`
    int sharedDepth(int pos) const;

    MarkSet marks() const;

private:
    struct Step {
        NodePtr node;
        int     index  = 0;
        int     offset = 0;   // absolute position of the indexed child
    };
    QVector<Step> m_path;
    int           m_pos          = 0;
    int           m_parentOffset = 0;
};

// ── Fragment comparison ──

// First position where a and b differ, or -1 when identical
int findDiffStart(const Fragment& a, const Fragment& b, int pos);

struct DiffEnd { int a = 0; int b = 0; bool valid = false; };
// Last positions (measured from the ends) where a and b differ
DiffEnd findDiffEnd(const Fragment& a, const Fragment& b, int posA, int posB);

// Nearest valid text cursor position from $pos in direction dir (1 or -1),
// or -1 when there is none
int findCursorFrom(const ResolvedPos& pos, int dir);

} // namespace vsx
