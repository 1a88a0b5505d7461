#pragma once
#include "model.h"

namespace vsx {

// ── StepMap ──

// Records which ranges one edit replaced: (start, oldSize, newSize) triples,
// ordered by start.
class StepMap {
public:
    StepMap() = default;
    explicit StepMap(QVector<int> ranges) : m_ranges(std::move(ranges)) {}
    static StepMap forReplace(int from, int to, int insertedSize) {
        return StepMap({from, to - from, insertedSize});
    }

    // assoc < 0 keeps a position at a replaced range's start on the left side
    MapResult mapResult(int pos, int assoc = 1) const;
    int map(int pos, int assoc = 1) const { return mapResult(pos, assoc).pos; }

    const QVector<int>& ranges() const { return m_ranges; }
    bool isEmpty() const { return m_ranges.isEmpty(); }

private:
    QVector<int> m_ranges;
};

// ── Mapping ──

// Ordered composition of step maps. Appending never rewrites earlier maps.
class Mapping {
public:
    void appendMap(const StepMap& map) { m_maps.append(map); }
    void appendMapping(const Mapping& other) { m_maps += other.m_maps; }

    MapResult mapResult(int pos, int assoc = 1) const;
    int map(int pos, int assoc = 1) const { return mapResult(pos, assoc).pos; }

    const QVector<StepMap>& maps() const { return m_maps; }
    int size() const { return m_maps.size(); }
    bool isEmpty() const { return m_maps.isEmpty(); }

private:
    QVector<StepMap> m_maps;
};

// Maps pos through maps[start..]; deleted is set if any map deleted it
MapResult mapThroughResult(const QVector<StepMap>& maps, int pos, int assoc = 1, int start = 0);

// ── Selection ──

struct Selection {
    int anchor = 0;
    int head   = 0;

    int  from() const  { return qMin(anchor, head); }
    int  to() const    { return qMax(anchor, head); }
    bool empty() const { return anchor == head; }

    Selection map(const Mapping& mapping) const {
        return {mapping.map(anchor), mapping.map(head)};
    }

    bool operator==(const Selection& o) const { return anchor == o.anchor && head == o.head; }
    bool operator!=(const Selection& o) const { return !(*this == o); }

    static Selection cursor(int pos) { return {pos, pos}; }
};

// ── Transaction ──

// Accumulates replace steps over an immutable document. A failed step leaves
// the transaction unchanged and reports the reason.
class Transaction {
public:
    explicit Transaction(NodePtr doc) : m_before(doc), m_doc(std::move(doc)) {}

    const NodePtr& before() const { return m_before; }
    const NodePtr& doc() const    { return m_doc; }
    const Mapping& mapping() const { return m_mapping; }
    bool docChanged() const { return !m_mapping.isEmpty(); }

    bool replace(int from, int to, const Slice& slice, QString* error = nullptr);
    bool deleteRange(int from, int to, QString* error = nullptr) { return replace(from, to, Slice(), error); }
    // Inserts text carrying the marks found at `from`
    bool insertText(int from, int to, const QString& text, QString* error = nullptr);
    // Splits the node at `depth` levels above pos; typeAfter overrides the
    // kind of the innermost node created after the split
    bool split(int pos, int depth = 1, NodeKind typeAfter = NodeKind::Doc, QString* error = nullptr);

    void setSelection(const Selection& sel) { m_selection = sel; m_selectionSet = true; }
    bool selectionSet() const { return m_selectionSet; }
    const Selection& selection() const { return m_selection; }

    void setScrollIntoView(bool on = true) { m_scroll = on; }
    bool scrolledIntoView() const { return m_scroll; }

    // Range of the new document touched by the steps so far
    PosRange changedRange() const { return m_changed; }

private:
    NodePtr   m_before;
    NodePtr   m_doc;
    Mapping   m_mapping;
    Selection m_selection;
    bool      m_selectionSet = false;
    bool      m_scroll       = false;
    PosRange  m_changed{-1, -1};
};

} // namespace vsx
