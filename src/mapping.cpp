#include "mapping.h"
#include <QDebug>

namespace vsx {

// ── StepMap ──

MapResult StepMap::mapResult(int pos, int assoc) const {
    int diff = 0;
    for (int i = 0; i + 2 < m_ranges.size(); i += 3) {
        int start = m_ranges[i];
        if (start > pos) break;
        int oldSize = m_ranges[i + 1], newSize = m_ranges[i + 2], end = start + oldSize;
        if (pos <= end) {
            int side = !oldSize ? assoc : pos == start ? -1 : pos == end ? 1 : assoc;
            int result = start + diff + (side < 0 ? 0 : newSize);
            // Only positions strictly inside replaced content count as deleted
            bool deleted = oldSize > 0 && pos != start && pos != end;
            return {result, deleted};
        }
        diff += newSize - oldSize;
    }
    return {pos + diff, false};
}

// ── Mapping ──

MapResult Mapping::mapResult(int pos, int assoc) const {
    return mapThroughResult(m_maps, pos, assoc);
}

MapResult mapThroughResult(const QVector<StepMap>& maps, int pos, int assoc, int start) {
    bool deleted = false;
    for (int i = start; i < maps.size(); i++) {
        MapResult r = maps[i].mapResult(pos, assoc);
        pos = r.pos;
        if (r.deleted) deleted = true;
    }
    return {pos, deleted};
}

// ── Transaction ──

bool Transaction::replace(int from, int to, const Slice& slice, QString* error) {
    if (from == to && !slice.size()) return true;
    ReplaceResult r = m_doc->replace(from, to, slice);
    if (!r.ok) {
        qWarning() << "[Transaction] replace" << from << to << "failed:" << r.error;
        if (error) *error = r.error;
        return false;
    }
    StepMap map = StepMap::forReplace(from, to, slice.size());
    if (m_changed.from >= 0) {
        m_changed.from = map.map(m_changed.from, -1);
        m_changed.to = map.map(m_changed.to, 1);
        m_changed.from = qMin(m_changed.from, from);
        m_changed.to = qMax(m_changed.to, from + slice.size());
    } else {
        m_changed = {from, from + slice.size()};
    }
    m_mapping.appendMap(map);
    m_doc = r.doc;
    if (m_selectionSet) m_selection = {map.map(m_selection.anchor), map.map(m_selection.head)};
    return true;
}

bool Transaction::insertText(int from, int to, const QString& text, QString* error) {
    if (text.isEmpty()) return deleteRange(from, to, error);
    MarkSet marks = m_doc->resolve(from).marks();
    return replace(from, to, Slice(Fragment::from(Node::text(text, marks)), 0, 0), error);
}

bool Transaction::split(int pos, int depth, NodeKind typeAfter, QString* error) {
    ResolvedPos $pos = m_doc->resolve(pos);
    if (depth < 1 || depth > $pos.depth()) {
        QString msg = QStringLiteral("cannot split %1 levels at depth %2").arg(depth).arg($pos.depth());
        qWarning() << "[Transaction]" << msg;
        if (error) *error = msg;
        return false;
    }
    Fragment before, after;
    for (int d = $pos.depth(), e = $pos.depth() - depth; d > e; d--) {
        const NodePtr& node = $pos.node(d);
        before = Fragment::from(node->copy(before));
        if (d == $pos.depth() && typeAfter != NodeKind::Doc)
            after = Fragment::from(Node::create(typeAfter, after));
        else
            after = Fragment::from(node->copy(after));
    }
    return replace(pos, pos, Slice(before.append(after), depth, depth), error);
}

} // namespace vsx
