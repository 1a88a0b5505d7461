#include "reconcile.h"
#include <QDebug>
#include <type_traits>

namespace vsx {

// ── View change reconciliation ─────────────────────────────────────────
//
// The platform edits the view behind the editor's back (typing, IME,
// autocorrect). To bring the document in line we:
//
//   1. estimate a document range that must contain the change
//   2. re-parse the view children covering that range
//   3. diff the parse against the batch-start document slice
//   4. map the changed span through edits made earlier in the batch
//   5. replay it as a split, a text insertion or a slice replacement
//
// All positions are computed against the batch-start document and
// selection, since that is what the view was rendered from.

namespace {

bool isAtEnd(const ResolvedPos& $pos, int depth) {
    for (int i = depth; i < $pos.depth(); i++)
        if ($pos.index(i) + 1 < $pos.node(i)->childCount()) return false;
    return $pos.parentOffset() == $pos.parent()->content().size();
}

bool isAtStart(const ResolvedPos& $pos, int depth) {
    for (int i = depth; i < $pos.depth(); i++)
        if ($pos.index(i) > 0) return false;
    return $pos.parentOffset() == 0;
}

// Untracked, non-whitespace siblings appear when the platform splits or
// copies a block (Enter, paste) next to the rendered one
bool hasForeignSibling(const ViewNode* node) {
    const ViewNode* parent = node->parentNode();
    if (!parent) return false;
    for (int i = 0; i < parent->childCount(); i++) {
        const ViewNode* sibling = parent->childAt(i);
        if (sibling == node || sibling->isTracked()) continue;
        if (!sibling->isText() || !sibling->text().trimmed().isEmpty()) return true;
    }
    return false;
}

} // namespace

// ── Range estimation ──

PosRange rangeAroundSelection(const NodePtr& doc, const Selection& sel) {
    ResolvedPos $from = doc->resolve(sel.from());
    ResolvedPos $to = doc->resolve(sel.to());

    // Entirely inside one textblock: a narrow range around it suffices
    if ($from.sameParent($to) && $from.parent()->isTextblock() && $from.parentOffset() > 0
        && $to.parentOffset() < $to.parent()->content().size())
        return rangeAroundComposition(doc, sel, 0);

    for (int depth = 0;; depth++) {
        if (depth >= $from.depth() || depth >= $to.depth()) {
            // An endpoint sits directly in node(depth); take the nodes beside it
            int from = depth < $from.depth() ? $from.before(depth + 1) : $from.pos();
            int to = depth < $to.depth() ? $to.after(depth + 1) : $to.pos();
            if (depth == $from.depth())
                if (NodePtr before = $from.nodeBefore()) from -= before->nodeSize();
            if (depth == $to.depth())
                if (NodePtr after = $to.nodeAfter()) to += after->nodeSize();
            return {from, to};
        }

        bool fromStart = isAtStart($from, depth + 1), toEnd = isAtEnd($to, depth + 1);
        if (fromStart || toEnd || $from.index(depth) != $to.index(depth)
            || $to.node(depth)->isTextblock()) {
            int from = $from.before(depth + 1), to = $to.after(depth + 1);
            const NodePtr& node = $from.node(depth);
            if (fromStart && $from.index(depth) > 0)
                from -= node->child($from.index(depth) - 1)->nodeSize();
            if (toEnd && $to.index(depth) + 1 < node->childCount())
                to += node->child($to.index(depth) + 1)->nodeSize();
            return {from, to};
        }
    }
}

PosRange rangeAroundComposition(const NodePtr& doc, const Selection& sel, int margin) {
    ResolvedPos $from = doc->resolve(sel.from());
    ResolvedPos $to = doc->resolve(sel.to());
    if (!$from.sameParent($to)) return rangeAroundSelection(doc, sel);

    const NodePtr& parent = $from.parent();
    int size = parent->content().size();
    int startOff = qMax(0, $from.parentOffset() - margin);
    int endOff = qMin(size, $to.parentOffset() + margin);

    if (startOff > 0)
        startOff = parent->childBefore(startOff).offset;
    if (endOff < size) {
        Node::ChildInfo after = parent->childAfter(endOff);
        endOff = after.offset + after.node->nodeSize();
    }
    int nodeStart = $from.start();
    return {nodeStart + startOff, nodeStart + endOff};
}

// ── Diffing ──

DiffResult findDiff(const Fragment& a, const Fragment& b, int pos, int preferredStart) {
    int start = findDiffStart(a, b, pos);
    if (start < 0) return {};
    DiffEnd end = findDiffEnd(a, b, pos + a.size(), pos + b.size());
    if (!end.valid) return {};

    int endA = end.a, endB = end.b;
    if (endA < start && a.size() < b.size()) {
        // Prefix and suffix overlap: pure insertion, anchor it on the cursor
        int move = (preferredStart <= start && preferredStart >= endA) ? start - preferredStart : 0;
        start -= move;
        endB = start + (endB - endA);
        endA = start;
    } else if (endB < start) {
        int move = (preferredStart <= start && preferredStart >= endB) ? start - preferredStart : 0;
        start -= move;
        endA = start + (endA - endB);
        endB = start;
    }
    return {start, endA, endB, true};
}

// ── Classification ──

QString uniformTextBetween(const Node& node, int from, int to, bool* ok) {
    QString result;
    bool valid = true, haveMarks = false;
    MarkSet marks;
    node.nodesBetween(from, to, [&](const NodePtr& child, int pos, const Node*, int) {
        if (!child->isInline() && pos < from) return true;
        if (!child->isText()) {
            valid = false;
            return false;
        }
        if (!haveMarks) {
            marks = child->marks();
            haveMarks = true;
        } else if (!sameMarkSet(marks, child->marks())) {
            valid = false;
        }
        int s = qMax(0, from - pos);
        int e = qMin((int)child->text().size(), to - pos);
        if (e > s) result += child->text().mid(s, e - s);
        return true;
    });
    *ok = valid;
    return valid ? result : QString();
}

ChangeDecision classifyChange(const Node& parsed, const DiffResult& change, int base,
                              int mappedFrom, int mappedTo) {
    int size = parsed.content().size();
    ResolvedPos $from = parsed.resolve(change.start - base);
    ResolvedPos $to = parsed.resolve(change.endB - base);

    // A block split whose new block starts exactly where the change ends
    // is what pressing Enter produces
    if (!$from.sameParent($to) && $from.pos() < size && $to.pos() < size) {
        int next = findCursorFrom(parsed.resolve($from.pos() + 1), 1);
        if (next >= 0 && next == $to.pos())
            return change::StructuralSplit{};
    }

    if ($from.sameParent($to) && $from.parent()->isTextblock()) {
        bool uniform = false;
        QString text = uniformTextBetween(parsed, $from.pos(), $to.pos(), &uniform);
        if (uniform)
            return change::UniformText{mappedFrom, mappedTo, text};
    }

    return change::Replacement{mappedFrom, mappedTo,
                               parsed.slice(change.start - base, change.endB - base)};
}

// ── Reconciler ──

Reconciler::Reconciler(const ViewSurface& view, ReplayTarget& target,
                       const ReconcileOptions& options)
    : m_view(view)
    , m_target(target)
    , m_options(options)
{}

bool Reconciler::reconcileAfterInputChange(const Operation& op) {
    return readChange(op, rangeAroundSelection(op.doc, op.sel));
}

bool Reconciler::reconcileAfterComposition(const Operation& op, int margin) {
    return readChange(op, rangeAroundComposition(op.doc, op.sel, margin));
}

Reconciler::ParsedRegion Reconciler::parseBetween(const Operation& op, PosRange range) const {
    const ViewNode* root = m_view.root();
    ViewPoint start = viewPointFromPos(root, range.from, true);
    ViewPoint end = viewPointFromPos(root, range.to, true);

    while (start.node != root && hasForeignSibling(start.node)) {
        ResolvedPos $from = op.doc->resolve(range.from);
        int depth = $from.sharedDepth(range.to);
        if (depth == 0) break;
        range = {$from.before(depth), $from.after(depth)};
        start = viewPointFromPos(root, range.from, true);
        end = viewPointFromPos(root, range.to, true);
    }

    if (start.node != end.node) {
        qWarning() << "[Reconcile] range" << range.from << "-" << range.to
                   << "ends in different view containers, re-reading the whole document";
        range = {0, op.doc->content().size()};
        start = {root, 0};
        end = {root, root->childCount()};
    }

    // Pull in neighbours the platform inserted without tracking info
    const ViewNode* parent = start.node;
    int startOff = start.offset, endOff = end.offset;
    while (startOff > 0 && !parent->childAt(startOff - 1)->isTracked()) --startOff;
    while (endOff < parent->childCount() && !parent->childAt(endOff)->isTracked()) ++endOff;

    NodePtr context = op.doc->resolve(range.from).parent();
    return {m_view.parseRegion(parent, startOff, endOff, *context), range};
}

bool Reconciler::readChange(const Operation& op, const PosRange& estimate) {
    // The view reflects a document that no longer exists; redraw everything
    if (op.docSet) {
        qDebug() << "[Reconcile] document replaced during the batch, discarding view change";
        m_target.markAllDirty();
        return false;
    }

    ParsedRegion parsed = parseBetween(op, estimate);
    const PosRange& range = parsed.range;
    Slice compare = op.doc->slice(range.from, range.to);

    int preferred = op.sel.from();
    if (preferred < range.from || preferred > range.to)
        qDebug() << "[Reconcile] selection" << preferred << "outside re-read range"
                 << range.from << "-" << range.to << ", diff left unanchored";

    DiffResult change = findDiff(compare.content(), parsed.node->content(), range.from, preferred);
    if (!change.valid) return false;
    if (m_options.traceDiffs)
        qDebug() << "[Reconcile] range" << range.from << "-" << range.to << "diff start" << change.start
                 << "endA" << change.endA << "endB" << change.endB;

    MapResult fromMapped = op.mapping.mapResult(change.start);
    MapResult toMapped = op.mapping.mapResult(change.endA);
    if (fromMapped.deleted && toMapped.deleted) {
        qDebug() << "[Reconcile] change at" << change.start << "targets content deleted earlier in the batch";
        return false;
    }

    markDirtyFor(op.doc, change.start, change.endA);

    ChangeDecision decision = classifyChange(*parsed.node, change, range.from,
                                             fromMapped.pos, toMapped.pos);
    std::visit([&](auto&& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, change::StructuralSplit>) {
            if (m_options.traceDiffs) qDebug() << "[Reconcile] replaying as block split";
            m_target.dispatchStructuralSplit();
        } else if constexpr (std::is_same_v<T, change::UniformText>) {
            if (m_options.traceDiffs) qDebug() << "[Reconcile] replaying as text" << c.from << c.to << c.text;
            m_target.insertText(c.from, c.to, c.text, selectionRecovery());
        } else if constexpr (std::is_same_v<T, change::Replacement>) {
            if (m_options.traceDiffs) qDebug() << "[Reconcile] replaying as replacement" << c.from << c.to;
            m_target.applyReplacement(c.from, c.to, c.slice, selectionRecovery(), m_options.scrollIntoView);
        }
    }, decision);
    return true;
}

void Reconciler::markDirtyFor(const NodePtr& doc, int start, int end) {
    ResolvedPos $start = doc->resolve(start);
    ResolvedPos $end = doc->resolve(end);
    int same = $start.sameDepth($end);
    if (same == 0)
        m_target.markAllDirty();
    else
        m_target.markDirty($start.before(same), $start.after(same));
}

SelectionRecovery Reconciler::selectionRecovery() const {
    const ViewSurface* view = &m_view;
    return [view](const NodePtr& doc, bool* ok) -> Selection {
        if (!view->hasFocus()) {
            *ok = false;
            return {};
        }
        return view->selectionFromView(doc, ok);
    };
}

} // namespace vsx
