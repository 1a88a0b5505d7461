#include "model.h"

namespace vsx {

// ── Open-slice replacement ──────────────────────────────────────────────
//
// Replacing [from, to) with a slice whose sides are cut open joins the open
// nodes of the slice onto the nodes around the replaced range:
//
//   doc(p("ab|cd"))  replace(3, 3, Slice([p(), p()], 1, 1))  ->  doc(p("ab"), p("cd"))
//
// The depth of $from minus openStart must equal the depth of $to minus
// openEnd, otherwise the slice cannot be stitched in and the replace fails.

namespace {

struct ReplaceState {
    QString error;

    bool fail(const QString& msg) {
        if (error.isEmpty()) error = msg;
        return false;
    }

    bool checkJoin(const NodePtr& main, const NodePtr& sub) {
        if (!sub->compatibleContent(*main))
            return fail(QStringLiteral("cannot join %1 onto %2")
                            .arg(kindToString(sub->kind()), kindToString(main->kind())));
        return true;
    }

    NodePtr joinable(const ResolvedPos& $before, const ResolvedPos& $after, int depth) {
        const NodePtr& node = $before.node(depth);
        if (!checkJoin(node, $after.node(depth))) return {};
        return node;
    }

    NodePtr close(const NodePtr& node, const Fragment& content) {
        if (!node->validContent(content)) {
            fail(QStringLiteral("invalid content for %1").arg(kindToString(node->kind())));
            return {};
        }
        return node->copy(content);
    }

    Fragment replaceOuterContent(const ResolvedPos& $from, const ResolvedPos& $to, const Slice& slice, int depth, bool* ok);
    NodePtr  replaceOuter(const ResolvedPos& $from, const ResolvedPos& $to, const Slice& slice, int depth);
    Fragment replaceThreeWay(const ResolvedPos& $from, const ResolvedPos& $start,
                             const ResolvedPos& $end, const ResolvedPos& $to, int depth, bool* ok);
    Fragment replaceTwoWay(const ResolvedPos& $from, const ResolvedPos& $to, int depth, bool* ok);
};

void addNode(const NodePtr& child, QVector<NodePtr>& target) {
    if (!target.isEmpty() && child->isText() && child->sameMarkup(*target.last()))
        target.last() = child->withText(target.last()->text() + child->text());
    else
        target.append(child);
}

// Adds the children of the shared node at `depth` between the two positions.
// A null position stands for the start/end of that node.
void addRange(const ResolvedPos* $start, const ResolvedPos* $end, int depth, QVector<NodePtr>& target) {
    const NodePtr& node = ($end ? $end : $start)->node(depth);
    int startIndex = 0, endIndex = $end ? $end->index(depth) : node->childCount();
    if ($start) {
        startIndex = $start->index(depth);
        if ($start->depth() > depth) {
            startIndex++;
        } else if ($start->textOffset()) {
            addNode($start->nodeAfter(), target);
            startIndex++;
        }
    }
    for (int i = startIndex; i < endIndex; i++) addNode(node->child(i), target);
    if ($end && $end->depth() == depth && $end->textOffset())
        addNode($end->nodeBefore(), target);
}

struct PreparedSlice {
    ResolvedPos start;
    ResolvedPos end;
};

// Wraps the slice content in copies of $along's ancestors so that its open
// sides can be resolved at the depths they will be joined at
PreparedSlice prepareSliceForReplace(const Slice& slice, const ResolvedPos& $along) {
    int extra = $along.depth() - slice.openStart();
    const NodePtr& parent = $along.node(extra);
    NodePtr node = parent->copy(slice.content());
    for (int i = extra - 1; i >= 0; i--)
        node = $along.node(i)->copy(Fragment::from(node));
    return {node->resolve(slice.openStart() + extra),
            node->resolve(node->content().size() - slice.openEnd() - extra)};
}

NodePtr ReplaceState::replaceOuter(const ResolvedPos& $from, const ResolvedPos& $to,
                                   const Slice& slice, int depth) {
    int index = $from.index(depth);
    const NodePtr& node = $from.node(depth);
    if (index == $to.index(depth) && depth < $from.depth() - slice.openStart()) {
        NodePtr inner = replaceOuter($from, $to, slice, depth + 1);
        if (!inner) return {};
        return node->copy(node->content().replaceChild(index, inner));
    }
    bool ok = true;
    Fragment content = replaceOuterContent($from, $to, slice, depth, &ok);
    if (!ok) return {};
    return close(node, content);
}

Fragment ReplaceState::replaceOuterContent(const ResolvedPos& $from, const ResolvedPos& $to,
                                           const Slice& slice, int depth, bool* ok) {
    if (!slice.content().size())
        return replaceTwoWay($from, $to, depth, ok);

    if (!slice.openStart() && !slice.openEnd() && $from.depth() == depth && $to.depth() == depth) {
        // Flat case: splice the slice straight into the shared parent
        const Fragment& content = $from.parent()->content();
        return content.cut(0, $from.parentOffset())
                      .append(slice.content())
                      .append(content.cut($to.parentOffset()));
    }

    PreparedSlice prepared = prepareSliceForReplace(slice, $from);
    return replaceThreeWay($from, prepared.start, prepared.end, $to, depth, ok);
}

Fragment ReplaceState::replaceThreeWay(const ResolvedPos& $from, const ResolvedPos& $start,
                                       const ResolvedPos& $end, const ResolvedPos& $to,
                                       int depth, bool* ok) {
    NodePtr openStart, openEnd;
    if ($from.depth() > depth && !(openStart = joinable($from, $start, depth + 1))) { *ok = false; return {}; }
    if ($to.depth() > depth && !(openEnd = joinable($end, $to, depth + 1))) { *ok = false; return {}; }

    QVector<NodePtr> content;
    addRange(nullptr, &$from, depth, content);
    if (openStart && openEnd && $start.index(depth) == $end.index(depth)) {
        if (!checkJoin(openStart, openEnd)) { *ok = false; return {}; }
        NodePtr joined = close(openStart, replaceThreeWay($from, $start, $end, $to, depth + 1, ok));
        if (!*ok || !joined) { *ok = false; return {}; }
        addNode(joined, content);
    } else {
        if (openStart) {
            NodePtr left = close(openStart, replaceTwoWay($from, $start, depth + 1, ok));
            if (!*ok || !left) { *ok = false; return {}; }
            addNode(left, content);
        }
        addRange(&$start, &$end, depth, content);
        if (openEnd) {
            NodePtr right = close(openEnd, replaceTwoWay($end, $to, depth + 1, ok));
            if (!*ok || !right) { *ok = false; return {}; }
            addNode(right, content);
        }
    }
    addRange(&$to, nullptr, depth, content);
    return Fragment::fromArray(content);
}

Fragment ReplaceState::replaceTwoWay(const ResolvedPos& $from, const ResolvedPos& $to,
                                     int depth, bool* ok) {
    QVector<NodePtr> content;
    addRange(nullptr, &$from, depth, content);
    if ($from.depth() > depth) {
        NodePtr type = joinable($from, $to, depth + 1);
        if (!type) { *ok = false; return {}; }
        NodePtr joined = close(type, replaceTwoWay($from, $to, depth + 1, ok));
        if (!*ok || !joined) { *ok = false; return {}; }
        addNode(joined, content);
    }
    addRange(&$to, nullptr, depth, content);
    return Fragment::fromArray(content);
}

} // namespace

ReplaceResult Node::replace(int from, int to, const Slice& slice) const {
    if (from < 0 || to < from || to > m_content.size())
        return {false, {}, QStringLiteral("replace range %1-%2 out of bounds").arg(from).arg(to)};

    ResolvedPos $from = resolve(from);
    ResolvedPos $to = resolve(to);
    if (slice.openStart() > $from.depth())
        return {false, {}, QStringLiteral("inserted content deeper than insertion position")};
    if ($from.depth() - slice.openStart() != $to.depth() - slice.openEnd())
        return {false, {}, QStringLiteral("inconsistent open depths")};

    ReplaceState state;
    NodePtr doc = state.replaceOuter($from, $to, slice, 0);
    if (!doc) return {false, {}, state.error};
    return {true, doc, {}};
}

} // namespace vsx
