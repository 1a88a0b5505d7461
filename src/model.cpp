#include "model.h"
#include <QStringList>
#include <algorithm>

namespace vsx {

// ── Fragment ──

Fragment Fragment::fromArray(const QVector<NodePtr>& nodes) {
    QVector<NodePtr> joined;
    joined.reserve(nodes.size());
    int size = 0;
    for (const auto& node : nodes) {
        if (!node) continue;
        if (node->isText() && node->text().isEmpty()) continue;
        if (!joined.isEmpty() && node->isText() && joined.last()->isText()
            && joined.last()->sameMarkup(*node)) {
            joined.last() = joined.last()->withText(joined.last()->text() + node->text());
        } else {
            joined.append(node);
        }
        size += node->nodeSize();
    }
    return Fragment(std::move(joined), size);
}

Fragment Fragment::from(const NodePtr& node) {
    return node ? fromArray({node}) : Fragment();
}

Fragment Fragment::cut(int from, int to) const {
    if (to < 0) to = m_size;
    if (from == 0 && to == m_size) return *this;
    QVector<NodePtr> result;
    int size = 0;
    if (to > from) {
        for (int i = 0, pos = 0; pos < to; i++) {
            const NodePtr& child = m_content[i];
            int end = pos + child->nodeSize();
            if (end > from) {
                NodePtr piece = child;
                if (pos < from || end > to) {
                    if (child->isText())
                        piece = child->cut(std::max(0, from - pos), std::min<int>(child->text().size(), to - pos));
                    else
                        piece = child->cut(std::max(0, from - pos - 1),
                                           std::min(child->content().size(), to - pos - 1));
                }
                result.append(piece);
                size += piece->nodeSize();
            }
            pos = end;
        }
    }
    return Fragment(std::move(result), size);
}

Fragment Fragment::append(const Fragment& other) const {
    if (!other.m_size && other.m_content.isEmpty()) return *this;
    if (!m_size && m_content.isEmpty()) return other;
    QVector<NodePtr> content = m_content;
    int i = 0;
    const NodePtr& last = content.last();
    const NodePtr& first = other.m_content.first();
    if (last->isText() && first->isText() && last->sameMarkup(*first)) {
        content.last() = last->withText(last->text() + first->text());
        i = 1;
    }
    for (; i < other.m_content.size(); i++) content.append(other.m_content[i]);
    return Fragment(std::move(content), m_size + other.m_size);
}

Fragment Fragment::replaceChild(int index, const NodePtr& node) const {
    const NodePtr& current = m_content[index];
    if (current == node) return *this;
    QVector<NodePtr> copy = m_content;
    int size = m_size + node->nodeSize() - current->nodeSize();
    copy[index] = node;
    return Fragment(std::move(copy), size);
}

Fragment::Index Fragment::findIndex(int pos, int round) const {
    if (pos == 0) return {0, pos};
    if (pos == m_size) return {m_content.size(), pos};
    Q_ASSERT_X(pos > 0 && pos < m_size, "Fragment::findIndex", "position outside of fragment");
    if (pos < 0 || pos > m_size) return {0, 0};
    for (int i = 0, curPos = 0;; i++) {
        int end = curPos + m_content[i]->nodeSize();
        if (end >= pos) {
            if (end == pos || round > 0) return {i + 1, end};
            return {i, curPos};
        }
        curPos = end;
    }
}

void Fragment::nodesBetween(int from, int to, const NodeVisitor& f,
                            int nodeStart, const Node* parent) const {
    for (int i = 0, pos = 0; pos < to && i < m_content.size(); i++) {
        const NodePtr& child = m_content[i];
        int end = pos + child->nodeSize();
        if (end > from && f(child, nodeStart + pos, parent, i) && child->content().size()) {
            int start = pos + 1;
            child->content().nodesBetween(std::max(0, from - start),
                                          std::min(child->content().size(), to - start),
                                          f, nodeStart + start, child.get());
        }
        pos = end;
    }
}

bool Fragment::eq(const Fragment& other) const {
    if (m_content.size() != other.m_content.size()) return false;
    for (int i = 0; i < m_content.size(); i++)
        if (!m_content[i]->eq(*other.m_content[i])) return false;
    return true;
}

QString Fragment::textContent() const {
    QString out;
    for (const auto& child : m_content) out += child->textContent();
    return out;
}

QString Fragment::toString() const {
    QStringList parts;
    for (const auto& child : m_content) parts << child->toString();
    return parts.join(QStringLiteral(", "));
}

QJsonArray Fragment::toJson() const {
    QJsonArray arr;
    for (const auto& child : m_content) arr.append(child->toJson());
    return arr;
}

Fragment Fragment::fromJson(const QJsonArray& arr, QString* error) {
    QVector<NodePtr> nodes;
    for (const auto& v : arr) {
        QString err;
        NodePtr n = Node::fromJson(v.toObject(), &err);
        if (!n) {
            if (error) *error = err;
            return {};
        }
        nodes.append(n);
    }
    return fromArray(nodes);
}

// ── Slice ──

QJsonObject Slice::toJson() const {
    QJsonObject o;
    o["content"]   = m_content.toJson();
    o["openStart"] = m_openStart;
    o["openEnd"]   = m_openEnd;
    return o;
}

Slice Slice::fromJson(const QJsonObject& o, QString* error) {
    return Slice(Fragment::fromJson(o["content"].toArray(), error),
                 o["openStart"].toInt(0), o["openEnd"].toInt(0));
}

// ── Node ──

Node::Node(Private, NodeKind kind, QVariantMap attrs, Fragment content, MarkSet marks, QString text)
    : m_kind(kind)
    , m_attrs(std::move(attrs))
    , m_content(std::move(content))
    , m_marks(std::move(marks))
    , m_text(std::move(text))
{}

NodePtr Node::create(NodeKind kind, const Fragment& content,
                     const QVariantMap& attrs, const MarkSet& marks) {
    QVariantMap a = attrs;
    if (kind == NodeKind::Heading && !a.contains(QStringLiteral("level")))
        a[QStringLiteral("level")] = 1;
    return std::make_shared<const Node>(Private{}, kind, a,
                                        isLeafKind(kind) ? Fragment() : content, marks, QString());
}

NodePtr Node::text(const QString& text, const MarkSet& marks) {
    return std::make_shared<const Node>(Private{}, NodeKind::Text, QVariantMap(),
                                        Fragment(), marks, text);
}

NodePtr Node::copy(const Fragment& content) const {
    if (isText()) return shared_from_this();
    return std::make_shared<const Node>(Private{}, m_kind, m_attrs, content, m_marks, QString());
}

NodePtr Node::withText(const QString& text) const {
    if (text == m_text) return shared_from_this();
    return Node::text(text, m_marks);
}

NodePtr Node::mark(const MarkSet& marks) const {
    if (marks == m_marks) return shared_from_this();
    return std::make_shared<const Node>(Private{}, m_kind, m_attrs, m_content, marks, m_text);
}

NodePtr Node::cut(int from, int to) const {
    if (isText()) {
        if (to < 0) to = m_text.size();
        if (from == 0 && to == m_text.size()) return shared_from_this();
        return withText(m_text.mid(from, to - from));
    }
    if (to < 0) to = m_content.size();
    if (from == 0 && to == m_content.size()) return shared_from_this();
    return copy(m_content.cut(from, to));
}

Slice Node::slice(int from, int to) const {
    if (to < 0) to = m_content.size();
    if (from == to) return Slice();
    ResolvedPos $from = resolve(from);
    ResolvedPos $to = resolve(to);
    int depth = $from.sharedDepth(to);
    int start = $from.start(depth);
    const NodePtr& node = $from.node(depth);
    Fragment content = node->content().cut($from.pos() - start, $to.pos() - start);
    return Slice(content, $from.depth() - depth, $to.depth() - depth);
}

ResolvedPos Node::resolve(int pos) const {
    return ResolvedPos::resolve(shared_from_this(), pos);
}

Node::ChildInfo Node::childAfter(int pos) const {
    Fragment::Index idx = m_content.findIndex(pos);
    return {m_content.maybeChild(idx.index), idx.index, idx.offset};
}

Node::ChildInfo Node::childBefore(int pos) const {
    if (pos == 0) return {NodePtr(), 0, 0};
    Fragment::Index idx = m_content.findIndex(pos);
    if (idx.offset < pos) return {m_content.child(idx.index), idx.index, idx.offset};
    const NodePtr& node = m_content.child(idx.index - 1);
    return {node, idx.index - 1, idx.offset - node->nodeSize()};
}

bool Node::eq(const Node& other) const {
    if (this == &other) return true;
    return sameMarkup(other) && m_text == other.m_text && m_content.eq(other.m_content);
}

bool Node::validContent(const Fragment& content) const {
    ContentKind expr = meta().content;
    for (const auto& child : content.nodes()) {
        const KindMeta& cm = child->meta();
        switch (expr) {
        case ContentKind::None:
            return false;
        case ContentKind::Inline:
            if (cm.group != NodeGroup::Inline) return false;
            break;
        case ContentKind::Text:
            if (!child->isText() || !child->marks().isEmpty()) return false;
            break;
        case ContentKind::Blocks:
            if (cm.group != NodeGroup::Block) return false;
            break;
        case ContentKind::ListItems:
            if (cm.group != NodeGroup::ListItem) return false;
            break;
        }
    }
    return true;
}

QString Node::textContent() const {
    if (isText()) return m_text;
    if (m_kind == NodeKind::HardBreak) return QStringLiteral("\n");
    return m_content.textContent();
}

QString Node::toString() const {
    QString name = QLatin1String(kindToString(m_kind));
    if (isText()) {
        QString s = QLatin1Char('"') + m_text + QLatin1Char('"');
        for (int i = m_marks.size() - 1; i >= 0; i--)
            s = QLatin1String(markToString(m_marks[i].kind)) + QLatin1Char('(') + s + QLatin1Char(')');
        return s;
    }
    if (m_kind == NodeKind::Heading)
        name += m_attrs.value(QStringLiteral("level")).toString();
    if (isLeaf()) return name;
    return name + QLatin1Char('(') + m_content.toString() + QLatin1Char(')');
}

QJsonObject Node::toJson() const {
    QJsonObject o;
    o["type"] = kindToString(m_kind);
    if (isText()) o["text"] = m_text;
    if (!m_attrs.isEmpty()) o["attrs"] = QJsonObject::fromVariantMap(m_attrs);
    if (!m_marks.isEmpty()) {
        QJsonArray marks;
        for (const auto& m : m_marks) {
            QJsonObject mo;
            mo["type"] = markToString(m.kind);
            if (m.kind == MarkKind::Link) mo["href"] = m.href;
            marks.append(mo);
        }
        o["marks"] = marks;
    }
    if (m_content.childCount()) o["content"] = m_content.toJson();
    return o;
}

NodePtr Node::fromJson(const QJsonObject& o, QString* error) {
    bool ok = false;
    NodeKind kind = kindFromString(o["type"].toString(), &ok);
    if (!ok) {
        if (error) *error = QStringLiteral("unknown node type '%1'").arg(o["type"].toString());
        return {};
    }
    MarkSet marks;
    for (const auto& mv : o["marks"].toArray()) {
        QJsonObject mo = mv.toObject();
        bool markOk = false;
        Mark m;
        m.kind = markFromString(mo["type"].toString(), &markOk);
        if (!markOk) {
            if (error) *error = QStringLiteral("unknown mark type '%1'").arg(mo["type"].toString());
            return {};
        }
        m.href = mo["href"].toString();
        marks = addToSet(m, marks);
    }
    if (kind == NodeKind::Text) {
        QString text = o["text"].toString();
        if (text.isEmpty()) {
            if (error) *error = QStringLiteral("empty text node");
            return {};
        }
        return Node::text(text, marks);
    }
    QString err;
    Fragment content = Fragment::fromJson(o["content"].toArray(), &err);
    if (!err.isEmpty()) {
        if (error) *error = err;
        return {};
    }
    NodePtr node = Node::create(kind, content, o["attrs"].toObject().toVariantMap(), marks);
    if (!node->validContent(content)) {
        if (error) *error = QStringLiteral("invalid content for %1").arg(kindToString(kind));
        return {};
    }
    return node;
}

// ── ResolvedPos ──

ResolvedPos ResolvedPos::resolve(const NodePtr& doc, int pos) {
    Q_ASSERT_X(pos >= 0 && pos <= doc->content().size(), "ResolvedPos::resolve",
               "position out of range");
    pos = std::clamp(pos, 0, doc->content().size());

    ResolvedPos r;
    r.m_pos = pos;
    int start = 0, parentOffset = pos;
    for (NodePtr node = doc;;) {
        Fragment::Index idx = node->content().findIndex(parentOffset);
        int rem = parentOffset - idx.offset;
        r.m_path.append({node, idx.index, start + idx.offset});
        if (!rem) break;
        node = node->child(idx.index);
        if (node->isText()) break;
        parentOffset = rem - 1;
        start += idx.offset + 1;
    }
    r.m_parentOffset = parentOffset;
    return r;
}

int ResolvedPos::before(int depth) const {
    Q_ASSERT_X(depth >= 1, "ResolvedPos::before", "no position before the top-level node");
    if (depth < 1) return 0;
    return depth == this->depth() + 1 ? m_pos : m_path[depth - 1].offset;
}

int ResolvedPos::after(int depth) const {
    Q_ASSERT_X(depth >= 1, "ResolvedPos::after", "no position after the top-level node");
    if (depth < 1) return node(0)->content().size();
    return depth == this->depth() + 1 ? m_pos
                                       : m_path[depth - 1].offset + m_path[depth].node->nodeSize();
}

NodePtr ResolvedPos::nodeAfter() const {
    const NodePtr& p = parent();
    int idx = index();
    if (idx == p->childCount()) return {};
    int dOff = textOffset();
    const NodePtr& child = p->child(idx);
    return dOff ? child->cut(dOff) : child;
}

NodePtr ResolvedPos::nodeBefore() const {
    int idx = index();
    int dOff = textOffset();
    if (dOff) return parent()->child(idx)->cut(0, dOff);
    return idx == 0 ? NodePtr() : parent()->child(idx - 1);
}

int ResolvedPos::sameDepth(const ResolvedPos& other) const {
    int depth = 0, max = std::min(this->depth(), other.depth());
    while (depth < max && index(depth) == other.index(depth)) ++depth;
    return depth;
}

int ResolvedPos::sharedDepth(int pos) const {
    for (int depth = this->depth(); depth > 0; depth--)
        if (start(depth) <= pos && end(depth) >= pos) return depth;
    return 0;
}

MarkSet ResolvedPos::marks() const {
    const NodePtr& p = parent();
    int idx = index();
    if (p->content().size() == 0) return {};
    if (textOffset()) return p->child(idx)->marks();

    NodePtr main = p->maybeChild(idx - 1), other = p->maybeChild(idx);
    if (!main) std::swap(main, other);
    MarkSet marks = main->marks();
    // Non-inclusive marks only continue when the node after carries them too
    for (int i = 0; i < marks.size(); i++) {
        const MarkMeta* mm = markMeta(marks[i].kind);
        if (mm && !mm->inclusive && (!other || !isInSet(marks[i], other->marks()))) {
            marks = removeFromSet(marks[i], marks);
            i--;
        }
    }
    return marks;
}

// ── Fragment comparison ──

int findDiffStart(const Fragment& a, const Fragment& b, int pos) {
    for (int i = 0;; i++) {
        if (i == a.childCount() || i == b.childCount())
            return a.childCount() == b.childCount() ? -1 : pos;

        const NodePtr& childA = a.child(i);
        const NodePtr& childB = b.child(i);
        if (childA == childB) { pos += childA->nodeSize(); continue; }

        if (!childA->sameMarkup(*childB)) return pos;

        if (childA->isText() && childA->text() != childB->text()) {
            const QString& ta = childA->text();
            const QString& tb = childB->text();
            for (int j = 0; j < ta.size() && j < tb.size() && ta[j] == tb[j]; j++) pos++;
            return pos;
        }
        if (childA->content().size() || childB->content().size()) {
            int inner = findDiffStart(childA->content(), childB->content(), pos + 1);
            if (inner >= 0) return inner;
        }
        pos += childA->nodeSize();
    }
}

DiffEnd findDiffEnd(const Fragment& a, const Fragment& b, int posA, int posB) {
    for (int iA = a.childCount(), iB = b.childCount();;) {
        if (iA == 0 || iB == 0) {
            if (iA == iB) return {};
            return {posA, posB, true};
        }

        const NodePtr& childA = a.child(--iA);
        const NodePtr& childB = b.child(--iB);
        int size = childA->nodeSize();
        if (childA == childB) { posA -= size; posB -= size; continue; }

        if (!childA->sameMarkup(*childB)) return {posA, posB, true};

        if (childA->isText() && childA->text() != childB->text()) {
            const QString& ta = childA->text();
            const QString& tb = childB->text();
            int same = 0, minSize = std::min(ta.size(), tb.size());
            while (same < minSize && ta[ta.size() - same - 1] == tb[tb.size() - same - 1]) {
                same++; posA--; posB--;
            }
            return {posA, posB, true};
        }
        if (childA->content().size() || childB->content().size()) {
            DiffEnd inner = findDiffEnd(childA->content(), childB->content(), posA - 1, posB - 1);
            if (inner.valid) return inner;
        }
        posA -= size;
        posB -= size;
    }
}

// ── Cursor search ──

namespace {

int findCursorIn(const NodePtr& node, int pos, int index, int dir) {
    if (node->isTextblock()) return pos;
    for (int i = index - (dir > 0 ? 0 : 1); dir > 0 ? i < node->childCount() : i >= 0; i += dir) {
        const NodePtr& child = node->child(i);
        if (!child->isAtom()) {
            int inner = findCursorIn(child, pos + dir, dir < 0 ? child->childCount() : 0, dir);
            if (inner >= 0) return inner;
        }
        pos += child->nodeSize() * dir;
    }
    return -1;
}

} // namespace

int findCursorFrom(const ResolvedPos& $pos, int dir) {
    if ($pos.parent()->isTextblock()) return $pos.pos();
    int found = findCursorIn($pos.parent(), $pos.pos(), $pos.index(), dir);
    if (found >= 0) return found;
    for (int depth = $pos.depth() - 1; depth >= 0; depth--) {
        found = dir < 0
            ? findCursorIn($pos.node(depth), $pos.before(depth + 1), $pos.index(depth), dir)
            : findCursorIn($pos.node(depth), $pos.after(depth + 1), $pos.index(depth) + 1, dir);
        if (found >= 0) return found;
    }
    return -1;
}

} // namespace vsx
