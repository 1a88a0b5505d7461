#include "viewtree.h"
#include <QJsonArray>

namespace vsx {

namespace {

// Element renders a block that wraps content (p, li, blockquote, ...)
bool opensContent(const ViewNode* node) {
    if (node->isText()) return false;
    bool ok = false;
    NodeKind kind = kindFromTag(node->tag(), &ok);
    return ok && isBlockKind(kind) && !isLeafKind(kind);
}

bool isLeafTag(const QString& tag) {
    bool ok = false;
    NodeKind kind = kindFromTag(tag, &ok);
    return ok && isLeafKind(kind);
}

ViewPoint textPointIn(const ViewNode* node, int offset) {
    if (node->isText())
        return {node, qMin(offset, (int)node->text().size())};
    for (int i = 0; i < node->childCount(); i++) {
        const ViewNode* child = node->childAt(i);
        int size = viewContentSize(child);
        if (offset < size || (offset == size && (child->isText() || child->childCount()))) {
            if (!child->isText() && isLeafTag(child->tag())) return {node, i};
            return textPointIn(child, offset);
        }
        offset -= size;
    }
    return {node, node->childCount()};
}

int contentStart(const ViewNode* root, const ViewNode* node);

int offsetBefore(const ViewNode* root, const ViewNode* node) {
    const ViewNode* parent = node->parentNode();
    if (!parent || node == root) return 0;
    int pos = contentStart(root, parent);
    for (int i = 0; i < parent->childCount(); i++) {
        const ViewNode* sibling = parent->childAt(i);
        if (sibling == node) break;
        pos += viewContentSize(sibling);
    }
    return pos;
}

int contentStart(const ViewNode* root, const ViewNode* node) {
    if (node == root) return 0;
    return offsetBefore(root, node) + (opensContent(node) ? 1 : 0);
}

std::unique_ptr<ViewElement> renderNode(const Node& node) {
    if (node.isText()) {
        std::unique_ptr<ViewElement> inner = ViewElement::textNode(node.text());
        const MarkSet& marks = node.marks();
        for (int i = marks.size() - 1; i >= 0; i--) {
            auto el = ViewElement::element(QLatin1String(markMeta(marks[i].kind)->tag));
            if (marks[i].kind == MarkKind::Link)
                el->setAttr(QStringLiteral("href"), marks[i].href);
            el->appendChild(std::move(inner));
            inner = std::move(el);
        }
        if (marks.isEmpty()) {
            auto span = ViewElement::element(QStringLiteral("span"));
            span->appendChild(std::move(inner));
            inner = std::move(span);
        }
        inner->setTracked(node.nodeSize());
        return inner;
    }

    QString tag = QLatin1String(node.meta().tag);
    if (node.kind() == NodeKind::Heading)
        tag = QStringLiteral("h%1").arg(qBound(1, node.attrs().value(QStringLiteral("level")).toInt(), 6));
    auto el = ViewElement::element(tag);
    if (node.kind() == NodeKind::Image)
        el->setAttr(QStringLiteral("src"), node.attrs().value(QStringLiteral("src")).toString());
    for (const auto& child : node.content().nodes())
        el->appendChild(renderNode(*child));
    el->setTracked(node.nodeSize());
    return el;
}

} // namespace

// ── ViewElement ──

std::unique_ptr<ViewElement> ViewElement::element(const QString& tag) {
    auto el = std::make_unique<ViewElement>();
    el->m_tag = tag.toLower();
    return el;
}

std::unique_ptr<ViewElement> ViewElement::textNode(const QString& text) {
    auto el = std::make_unique<ViewElement>();
    el->m_isText = true;
    el->m_text = text;
    return el;
}

ViewElement* ViewElement::appendChild(std::unique_ptr<ViewElement> child) {
    return insertChild((int)m_children.size(), std::move(child));
}

ViewElement* ViewElement::insertChild(int index, std::unique_ptr<ViewElement> child) {
    Q_ASSERT_X(!m_isText, "ViewElement::insertChild", "text nodes have no children");
    index = qBound(0, index, (int)m_children.size());
    child->m_parent = this;
    ViewElement* raw = child.get();
    m_children.insert(m_children.begin() + index, std::move(child));
    return raw;
}

std::unique_ptr<ViewElement> ViewElement::takeChild(int index) {
    if (index < 0 || index >= (int)m_children.size()) return {};
    std::unique_ptr<ViewElement> child = std::move(m_children[index]);
    m_children.erase(m_children.begin() + index);
    child->m_parent = nullptr;
    return child;
}

std::unique_ptr<ViewElement> ViewElement::clone() const {
    auto copy = std::make_unique<ViewElement>();
    copy->m_isText = m_isText;
    copy->m_tag = m_tag;
    copy->m_text = m_text;
    copy->m_attrs = m_attrs;
    copy->m_tracked = m_tracked;
    copy->m_modelSize = m_modelSize;
    for (const auto& child : m_children)
        copy->appendChild(child->clone());
    return copy;
}

ViewElement* ViewElement::firstText() {
    if (m_isText) return this;
    for (auto& child : m_children)
        if (ViewElement* t = child->firstText()) return t;
    return nullptr;
}

QJsonObject ViewElement::toJson() const {
    QJsonObject o;
    if (m_isText) {
        o["text"] = m_text;
        return o;
    }
    o["tag"] = m_tag;
    if (m_tracked) o["size"] = m_modelSize;
    if (!m_attrs.isEmpty()) {
        QJsonObject attrs;
        for (auto it = m_attrs.begin(); it != m_attrs.end(); ++it)
            attrs[it.key()] = it.value();
        o["attrs"] = attrs;
    }
    if (!m_children.empty()) {
        QJsonArray children;
        for (const auto& child : m_children) children.append(child->toJson());
        o["children"] = children;
    }
    return o;
}

std::unique_ptr<ViewElement> ViewElement::fromJson(const QJsonObject& o, QString* error) {
    if (o.contains("text"))
        return textNode(o["text"].toString());
    QString tag = o["tag"].toString();
    if (tag.isEmpty()) {
        if (error) *error = QStringLiteral("view element without tag or text");
        return {};
    }
    auto el = element(tag);
    if (o.contains("size")) el->setTracked(o["size"].toInt());
    QJsonObject attrs = o["attrs"].toObject();
    for (auto it = attrs.begin(); it != attrs.end(); ++it)
        el->setAttr(it.key(), it.value().toString());
    for (const auto& v : o["children"].toArray()) {
        auto child = fromJson(v.toObject(), error);
        if (!child) return {};
        el->appendChild(std::move(child));
    }
    return el;
}

// ── Rendering and coordinate conversion ──

std::unique_ptr<ViewElement> renderDocument(const Node& doc) {
    auto root = ViewElement::element(QLatin1String(kindMeta(NodeKind::Doc)->tag));
    for (const auto& child : doc.content().nodes())
        root->appendChild(renderNode(*child));
    return root;
}

ViewPoint viewPointFromPos(const ViewNode* root, int pos, bool loose) {
    const ViewNode* container = root;
    int offset = pos;
    for (;;) {
        int count = container->childCount();
        bool descended = false;
        for (int i = 0; i < count; i++) {
            const ViewNode* child = container->childAt(i);
            if (!child->isTracked()) continue;
            if (offset == 0) return {container, i};
            int size = child->modelSize();
            if (offset < size) {
                if (!opensContent(child)) {
                    // Inside an inline node
                    if (loose) return {container, i};
                    return textPointIn(child, offset);
                }
                container = child;
                offset -= 1;
                descended = true;
                break;
            }
            offset -= size;
        }
        if (!descended) return {container, count};
    }
}

int posFromViewPoint(const ViewNode* root, const ViewPoint& point) {
    if (point.isNull()) return 0;
    if (point.node->isText())
        return offsetBefore(root, point.node) + qMin(point.offset, (int)point.node->text().size());
    int pos = contentStart(root, point.node);
    int end = qMin(point.offset, point.node->childCount());
    for (int i = 0; i < end; i++)
        pos += viewContentSize(point.node->childAt(i));
    return pos;
}

int viewContentSize(const ViewNode* node) {
    if (node->isText()) return node->text().size();
    if (isLeafTag(node->tag())) return 1;
    int size = opensContent(node) ? 2 : 0;
    for (int i = 0; i < node->childCount(); i++)
        size += viewContentSize(node->childAt(i));
    return size;
}

} // namespace vsx
