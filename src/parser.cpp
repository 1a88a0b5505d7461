#include "parser.h"
#include <QRegularExpression>

namespace vsx {

namespace {

class ViewParser {
public:
    explicit ViewParser(const ParseOptions& opts) : m_opts(opts) {}

    Fragment parseContent(const ViewNode* parent, int from, int to, const Node& context) {
        QVector<NodePtr> out;
        switch (context.meta().content) {
        case ContentKind::Inline:
            for (int i = from; i < to; i++) parseInline(parent->childAt(i), {}, false, out);
            break;
        case ContentKind::Text:
            for (int i = from; i < to; i++) parseInline(parent->childAt(i), {}, true, out);
            break;
        case ContentKind::Blocks:
        case ContentKind::ListItems:
            parseBlocks(parent, from, to, context.meta().content, out);
            break;
        case ContentKind::None:
            break;
        }
        return Fragment::fromArray(out);
    }

private:
    const ParseOptions& m_opts;

    QString normalize(const QString& text) const {
        if (m_opts.preserveWhitespace) return text;
        static const QRegularExpression ws(QStringLiteral("\\s+"));
        return QString(text).replace(ws, QStringLiteral(" "));
    }

    // ── Inline content ──

    void parseInline(const ViewNode* node, const MarkSet& marks, bool plain, QVector<NodePtr>& out) {
        if (node->isText()) {
            QString text = normalize(node->text());
            if (!text.isEmpty()) out.append(Node::text(text, plain ? MarkSet() : marks));
            return;
        }
        bool ok = false;
        NodeKind kind = kindFromTag(node->tag(), &ok);
        if (ok && kind == NodeKind::HardBreak) {
            if (plain) out.append(Node::text(QStringLiteral("\n")));
            else out.append(Node::create(NodeKind::HardBreak, {}, {}, marks));
            return;
        }
        if (ok && kind == NodeKind::Image) {
            if (plain) return;
            QVariantMap attrs;
            attrs[QStringLiteral("src")] = node->attr(QStringLiteral("src"));
            out.append(Node::create(NodeKind::Image, {}, attrs, marks));
            return;
        }

        MarkSet inner = marks;
        bool isMark = false;
        MarkKind mk = markFromTag(node->tag(), &isMark);
        if (isMark && !plain) {
            Mark m;
            m.kind = mk;
            if (mk == MarkKind::Link) m.href = node->attr(QStringLiteral("href"));
            inner = addToSet(m, marks);
        }
        // Spans, unknown elements and blocks nested in inline content are
        // flattened into their children
        for (int i = 0; i < node->childCount(); i++)
            parseInline(node->childAt(i), inner, plain, out);
    }

    // ── Block content ──

    void parseBlocks(const ViewNode* parent, int from, int to, ContentKind content,
                     QVector<NodePtr>& out) {
        QVector<NodePtr> pending;
        auto flush = [&] {
            if (pending.isEmpty()) return;
            NodePtr para = Node::create(NodeKind::Paragraph, Fragment::fromArray(pending));
            pending.clear();
            appendBlock(para, content, out);
        };

        for (int i = from; i < to; i++) {
            const ViewNode* child = parent->childAt(i);
            if (child->isText()) {
                // Whitespace between blocks is formatting, not content
                if (pending.isEmpty() && child->text().trimmed().isEmpty()) continue;
                parseInline(child, {}, false, pending);
                continue;
            }
            bool ok = false;
            NodeKind kind = kindFromTag(child->tag(), &ok);
            if (ok && isBlockKind(kind)) {
                flush();
                appendBlock(parseBlock(child, kind), content, out);
            } else if (ok || isMarkTag(child->tag()) || child->tag() == QLatin1String("span")) {
                parseInline(child, {}, false, pending);
            } else {
                // Unknown wrapper (div, section): its children belong here
                flush();
                parseBlocks(child, 0, child->childCount(), content, out);
            }
        }
        flush();
    }

    static bool isMarkTag(const QString& tag) {
        bool ok = false;
        markFromTag(tag, &ok);
        return ok;
    }

    void appendBlock(const NodePtr& block, ContentKind content, QVector<NodePtr>& out) {
        if (content == ContentKind::ListItems && block->kind() != NodeKind::ListItem) {
            out.append(Node::create(NodeKind::ListItem, Fragment::from(block)));
            return;
        }
        if (content == ContentKind::Blocks && block->kind() == NodeKind::ListItem) {
            // Orphaned list item: keep its content
            for (const auto& child : block->content().nodes()) out.append(child);
            return;
        }
        out.append(block);
    }

    NodePtr parseBlock(const ViewNode* el, NodeKind kind) {
        QVariantMap attrs;
        if (kind == NodeKind::Heading)
            attrs[QStringLiteral("level")] = el->tag().mid(1).toInt();
        if (isLeafKind(kind)) return Node::create(kind, {}, attrs);

        NodePtr shell = Node::create(kind, {}, attrs);
        return shell->copy(parseContent(el, 0, el->childCount(), *shell));
    }
};

} // namespace

NodePtr parseRegion(const ViewNode* parent, int from, int to,
                    const Node& context, const ParseOptions& options) {
    Q_ASSERT_X(from >= 0 && from <= to && to <= parent->childCount(), "parseRegion",
               "child range outside of parent");
    from = qBound(0, from, parent->childCount());
    to = qBound(from, to, parent->childCount());
    ViewParser parser(options);
    return context.copy(parser.parseContent(parent, from, to, context));
}

NodePtr parseView(const ViewNode* root, const ParseOptions& options) {
    NodePtr doc = Node::create(NodeKind::Doc);
    return parseRegion(root, 0, root->childCount(), *doc, options);
}

} // namespace vsx
