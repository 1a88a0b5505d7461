#pragma once
#include "model.h"
#include "viewtree.h"
#include <initializer_list>

// Short-hand document builders shared by the test suites:
//   doc({p({t("ab"), em("cd")})})  ->  doc(paragraph("ab", em("cd")))

namespace vsx {
namespace build {

inline NodePtr t(const QString& text) { return Node::text(text); }

inline NodePtr marked(const QString& text, MarkKind kind, const QString& href = {}) {
    Mark m;
    m.kind = kind;
    m.href = href;
    return Node::text(text, MarkSet{m});
}
inline NodePtr em(const QString& text)     { return marked(text, MarkKind::Em); }
inline NodePtr strong(const QString& text) { return marked(text, MarkKind::Strong); }
inline NodePtr link(const QString& text, const QString& href) { return marked(text, MarkKind::Link, href); }

inline NodePtr node(NodeKind kind, std::initializer_list<NodePtr> children, const QVariantMap& attrs = {}) {
    return Node::create(kind, Fragment::fromArray(QVector<NodePtr>(children)), attrs);
}

inline NodePtr doc(std::initializer_list<NodePtr> c)        { return node(NodeKind::Doc, c); }
inline NodePtr p(std::initializer_list<NodePtr> c = {})     { return node(NodeKind::Paragraph, c); }
inline NodePtr blockquote(std::initializer_list<NodePtr> c) { return node(NodeKind::Blockquote, c); }
inline NodePtr ul(std::initializer_list<NodePtr> c)         { return node(NodeKind::BulletList, c); }
inline NodePtr li(std::initializer_list<NodePtr> c)         { return node(NodeKind::ListItem, c); }
inline NodePtr pre(std::initializer_list<NodePtr> c)        { return node(NodeKind::CodeBlock, c); }
inline NodePtr h(int level, std::initializer_list<NodePtr> c) {
    QVariantMap attrs;
    attrs[QStringLiteral("level")] = level;
    return node(NodeKind::Heading, c, attrs);
}
inline NodePtr br() { return Node::create(NodeKind::HardBreak); }
inline NodePtr hr() { return Node::create(NodeKind::HorizontalRule); }
inline NodePtr img(const QString& src) {
    QVariantMap attrs;
    attrs[QStringLiteral("src")] = src;
    return Node::create(NodeKind::Image, {}, attrs);
}

// View tree without tracking info, as the platform would create it
inline std::unique_ptr<ViewElement> el(const QString& tag,
                                       std::initializer_list<ViewElement*> children = {}) {
    auto e = ViewElement::element(tag);
    for (ViewElement* c : children) e->appendChild(std::unique_ptr<ViewElement>(c));
    return e;
}
inline ViewElement* raw(const QString& tag, std::initializer_list<ViewElement*> children = {}) {
    return el(tag, children).release();
}
inline ViewElement* text(const QString& s) { return ViewElement::textNode(s).release(); }

} // namespace build
} // namespace vsx
