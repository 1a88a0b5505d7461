#pragma once
#include <QString>
#include <QVector>
#include <cstdint>

namespace vsx {

// ── Node kind enum ──

enum class NodeKind : uint8_t {
    Doc,
    Paragraph, Heading, Blockquote,
    BulletList, ListItem,
    CodeBlock, HorizontalRule,
    Image, HardBreak,
    Text
};

enum class NodeGroup : uint8_t { Top, Block, Inline, ListItem };

// What a node of a given kind may contain
enum class ContentKind : uint8_t { None, Inline, Text, Blocks, ListItems };

// ── Unified kind metadata table (single source of truth) ──

struct KindMeta {
    NodeKind    kind;
    const char* name;      // JSON name: "paragraph", "list_item"
    const char* tag;       // view element tag
    NodeGroup   group;
    ContentKind content;
};

inline constexpr KindMeta kKindMeta[] = {
    // kind                      name               tag           group               content
    {NodeKind::Doc,            "doc",             "div",        NodeGroup::Top,      ContentKind::Blocks},
    {NodeKind::Paragraph,      "paragraph",       "p",          NodeGroup::Block,    ContentKind::Inline},
    {NodeKind::Heading,        "heading",         "h1",         NodeGroup::Block,    ContentKind::Inline},
    {NodeKind::Blockquote,     "blockquote",      "blockquote", NodeGroup::Block,    ContentKind::Blocks},
    {NodeKind::BulletList,     "bullet_list",     "ul",         NodeGroup::Block,    ContentKind::ListItems},
    {NodeKind::ListItem,       "list_item",       "li",         NodeGroup::ListItem, ContentKind::Blocks},
    {NodeKind::CodeBlock,      "code_block",      "pre",        NodeGroup::Block,    ContentKind::Text},
    {NodeKind::HorizontalRule, "horizontal_rule", "hr",         NodeGroup::Block,    ContentKind::None},
    {NodeKind::Image,          "image",           "img",        NodeGroup::Inline,   ContentKind::None},
    {NodeKind::HardBreak,      "hard_break",      "br",         NodeGroup::Inline,   ContentKind::None},
    {NodeKind::Text,           "text",            "",           NodeGroup::Inline,   ContentKind::None},
};

inline constexpr const KindMeta* kindMeta(NodeKind k) {
    for (const auto& m : kKindMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline constexpr bool isBlockKind(NodeKind k)    { auto* m = kindMeta(k); return m && m->group != NodeGroup::Inline; }
inline constexpr bool isInlineKind(NodeKind k)   { auto* m = kindMeta(k); return m && m->group == NodeGroup::Inline; }
inline constexpr bool isTextblockKind(NodeKind k) {
    auto* m = kindMeta(k);
    return m && m->group == NodeGroup::Block
        && (m->content == ContentKind::Inline || m->content == ContentKind::Text);
}
inline constexpr bool isLeafKind(NodeKind k)     { auto* m = kindMeta(k); return m && m->content == ContentKind::None; }

inline const char* kindToString(NodeKind k) {
    auto* m = kindMeta(k);
    return m ? m->name : "unknown";
}

inline NodeKind kindFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kKindMeta) {
        if (s == QLatin1String(m.name)) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return NodeKind::Paragraph;
}

// Maps a view element tag to the node kind it renders. Headings use h1..h6.
inline NodeKind kindFromTag(const QString& tag, bool* ok = nullptr) {
    QString t = tag.toLower();
    if (t.size() == 2 && t[0] == 'h' && t[1] >= '1' && t[1] <= '6') {
        if (ok) *ok = true;
        return NodeKind::Heading;
    }
    for (const auto& m : kKindMeta) {
        if (m.kind != NodeKind::Doc && m.kind != NodeKind::Text && t == QLatin1String(m.tag)) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return NodeKind::Paragraph;
}

// ── Marks ──

// Enum order is the rank used to keep mark sets sorted
enum class MarkKind : uint8_t { Link, Em, Strong, Code };

struct MarkMeta {
    MarkKind    kind;
    const char* name;
    const char* tag;
    bool        inclusive;   // typing at the mark's end extends it
};

inline constexpr MarkMeta kMarkMeta[] = {
    {MarkKind::Link,   "link",   "a",      false},
    {MarkKind::Em,     "em",     "em",     true},
    {MarkKind::Strong, "strong", "strong", true},
    {MarkKind::Code,   "code",   "code",   true},
};

inline constexpr const MarkMeta* markMeta(MarkKind k) {
    for (const auto& m : kMarkMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline const char* markToString(MarkKind k) {
    auto* m = markMeta(k);
    return m ? m->name : "unknown";
}

inline MarkKind markFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kMarkMeta) {
        if (s == QLatin1String(m.name)) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return MarkKind::Em;
}

// i/b are accepted as aliases of em/strong
inline MarkKind markFromTag(const QString& tag, bool* ok = nullptr) {
    QString t = tag.toLower();
    if (t == QLatin1String("i")) t = QStringLiteral("em");
    else if (t == QLatin1String("b")) t = QStringLiteral("strong");
    for (const auto& m : kMarkMeta) {
        if (t == QLatin1String(m.tag)) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return MarkKind::Em;
}

struct Mark {
    MarkKind kind = MarkKind::Em;
    QString  href;               // Link only

    bool operator==(const Mark& o) const { return kind == o.kind && href == o.href; }
    bool operator!=(const Mark& o) const { return !(*this == o); }
};

using MarkSet = QVector<Mark>;

inline bool isInSet(const Mark& mark, const MarkSet& set) {
    for (const auto& m : set)
        if (m == mark) return true;
    return false;
}

// Inserts (or replaces a same-kind mark) keeping rank order
inline MarkSet addToSet(const Mark& mark, const MarkSet& set) {
    MarkSet out;
    bool placed = false;
    for (const auto& m : set) {
        if (m.kind == mark.kind) {
            if (!placed) { out.append(mark); placed = true; }
            continue;
        }
        if (!placed && (int)m.kind > (int)mark.kind) {
            out.append(mark);
            placed = true;
        }
        out.append(m);
    }
    if (!placed) out.append(mark);
    return out;
}

inline MarkSet removeFromSet(const Mark& mark, const MarkSet& set) {
    MarkSet out;
    for (const auto& m : set)
        if (m != mark) out.append(m);
    return out;
}

inline bool sameMarkSet(const MarkSet& a, const MarkSet& b) { return a == b; }

// ── Positions and ranges ──

struct PosRange {
    int from = 0;
    int to   = 0;

    bool operator==(const PosRange& o) const { return from == o.from && to == o.to; }
};

// Changed span between two fragments. start is shared; endA/endB are in the
// coordinate space of the old and new fragment respectively.
struct DiffResult {
    int  start = 0;
    int  endA  = 0;
    int  endB  = 0;
    bool valid = false;
};

struct MapResult {
    int  pos     = 0;
    bool deleted = false;
};

} // namespace vsx
