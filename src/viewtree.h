#pragma once
#include "model.h"
#include <QHash>
#include <memory>
#include <vector>

namespace vsx {

// ── ViewNode ──

// Read-only view of a platform-rendered node. A node is "tracked" when the
// editor rendered it from a model node and recorded that node's size; nodes
// the platform created on its own are untracked.
class ViewNode {
public:
    virtual ~ViewNode() = default;
    virtual bool isText() const = 0;
    virtual QString tag() const = 0;
    virtual QString text() const = 0;
    virtual QString attr(const QString& name) const = 0;
    virtual int childCount() const = 0;
    virtual const ViewNode* childAt(int index) const = 0;
    virtual const ViewNode* parentNode() const = 0;
    virtual bool isTracked() const = 0;
    virtual int modelSize() const = 0;

    int indexInParent() const {
        const ViewNode* p = parentNode();
        if (!p) return -1;
        for (int i = 0; i < p->childCount(); i++)
            if (p->childAt(i) == this) return i;
        return -1;
    }
};

// Child-offset coordinates in the view: before child `offset` of `node`, or
// a character offset when `node` is a text node
struct ViewPoint {
    const ViewNode* node   = nullptr;
    int             offset = 0;

    bool isNull() const { return node == nullptr; }
};

// ── ViewElement ──

// In-memory mutable view tree. Stands in for a platform surface: the editor
// renders into it, and tests or the replay tool mutate it the way native
// input handling would.
class ViewElement : public ViewNode {
public:
    static std::unique_ptr<ViewElement> element(const QString& tag);
    static std::unique_ptr<ViewElement> textNode(const QString& text);

    bool isText() const override { return m_isText; }
    QString tag() const override { return m_tag; }
    QString text() const override { return m_text; }
    QString attr(const QString& name) const override { return m_attrs.value(name); }
    int childCount() const override { return (int)m_children.size(); }
    const ViewNode* childAt(int index) const override { return m_children[index].get(); }
    const ViewNode* parentNode() const override { return m_parent; }
    bool isTracked() const override { return m_tracked; }
    int modelSize() const override { return m_modelSize; }

    ViewElement* child(int index) { return m_children[index].get(); }
    ViewElement* parent() { return m_parent; }

    void setText(const QString& text) { m_text = text; }
    void setAttr(const QString& name, const QString& value) { m_attrs[name] = value; }
    void setTracked(int modelSize) { m_tracked = true; m_modelSize = modelSize; }
    void clearTracking() { m_tracked = false; m_modelSize = 0; }

    ViewElement* appendChild(std::unique_ptr<ViewElement> child);
    ViewElement* insertChild(int index, std::unique_ptr<ViewElement> child);
    std::unique_ptr<ViewElement> takeChild(int index);

    // Deep copy; the clone keeps tracking information
    std::unique_ptr<ViewElement> clone() const;

    // First text node in document order below this element
    ViewElement* firstText();

    QJsonObject toJson() const;
    static std::unique_ptr<ViewElement> fromJson(const QJsonObject& o, QString* error = nullptr);

private:
    bool        m_isText    = false;
    QString     m_tag;
    QString     m_text;
    QHash<QString, QString> m_attrs;
    bool        m_tracked   = false;
    int         m_modelSize = 0;
    ViewElement* m_parent   = nullptr;
    std::vector<std::unique_ptr<ViewElement>> m_children;
};

// ── Rendering and coordinate conversion ──

// Renders doc's content below an untracked root element; every rendered
// model node is tracked with its node size
std::unique_ptr<ViewElement> renderDocument(const Node& doc);

// Model position -> view point using tracked sizes. With loose set the point
// is a child boundary of the element whose content holds pos; otherwise it
// descends into text.
ViewPoint viewPointFromPos(const ViewNode* root, int pos, bool loose);

// View point -> model position computed from the current view content
int posFromViewPoint(const ViewNode* root, const ViewPoint& point);

// Model content size the view subtree parses to
int viewContentSize(const ViewNode* node);

} // namespace vsx
