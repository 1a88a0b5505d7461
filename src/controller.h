#pragma once
#include "reconcile.h"
#include "parser.h"
#include <QObject>
#include <QUndoStack>
#include <QUndoCommand>
#include <optional>

namespace vsx {

class EditorController;

// ── Document ──

struct LoadResult {
    bool    ok = false;
    QString error;
};

class EditorDocument : public QObject {
    Q_OBJECT
public:
    explicit EditorDocument(QObject* parent = nullptr);

    NodePtr    doc;
    Selection  sel;
    QUndoStack undoStack;
    QString    filePath;
    bool       modified = false;

    // Replaces the document wholesale; drops undo history
    void setDoc(const NodePtr& newDoc, const Selection& newSel = {});

    QJsonObject toJson() const;
    LoadResult loadJson(const QJsonObject& root);
    bool save(const QString& path);
    LoadResult load(const QString& path);

signals:
    void documentChanged();
};

// ── View ──

// ViewSurface over an in-memory view tree with a focus flag and caret
class ViewDocument : public ViewSurface {
public:
    ViewDocument();

    const ViewNode* root() const override { return m_root.get(); }
    ViewElement* rootElement() { return m_root.get(); }
    void setRoot(std::unique_ptr<ViewElement> root);
    void render(const Node& doc);

    bool hasFocus() const override { return m_focus; }
    void setFocus(bool on) { m_focus = on; }

    // Caret points must refer to nodes of the current root
    void setCaret(const ViewPoint& anchor, const ViewPoint& head);
    void setCaret(const ViewPoint& point) { setCaret(point, point); }
    void clearCaret() { m_anchor = m_head = ViewPoint(); }
    ViewPoint caretHead() const { return m_head; }

    NodePtr parseRegion(const ViewNode* parent, int from, int to, const Node& context) const override;
    Selection selectionFromView(const NodePtr& doc, bool* ok) const override;

private:
    std::unique_ptr<ViewElement> m_root;
    bool      m_focus = false;
    ViewPoint m_anchor;
    ViewPoint m_head;
};

// ── Undo command ──

class EditCommand : public QUndoCommand {
public:
    EditCommand(EditorController* ctrl, NodePtr before, Selection selBefore,
                NodePtr after, Selection selAfter);
    void undo() override;
    void redo() override;
private:
    EditorController* m_ctrl;
    NodePtr   m_before;
    Selection m_selBefore;
    NodePtr   m_after;
    Selection m_selAfter;
    bool      m_applied = false;   // first redo happens inside apply()
};

// ── Controller ──

class EditorController : public QObject, public ReplayTarget {
    Q_OBJECT
public:
    EditorController(EditorDocument* doc, ViewDocument* view, QObject* parent = nullptr);

    EditorDocument* document() const { return m_doc; }
    ViewDocument* view() const { return m_view; }

    const ReconcileOptions& options() const { return m_options; }
    void setOptions(const ReconcileOptions& options) { m_options = options; }

    // Batch lifecycle
    void startOperation();
    Operation& ensureOperation();
    void endOperation();
    bool inOperation() const { return m_op.has_value(); }
    const Operation* operation() const { return m_op ? &*m_op : nullptr; }

    void setDoc(const NodePtr& doc, const Selection& sel = {});
    bool apply(const Transaction& tr);
    bool splitBlock();

    // Reconcile the view after native input / IME updates. A negative
    // margin uses the configured composition margin.
    bool readInputChange();
    bool readCompositionChange(int margin = -1);

    // ReplayTarget
    void dispatchStructuralSplit() override;
    void insertText(int from, int to, const QString& text, const SelectionRecovery& recover) override;
    void applyReplacement(int from, int to, const Slice& slice,
                          const SelectionRecovery& recover, bool scroll) override;
    void markDirty(int from, int to) override;
    void markAllDirty() override;

    const QVector<PosRange>& dirtyRanges() const { return m_dirty; }
    bool allDirty() const { return m_allDirty; }

    void refresh();
    // Undo/redo entry: the document is swapped without a mapping
    void restoreState(const NodePtr& doc, const Selection& sel);

signals:
    void dirtyMarked(int from, int to);
    void allDirtyMarked();
    void refreshed(bool redrawn);
    void scrollRequested(int pos);

private:
    EditorDocument*          m_doc;
    ViewDocument*            m_view;
    ReconcileOptions         m_options;
    std::optional<Operation> m_op;
    QVector<PosRange>        m_dirty;
    bool                     m_allDirty = false;

    void addDirty(PosRange range);
    void onDocumentReplaced();
    void recoverSelection(Transaction& tr, const SelectionRecovery& recover);
};

} // namespace vsx
