#include "controller.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>

namespace vsx {

// ── EditorDocument ──

EditorDocument::EditorDocument(QObject* parent)
    : QObject(parent)
    , doc(Node::create(NodeKind::Doc, Fragment::from(Node::create(NodeKind::Paragraph))))
    , sel(Selection::cursor(1))
{
    connect(&undoStack, &QUndoStack::cleanChanged, this, [this](bool clean) {
        modified = !clean;
    });
}

void EditorDocument::setDoc(const NodePtr& newDoc, const Selection& newSel) {
    undoStack.clear();
    doc = newDoc;
    int size = doc->content().size();
    sel = {qBound(0, newSel.anchor, size), qBound(0, newSel.head, size)};
    emit documentChanged();
}

QJsonObject EditorDocument::toJson() const {
    QJsonObject o;
    o["doc"] = doc->toJson();
    QJsonObject s;
    s["anchor"] = sel.anchor;
    s["head"]   = sel.head;
    o["selection"] = s;
    return o;
}

LoadResult EditorDocument::loadJson(const QJsonObject& root) {
    LoadResult r;
    if (!root["doc"].isObject()) {
        r.error = QStringLiteral("missing \"doc\" object");
        return r;
    }
    NodePtr parsed = Node::fromJson(root["doc"].toObject(), &r.error);
    if (!parsed) return r;
    if (parsed->kind() != NodeKind::Doc) {
        r.error = QStringLiteral("top-level node is %1, expected doc").arg(kindToString(parsed->kind()));
        return r;
    }
    QJsonObject s = root["selection"].toObject();
    setDoc(parsed, {s["anchor"].toInt(), s["head"].toInt(s["anchor"].toInt())});
    r.ok = true;
    return r;
}

bool EditorDocument::save(const QString& path) {
    QJsonDocument jdoc(toJson());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(jdoc.toJson(QJsonDocument::Indented));
    filePath = path;
    undoStack.setClean();
    modified = false;
    return true;
}

LoadResult EditorDocument::load(const QString& path) {
    LoadResult r;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        r.error = QStringLiteral("cannot open %1").arg(path);
        return r;
    }
    QJsonParseError perr;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError) {
        r.error = perr.errorString();
        return r;
    }
    r = loadJson(jdoc.object());
    if (r.ok) {
        filePath = path;
        modified = false;
    }
    return r;
}

// ── ViewDocument ──

ViewDocument::ViewDocument()
    : m_root(ViewElement::element(QLatin1String(kindMeta(NodeKind::Doc)->tag)))
{}

void ViewDocument::setRoot(std::unique_ptr<ViewElement> root) {
    clearCaret();
    m_root = std::move(root);
}

void ViewDocument::render(const Node& doc) {
    setRoot(renderDocument(doc));
}

void ViewDocument::setCaret(const ViewPoint& anchor, const ViewPoint& head) {
    m_anchor = anchor;
    m_head = head;
}

NodePtr ViewDocument::parseRegion(const ViewNode* parent, int from, int to, const Node& context) const {
    ParseOptions opts;
    opts.preserveWhitespace = true;
    return vsx::parseRegion(parent, from, to, context, opts);
}

Selection ViewDocument::selectionFromView(const NodePtr& doc, bool* ok) const {
    if (m_head.isNull()) {
        *ok = false;
        return {};
    }
    int size = doc->content().size();
    auto toModel = [&](const ViewPoint& point) {
        int pos = qBound(0, posFromViewPoint(m_root.get(), point), size);
        int found = findCursorFrom(doc->resolve(pos), 1);
        if (found < 0) found = findCursorFrom(doc->resolve(pos), -1);
        return found < 0 ? pos : found;
    };
    *ok = true;
    return {toModel(m_anchor.isNull() ? m_head : m_anchor), toModel(m_head)};
}

// ── EditCommand ──

EditCommand::EditCommand(EditorController* ctrl, NodePtr before, Selection selBefore,
                         NodePtr after, Selection selAfter)
    : m_ctrl(ctrl)
    , m_before(std::move(before)), m_selBefore(selBefore)
    , m_after(std::move(after)), m_selAfter(selAfter) {}

void EditCommand::undo() { m_ctrl->restoreState(m_before, m_selBefore); }

void EditCommand::redo() {
    if (!m_applied) {
        m_applied = true;
        return;
    }
    m_ctrl->restoreState(m_after, m_selAfter);
}

// ── EditorController ──

EditorController::EditorController(EditorDocument* doc, ViewDocument* view, QObject* parent)
    : QObject(parent), m_doc(doc), m_view(view)
{
    connect(m_doc, &EditorDocument::documentChanged, this, &EditorController::onDocumentReplaced);
    m_view->render(*m_doc->doc);
    refresh();
}

void EditorController::startOperation() {
    if (m_op) {
        qDebug() << "[Controller] batch restarted before the previous one ended";
        endOperation();
    }
    Operation op;
    op.doc = m_doc->doc;
    op.sel = m_doc->sel;
    m_op = std::move(op);
}

Operation& EditorController::ensureOperation() {
    if (!m_op) startOperation();
    return *m_op;
}

void EditorController::endOperation() {
    if (!m_op) return;
    m_op.reset();
    refresh();
}

void EditorController::setDoc(const NodePtr& doc, const Selection& sel) {
    m_doc->setDoc(doc, sel);
}

void EditorController::onDocumentReplaced() {
    // The view and any batch in flight describe the old document
    if (m_op) m_op->docSet = true;
    markAllDirty();
    refresh();
}

void EditorController::restoreState(const NodePtr& doc, const Selection& sel) {
    m_doc->doc = doc;
    m_doc->sel = sel;
    onDocumentReplaced();
}

bool EditorController::apply(const Transaction& tr) {
    if (tr.before() != m_doc->doc) {
        qWarning() << "[Controller] transaction built on a stale document, dropped";
        return false;
    }
    Selection selBefore = m_doc->sel;
    Selection sel = tr.selectionSet() ? tr.selection() : selBefore.map(tr.mapping());

    if (tr.docChanged()) {
        // Pending dirty ranges follow the document
        const Mapping& mapping = tr.mapping();
        for (auto& r : m_dirty)
            r = {mapping.map(r.from, -1), mapping.map(r.to, 1)};
        PosRange changed = tr.changedRange();
        if (changed.from >= 0) addDirty(changed);
        if (m_op) m_op->mapping.appendMapping(mapping);

        m_doc->doc = tr.doc();
        m_doc->sel = sel;
        m_doc->undoStack.push(new EditCommand(this, tr.before(), selBefore, tr.doc(), sel));
    } else {
        m_doc->sel = sel;
    }

    if (tr.scrolledIntoView()) emit scrollRequested(sel.head);
    refresh();
    return true;
}

bool EditorController::splitBlock() {
    Selection sel = m_doc->sel;
    Transaction tr(m_doc->doc);
    QString error;
    if (!sel.empty() && !tr.deleteRange(sel.from(), sel.to(), &error)) {
        qWarning() << "[Controller] cannot clear selection for split:" << error;
        return false;
    }
    int pos = sel.from();
    ResolvedPos $pos = tr.doc()->resolve(pos);
    if (!$pos.parent()->isTextblock()) {
        qDebug() << "[Controller] split at" << pos << "outside a textblock ignored";
        return false;
    }

    int depth = 1;
    NodeKind typeAfter = NodeKind::Doc;
    if ($pos.depth() >= 2 && $pos.node($pos.depth() - 1)->kind() == NodeKind::ListItem)
        depth = 2;
    else if ($pos.parent()->kind() == NodeKind::Heading
             && $pos.parentOffset() == $pos.parent()->content().size())
        typeAfter = NodeKind::Paragraph;

    if (!tr.split(pos, depth, typeAfter, &error))
        return false;
    tr.setSelection(Selection::cursor(pos + 2 * depth));
    tr.setScrollIntoView();
    return apply(tr);
}

// ── Reconciliation entry points ──

bool EditorController::readInputChange() {
    bool ownBatch = !m_op;
    const Operation& op = ensureOperation();
    Reconciler reconciler(*m_view, *this, m_options);
    bool changed = reconciler.reconcileAfterInputChange(op);
    if (ownBatch) endOperation();
    return changed;
}

bool EditorController::readCompositionChange(int margin) {
    bool ownBatch = !m_op;
    const Operation& op = ensureOperation();
    Reconciler reconciler(*m_view, *this, m_options);
    bool changed = reconciler.reconcileAfterComposition(
        op, margin < 0 ? m_options.compositionMargin : margin);
    if (ownBatch) endOperation();
    return changed;
}

// ── Replay ──

void EditorController::dispatchStructuralSplit() {
    if (!splitBlock()) {
        qWarning() << "[Controller] view shows a block split the document cannot take, redrawing";
        markAllDirty();
        refresh();
    }
}

void EditorController::recoverSelection(Transaction& tr, const SelectionRecovery& recover) {
    if (!recover) return;
    bool ok = false;
    Selection sel = recover(tr.doc(), &ok);
    if (ok) tr.setSelection(sel);
}

void EditorController::insertText(int from, int to, const QString& text,
                                  const SelectionRecovery& recover) {
    Transaction tr(m_doc->doc);
    QString error;
    if (!tr.insertText(from, to, text, &error)) {
        qWarning() << "[Controller] text replay at" << from << to << "failed:" << error;
        markAllDirty();
        refresh();
        return;
    }
    recoverSelection(tr, recover);
    apply(tr);
}

void EditorController::applyReplacement(int from, int to, const Slice& slice,
                                        const SelectionRecovery& recover, bool scroll) {
    Transaction tr(m_doc->doc);
    QString error;
    if (!tr.replace(from, to, slice, &error)) {
        qWarning() << "[Controller] replacement at" << from << to << "failed:" << error;
        markAllDirty();
        refresh();
        return;
    }
    recoverSelection(tr, recover);
    if (scroll) tr.setScrollIntoView();
    apply(tr);
}

// ── Dirty tracking ──

void EditorController::markDirty(int from, int to) {
    // Reported against the batch-start document
    if (m_op) {
        from = m_op->mapping.map(from, -1);
        to = m_op->mapping.map(to, 1);
    }
    addDirty({from, to});
    emit dirtyMarked(from, to);
}

void EditorController::markAllDirty() {
    m_allDirty = true;
    m_dirty.clear();
    emit allDirtyMarked();
}

void EditorController::addDirty(PosRange range) {
    if (m_allDirty) return;
    for (auto& r : m_dirty) {
        if (range.from <= r.to && range.to >= r.from) {
            r = {qMin(r.from, range.from), qMax(r.to, range.to)};
            return;
        }
    }
    m_dirty.append(range);
}

void EditorController::refresh() {
    // Redraw waits for the batch to end
    if (m_op) return;

    bool redraw = m_allDirty || !m_dirty.isEmpty();
    if (redraw) m_view->render(*m_doc->doc);
    m_dirty.clear();
    m_allDirty = false;

    const ViewNode* root = m_view->root();
    const Selection& sel = m_doc->sel;
    m_view->setCaret(viewPointFromPos(root, sel.anchor, false),
                     viewPointFromPos(root, sel.head, false));
    emit refreshed(redraw);
}

} // namespace vsx
