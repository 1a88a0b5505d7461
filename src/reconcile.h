#pragma once
#include "mapping.h"
#include "options.h"
#include "viewtree.h"
#include <functional>
#include <variant>

namespace vsx {

// ── Batch context ──

// State of one batch of edits, captured when the batch starts. The view
// tree reflects `doc`; edits applied since then are recorded in `mapping`.
struct Operation {
    NodePtr   doc;
    Selection sel;
    bool      docSet = false;   // document was replaced wholesale during the batch
    Mapping   mapping;
};

// Re-derives the selection for a committed document, *ok false when there is none
using SelectionRecovery = std::function<Selection(const NodePtr& doc, bool* ok)>;

// ── Collaborators ──

// Read access to the platform view
class ViewSurface {
public:
    virtual ~ViewSurface() = default;
    virtual const ViewNode* root() const = 0;
    virtual bool hasFocus() const = 0;
    virtual NodePtr parseRegion(const ViewNode* parent, int from, int to, const Node& context) const = 0;
    virtual Selection selectionFromView(const NodePtr& doc, bool* ok) const = 0;
};

// Where reconciled changes are replayed
class ReplayTarget {
public:
    virtual ~ReplayTarget() = default;
    virtual void dispatchStructuralSplit() = 0;
    virtual void insertText(int from, int to, const QString& text, const SelectionRecovery& recover) = 0;
    virtual void applyReplacement(int from, int to, const Slice& slice,
                                  const SelectionRecovery& recover, bool scroll) = 0;
    virtual void markDirty(int from, int to) = 0;
    virtual void markAllDirty() = 0;
};

// ── Change decision ──

namespace change {
    struct StructuralSplit {};
    struct UniformText  { int from, to; QString text; };
    struct Replacement  { int from, to; Slice slice; };
}

using ChangeDecision = std::variant<
    change::StructuralSplit, change::UniformText, change::Replacement
>;

// ── Reconciliation steps ──

PosRange rangeAroundSelection(const NodePtr& doc, const Selection& sel);
PosRange rangeAroundComposition(const NodePtr& doc, const Selection& sel, int margin);

// Changed span between a (old) and b (new), both starting at pos. Ambiguous
// pure insertions/deletions are aligned on preferredStart when it lies
// between the colliding boundaries.
DiffResult findDiff(const Fragment& a, const Fragment& b, int pos, int preferredStart);

// Text between from and to when it consists only of text nodes sharing one
// mark set; *ok false otherwise
QString uniformTextBetween(const Node& node, int from, int to, bool* ok);

// `parsed` holds the new content of the range starting at `base`;
// mappedFrom/mappedTo are the change bounds in the current document
ChangeDecision classifyChange(const Node& parsed, const DiffResult& change, int base,
                              int mappedFrom, int mappedTo);

// ── Reconciler ──

class Reconciler {
public:
    Reconciler(const ViewSurface& view, ReplayTarget& target,
               const ReconcileOptions& options = {});

    bool reconcileAfterInputChange(const Operation& op);
    bool reconcileAfterComposition(const Operation& op, int margin);
    // Returns whether a model-changing action was taken
    bool readChange(const Operation& op, const PosRange& range);

    struct ParsedRegion {
        NodePtr  node;    // copy of the range's parent holding the parsed content
        PosRange range;   // estimate after widening to whole view children
    };
    ParsedRegion parseBetween(const Operation& op, PosRange range) const;

private:
    const ViewSurface& m_view;
    ReplayTarget&      m_target;
    ReconcileOptions   m_options;

    void markDirtyFor(const NodePtr& doc, int start, int end);
    SelectionRecovery selectionRecovery() const;
};

} // namespace vsx
