#pragma once
class QSettings;

namespace vsx {

// ── Reconciler settings ──

struct ReconcileOptions {
    int  compositionMargin = 0;     // content units around the caret re-read after IME updates
    bool scrollIntoView    = true;  // generic replacements scroll the selection into view
    bool traceDiffs        = false; // log every diff the reconciler computes

    static ReconcileOptions fromSettings(const QSettings& s);
    void toSettings(QSettings& s) const;
};

} // namespace vsx
