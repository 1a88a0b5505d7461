#include "options.h"
#include <QSettings>

namespace vsx {

ReconcileOptions ReconcileOptions::fromSettings(const QSettings& s) {
    ReconcileOptions o;
    o.compositionMargin = qMax(0, s.value("reconcile/compositionMargin", o.compositionMargin).toInt());
    o.scrollIntoView    = s.value("reconcile/scrollIntoView", o.scrollIntoView).toBool();
    o.traceDiffs        = s.value("reconcile/traceDiffs", o.traceDiffs).toBool();
    return o;
}

void ReconcileOptions::toSettings(QSettings& s) const {
    s.setValue("reconcile/compositionMargin", compositionMargin);
    s.setValue("reconcile/scrollIntoView", scrollIntoView);
    s.setValue("reconcile/traceDiffs", traceDiffs);
}

} // namespace vsx
