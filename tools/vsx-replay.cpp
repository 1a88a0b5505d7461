// vsx-replay: Replays a recorded view mutation against a document.
//
// A scenario JSON file holds the document and selection at batch start,
// optional edits already applied in the batch, the mutated view tree and the
// caret in it. The reconciled document is printed to stdout as JSON.
//
//   {
//     "doc":        { "type": "doc", "content": [...] },
//     "selection":  { "anchor": 3, "head": 3 },
//     "priorEdits": [ { "from": 1, "to": 1, "slice": {...} } ],
//     "view":       { "tag": "div", "children": [...] },
//     "caret":      { "anchor": { "path": [0, 0], "offset": 2 }, "head": ... },
//     "focus":      true
//   }

#include "controller.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QSettings>
#include <QTextStream>
#include <cstdio>

using namespace vsx;

static ViewPoint pointFromJson(const ViewElement* root, const QJsonObject& o, bool* ok) {
    const ViewNode* node = root;
    for (const QJsonValue& v : o["path"].toArray()) {
        int i = v.toInt(-1);
        if (i < 0 || i >= node->childCount()) {
            *ok = false;
            return {};
        }
        node = node->childAt(i);
    }
    *ok = true;
    return {node, o["offset"].toInt()};
}

static bool applyPriorEdits(EditorController& ctrl, const QJsonArray& edits, QString* error) {
    for (const QJsonValue& v : edits) {
        QJsonObject e = v.toObject();
        Slice slice = Slice::fromJson(e["slice"].toObject(), error);
        if (!error->isEmpty()) return false;
        Transaction tr(ctrl.document()->doc);
        if (!tr.replace(e["from"].toInt(), e["to"].toInt(), slice, error)) return false;
        ctrl.apply(tr);
    }
    return true;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("vsx-replay");

    QCommandLineParser parser;
    parser.setApplicationDescription("Reconcile a mutated view tree with its document");
    parser.addHelpOption();
    parser.addPositionalArgument("scenario", "Scenario JSON file");
    QCommandLineOption configOpt("config", "Read reconcile settings from an INI file.", "file");
    QCommandLineOption compositionOpt("composition", "Treat the mutation as an IME composition update.");
    QCommandLineOption marginOpt("margin", "Composition margin (overrides settings).", "n");
    QCommandLineOption traceOpt("trace", "Log every computed diff.");
    parser.addOption(configOpt);
    parser.addOption(compositionOpt);
    parser.addOption(marginOpt);
    parser.addOption(traceOpt);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        fprintf(stderr, "[Replay] expected one scenario file\n");
        return 2;
    }

    ReconcileOptions options = parser.isSet(configOpt)
        ? ReconcileOptions::fromSettings(QSettings(parser.value(configOpt), QSettings::IniFormat))
        : ReconcileOptions::fromSettings(QSettings("ViewSync", "ViewSync"));
    if (parser.isSet(traceOpt)) options.traceDiffs = true;

    QFile file(args.first());
    if (!file.open(QIODevice::ReadOnly)) {
        fprintf(stderr, "[Replay] cannot open %s\n", qPrintable(args.first()));
        return 1;
    }
    QJsonParseError perr;
    QJsonObject scenario = QJsonDocument::fromJson(file.readAll(), &perr).object();
    if (perr.error != QJsonParseError::NoError) {
        fprintf(stderr, "[Replay] %s: %s\n", qPrintable(args.first()), qPrintable(perr.errorString()));
        return 1;
    }

    EditorDocument doc;
    LoadResult loaded = doc.loadJson(scenario);
    if (!loaded.ok) {
        fprintf(stderr, "[Replay] bad document: %s\n", qPrintable(loaded.error));
        return 1;
    }

    ViewDocument view;
    EditorController ctrl(&doc, &view);
    ctrl.setOptions(options);
    ctrl.startOperation();

    QString error;
    if (!applyPriorEdits(ctrl, scenario["priorEdits"].toArray(), &error)) {
        fprintf(stderr, "[Replay] prior edit failed: %s\n", qPrintable(error));
        return 1;
    }

    if (scenario["view"].isObject()) {
        auto root = ViewElement::fromJson(scenario["view"].toObject(), &error);
        if (!root) {
            fprintf(stderr, "[Replay] bad view tree: %s\n", qPrintable(error));
            return 1;
        }
        view.setRoot(std::move(root));
    }
    view.setFocus(scenario["focus"].toBool(true));

    QJsonObject caret = scenario["caret"].toObject();
    if (caret.contains("head")) {
        bool okHead = false, okAnchor = false;
        ViewPoint head = pointFromJson(view.rootElement(), caret["head"].toObject(), &okHead);
        ViewPoint anchor = caret.contains("anchor")
            ? pointFromJson(view.rootElement(), caret["anchor"].toObject(), &okAnchor)
            : head;
        if (!okHead || (caret.contains("anchor") && !okAnchor)) {
            fprintf(stderr, "[Replay] caret path does not exist in the view\n");
            return 1;
        }
        view.setCaret(anchor, head);
    }

    bool changed = parser.isSet(compositionOpt)
        ? ctrl.readCompositionChange(parser.isSet(marginOpt) ? parser.value(marginOpt).toInt() : -1)
        : ctrl.readInputChange();
    ctrl.endOperation();

    if (!changed) qDebug() << "[Replay] no change applied";

    QTextStream out(stdout);
    out << QJsonDocument(doc.toJson()).toJson(QJsonDocument::Indented);
    return 0;
}
