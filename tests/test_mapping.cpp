#include <QtTest/QTest>
#include "mapping.h"
#include "doc_builders.h"

using namespace vsx;
using namespace vsx::build;

class TestMapping : public QObject {
    Q_OBJECT
private slots:
    // -- StepMap --

    void insertionShiftsLaterPositions() {
        StepMap m = StepMap::forReplace(3, 3, 2);
        QCOMPARE(m.map(1), 1);
        QCOMPARE(m.map(5), 7);
        QCOMPARE(m.map(3, 1), 5);
        QCOMPARE(m.map(3, -1), 3);
        QVERIFY(!m.mapResult(3).deleted);
    }

    void deletionCollapsesRange() {
        StepMap m = StepMap::forReplace(2, 6, 0);
        QCOMPARE(m.map(1), 1);
        QCOMPARE(m.map(4), 2);
        QCOMPARE(m.map(8), 4);
        QVERIFY(m.mapResult(4).deleted);
        QVERIFY(m.mapResult(3, -1).deleted);
        // Both edges survive on either side
        QVERIFY(!m.mapResult(2, 1).deleted);
        QVERIFY(!m.mapResult(2, -1).deleted);
        QVERIFY(!m.mapResult(6, 1).deleted);
        QVERIFY(!m.mapResult(6, -1).deleted);
        QCOMPARE(m.map(2, 1), 2);
        QCOMPARE(m.map(6, -1), 2);
    }

    void replacementMapsEdges() {
        StepMap m = StepMap::forReplace(2, 4, 5);
        QCOMPARE(m.map(2, -1), 2);
        QCOMPARE(m.map(4, 1), 7);
        QCOMPARE(m.map(10), 13);
    }

    // -- Mapping --

    void composedInsertionsAccumulate() {
        Mapping m;
        m.appendMap(StepMap::forReplace(1, 1, 3));
        m.appendMap(StepMap::forReplace(1, 1, 2));
        QCOMPARE(m.size(), 2);
        QCOMPARE(m.map(2), 7);
        QCOMPARE(m.map(0), 0);
    }

    void deletedFlagSticksAcrossMaps() {
        Mapping m;
        m.appendMap(StepMap::forReplace(2, 5, 0));
        m.appendMap(StepMap::forReplace(0, 0, 4));
        MapResult r = m.mapResult(3);
        QVERIFY(r.deleted);
        QCOMPARE(r.pos, 6);
    }

    void mapThroughFromOffset() {
        QVector<StepMap> maps{StepMap::forReplace(1, 1, 3), StepMap::forReplace(1, 1, 2)};
        QCOMPARE(mapThroughResult(maps, 2, 1, 1).pos, 4);
        QCOMPARE(mapThroughResult(maps, 2, 1, 0).pos, 7);
    }

    void appendMappingKeepsOrder() {
        Mapping a, b;
        a.appendMap(StepMap::forReplace(1, 1, 1));
        b.appendMap(StepMap::forReplace(0, 2, 0));
        a.appendMapping(b);
        QCOMPARE(a.size(), 2);
        QCOMPARE(a.map(5), 4);
    }

    // -- Selection --

    void selectionMapsBothEnds() {
        Selection s{5, 2};
        QCOMPARE(s.from(), 2);
        QCOMPARE(s.to(), 5);
        Mapping m;
        m.appendMap(StepMap::forReplace(1, 1, 2));
        Selection mapped = s.map(m);
        QCOMPARE(mapped.anchor, 7);
        QCOMPARE(mapped.head, 4);
        QVERIFY(Selection::cursor(3).empty());
    }

    // -- Transaction --

    void transactionRecordsSteps() {
        NodePtr start = doc({p({t("abcd")})});
        Transaction tr(start);
        QVERIFY(!tr.docChanged());
        QVERIFY(tr.replace(2, 4, Slice(Fragment::from(t("XY")), 0, 0)));
        QVERIFY(tr.insertText(1, 1, "Z"));
        QVERIFY(tr.docChanged());
        QCOMPARE(tr.mapping().size(), 2);
        QCOMPARE(tr.doc()->toString(), QString("doc(paragraph(\"ZaXYd\"))"));
        QVERIFY(tr.before() == start);
        QCOMPARE(tr.changedRange().from, 1);
        QCOMPARE(tr.changedRange().to, 5);
    }

    void failedStepLeavesTransaction() {
        Transaction tr(doc({p({t("ab")})}));
        QString err;
        QVERIFY(!tr.replace(1, 40, Slice(), &err));
        QVERIFY(!err.isEmpty());
        QVERIFY(!tr.docChanged());
        QVERIFY(tr.doc() == tr.before());
    }

    void selectionAndScrollFlags() {
        Transaction tr(doc({p({t("ab")})}));
        QVERIFY(!tr.selectionSet());
        tr.setSelection(Selection::cursor(2));
        tr.setScrollIntoView();
        QVERIFY(tr.selectionSet());
        QVERIFY(tr.scrolledIntoView());
        QVERIFY(tr.selection() == Selection::cursor(2));
    }
};

QTEST_GUILESS_MAIN(TestMapping)
#include "test_mapping.moc"
