#include <QtTest/QTest>
#include "viewtree.h"
#include "doc_builders.h"

using namespace vsx;
using namespace vsx::build;

class TestViewTree : public QObject {
    Q_OBJECT
private slots:
    // -- Rendering --

    void renderTracksModelSizes() {
        auto root = renderDocument(*doc({p({t("ab"), em("cd")})}));
        QCOMPARE(root->tag(), QString("div"));
        QVERIFY(!root->isTracked());
        QCOMPARE(root->childCount(), 1);

        const ViewNode* para = root->childAt(0);
        QCOMPARE(para->tag(), QString("p"));
        QVERIFY(para->isTracked());
        QCOMPARE(para->modelSize(), 6);
        QCOMPARE(para->childCount(), 2);
        QCOMPARE(para->childAt(0)->tag(), QString("span"));
        QCOMPARE(para->childAt(0)->modelSize(), 2);
        QCOMPARE(para->childAt(1)->tag(), QString("em"));
        QCOMPARE(para->childAt(1)->childAt(0)->text(), QString("cd"));
    }

    void renderBlockVariants() {
        auto root = renderDocument(*doc({h(2, {t("T")}), p({img("x.png"), br()}), hr()}));
        QCOMPARE(root->childAt(0)->tag(), QString("h2"));
        const ViewNode* image = root->childAt(1)->childAt(0);
        QCOMPARE(image->tag(), QString("img"));
        QCOMPARE(image->attr("src"), QString("x.png"));
        QCOMPARE(image->modelSize(), 1);
        QCOMPARE(root->childAt(1)->childAt(1)->tag(), QString("br"));
        QCOMPARE(root->childAt(2)->tag(), QString("hr"));
    }

    void renderNestedMarks() {
        NodePtr both = Node::text("x", addToSet(Mark{MarkKind::Strong, {}}, MarkSet{Mark{MarkKind::Link, "u"}}));
        auto root = renderDocument(*doc({p({both})}));
        const ViewNode* outer = root->childAt(0)->childAt(0);
        QCOMPARE(outer->tag(), QString("a"));
        QCOMPARE(outer->attr("href"), QString("u"));
        QVERIFY(outer->isTracked());
        QCOMPARE(outer->childAt(0)->tag(), QString("strong"));
        QVERIFY(!outer->childAt(0)->isTracked());
    }

    // -- Coordinates --

    void viewPointLoose() {
        auto root = renderDocument(*doc({p({t("ab"), em("cd")})}));
        const ViewNode* para = root->childAt(0);

        ViewPoint a = viewPointFromPos(root.get(), 0, true);
        QVERIFY(a.node == root.get());
        QCOMPARE(a.offset, 0);

        ViewPoint b = viewPointFromPos(root.get(), 1, true);
        QVERIFY(b.node == para);
        QCOMPARE(b.offset, 0);

        ViewPoint c = viewPointFromPos(root.get(), 5, true);
        QVERIFY(c.node == para);
        QCOMPARE(c.offset, 2);

        ViewPoint d = viewPointFromPos(root.get(), 6, true);
        QVERIFY(d.node == root.get());
        QCOMPARE(d.offset, 1);
    }

    void viewPointStrictDescendsIntoText() {
        auto root = renderDocument(*doc({p({t("ab"), em("cd")})}));
        ViewPoint pt = viewPointFromPos(root.get(), 2, false);
        QVERIFY(pt.node->isText());
        QCOMPARE(pt.node->text(), QString("ab"));
        QCOMPARE(pt.offset, 1);

        ViewPoint inEm = viewPointFromPos(root.get(), 4, false);
        QCOMPARE(inEm.node->text(), QString("cd"));
        QCOMPARE(inEm.offset, 1);
    }

    void posFromViewPointMatchesRender() {
        auto root = renderDocument(*doc({p({t("ab"), em("cd")}), p({t("ef")})}));
        for (int pos = 0; pos <= 10; pos++) {
            ViewPoint pt = viewPointFromPos(root.get(), pos, false);
            QCOMPARE(posFromViewPoint(root.get(), pt), pos);
        }
    }

    void posFromViewPointUsesCurrentContent() {
        auto root = renderDocument(*doc({p({t("ab")}), p({t("cd")})}));
        ViewElement* firstText = root->child(0)->firstText();
        firstText->setText("abXY");
        ViewElement* secondText = root->child(1)->firstText();
        QCOMPARE(posFromViewPoint(root.get(), {secondText, 1}), 8);
        QCOMPARE(viewContentSize(root->childAt(0)), 6);
        // Tracked sizes keep describing the rendered document
        QCOMPARE(root->childAt(0)->modelSize(), 4);
    }

    void untrackedSiblingsAreSkipped() {
        auto root = renderDocument(*doc({p({t("ab")})}));
        root->insertChild(0, el("p", {text("new")}));
        ViewPoint pt = viewPointFromPos(root.get(), 0, true);
        QVERIFY(pt.node == root.get());
        QCOMPARE(pt.offset, 1);
        QCOMPARE(viewContentSize(root.get()), 9);
    }

    // -- Tree editing --

    void takeAndCloneChildren() {
        auto root = renderDocument(*doc({p({t("ab")}), p({t("cd")})}));
        auto copy = root->clone();
        QVERIFY(copy->childAt(1)->isTracked());
        QCOMPARE(copy->childAt(1)->modelSize(), 4);

        auto taken = root->takeChild(0);
        QVERIFY(taken->parentNode() == nullptr);
        QCOMPARE(root->childCount(), 1);
        QCOMPARE(root->childAt(0)->indexInParent(), 0);
        QVERIFY(!root->takeChild(5));
    }

    void jsonKeepsTracking() {
        auto root = renderDocument(*doc({p({link("ab", "u")})}));
        QString err;
        auto back = ViewElement::fromJson(root->toJson(), &err);
        QVERIFY2(back, qPrintable(err));
        QCOMPARE(back->childAt(0)->modelSize(), 4);
        QCOMPARE(back->childAt(0)->childAt(0)->attr("href"), QString("u"));
        QVERIFY(!back->isTracked());

        QJsonObject bad{{"children", QJsonArray{}}};
        QVERIFY(!ViewElement::fromJson(bad, &err));
        QVERIFY(!err.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestViewTree)
#include "test_viewtree.moc"
