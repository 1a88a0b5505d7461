#include <QtTest/QTest>
#include "parser.h"
#include "doc_builders.h"

using namespace vsx;
using namespace vsx::build;

class TestParser : public QObject {
    Q_OBJECT
private slots:
    void renderedDocumentParsesBack() {
        NodePtr d = doc({h(3, {t("Title")}),
                         p({t("a"), em("b"), link("c", "http://x"), br(), img("i.png")}),
                         blockquote({p({t("q")})}),
                         ul({li({p({t("one")})}), li({p({t("two")}), p({t("more")})})}),
                         pre({t("x = 1\ny = 2")}),
                         hr(),
                         p()});
        auto root = renderDocument(*d);
        NodePtr back = parseView(root.get());
        QVERIFY2(back->eq(*d), qPrintable(back->toString()));
    }

    void markElementsBecomeMarks() {
        auto root = el("div", {raw("p", {text("a"), raw("b", {text("x")}), raw("i", {text("y")}),
                                         raw("span", {raw("strong", {text("z")})})})});
        QCOMPARE(parseView(root.get())->toString(),
                 QString("doc(paragraph(\"a\", strong(\"x\"), em(\"y\"), strong(\"z\")))"));
    }

    void nestedMarksCombine() {
        auto root = el("div", {raw("p", {raw("em", {text("a"), raw("strong", {text("b")})})})});
        NodePtr d = parseView(root.get());
        NodePtr second = d->child(0)->child(1);
        QCOMPARE(second->text(), QString("b"));
        QCOMPARE(second->marks().size(), 2);
    }

    void unknownWrappersAreTransparent() {
        auto root = el("div", {raw("section", {raw("p", {text("a")})}), raw("p", {text("b")})});
        QCOMPARE(parseView(root.get())->toString(),
                 QString("doc(paragraph(\"a\"), paragraph(\"b\"))"));
    }

    void strayInlineContentGetsParagraph() {
        auto root = el("div", {text("hi "), raw("em", {text("there")}), raw("p", {text("x")})});
        QCOMPARE(parseView(root.get())->toString(),
                 QString("doc(paragraph(\"hi \", em(\"there\")), paragraph(\"x\"))"));
    }

    void whitespaceBetweenBlocksIgnored() {
        auto root = el("div", {raw("p", {text("a")}), text("\n   "), raw("p", {text("b")})});
        NodePtr d = parseView(root.get());
        QCOMPARE(d->childCount(), 2);
        QCOMPARE(d->textContent(), QString("ab"));
    }

    void listContentIsWrapped() {
        auto root = el("div", {raw("ul", {raw("p", {text("x")}), raw("li", {text("y")})}),
                               raw("li", {raw("p", {text("orphan")})})});
        QCOMPARE(parseView(root.get())->toString(),
                 QString("doc(bullet_list(list_item(paragraph(\"x\")), list_item(paragraph(\"y\"))), "
                         "paragraph(\"orphan\"))"));
    }

    void codeBlockIsPlainText() {
        auto root = el("div", {raw("pre", {text("a"), raw("br"), raw("b", {text("c")}), raw("img")})});
        QCOMPARE(parseView(root.get())->toString(), QString("doc(code_block(\"a\nc\"))"));
    }

    void headingLevelFromTag() {
        auto root = el("div", {raw("h4", {text("x")})});
        NodePtr d = parseView(root.get());
        QCOMPARE(d->child(0)->kind(), NodeKind::Heading);
        QCOMPARE(d->child(0)->attrs().value("level").toInt(), 4);
    }

    void regionParsesIntoContextCopy() {
        auto root = renderDocument(*doc({p({t("ab"), em("cd")})}));
        NodePtr context = p({t("zz")});
        NodePtr parsed = parseRegion(root->childAt(0), 1, 2, *context);
        QCOMPARE(parsed->toString(), QString("paragraph(em(\"cd\"))"));
    }

    void whitespaceCollapsesWhenNotPreserved() {
        auto root = el("div", {raw("p", {text("a  \n b")})});
        ParseOptions opts;
        opts.preserveWhitespace = false;
        QCOMPARE(parseView(root.get(), opts)->child(0)->textContent(), QString("a b"));
        QCOMPARE(parseView(root.get())->child(0)->textContent(), QString("a  \n b"));
    }
};

QTEST_GUILESS_MAIN(TestParser)
#include "test_parser.moc"
