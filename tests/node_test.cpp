#include <gtest/gtest.h>
#include <string>
#include <node.hpp>
#include <types/Text.hpp>
#include <types/Tag.hpp>


namespace {

struct Shape {
    std::string opener;
    std::string closer;
    bool silent = false;
    bool preserve = false;
    bool around = false;
    bool inside = false;
};

// a node whose derived fields come straight from a Shape, so every render branch can be driven directly
struct ShapedNode : Node {
    Shape shape;

    ShapedNode(Shape s, Node* parent, CompileFlags flags) : Node("", parent, flags), shape(s) {}

protected:
    void onEvaluate() {
        opener = shape.opener;
        closer = shape.closer;
        silent = shape.silent;
        preserve = shape.preserve;
        wsRemoval.around = shape.around;
        wsRemoval.inside = shape.inside;
    }
};

struct CountingNode : Node { // counts renders and destructions
    int* renders;
    int* destroyed;

    CountingNode(int* r, int* d, Node* parent, CompileFlags flags) : Node("", parent, flags), renders(r), destroyed(d) {}

    ~CountingNode() {
        (*destroyed) ++;
    }

    std::string render() {
        (*renders) ++;
        return "counted\n";
    }
};

CompileFlags at(int blockLevel, int codeBlockLevel) {
    CompileFlags flags;
    flags.blockLevel = blockLevel;
    flags.codeBlockLevel = codeBlockLevel;
    return flags;
}

ShapedNode* shaped(Shape s, Node* parent, CompileFlags flags) {
    ShapedNode* node = new ShapedNode(s, parent, flags);
    node -> evaluate();
    return node;
}

Shape pair(std::string opener, std::string closer) {
    Shape s;
    s.opener = opener;
    s.closer = closer;
    return s;
}

}


TEST(NodeIndent, derivedFromNestingDepth) {
    Node node("", NULL, at(3, 1));
    EXPECT_EQ("  ", node.codeIndent);
    EXPECT_EQ("    ", node.htmlIndent);
}

TEST(NodeIndent, uglifyDropsHtmlIndent) {
    CompileFlags flags = at(3, 1);
    flags.uglify = true;
    Node node("", NULL, flags);
    EXPECT_EQ("  ", node.codeIndent);
    EXPECT_EQ("", node.htmlIndent);
}

TEST(NodeSentinels, allCombinations) {
    struct Case {
        bool around;
        bool inside;
        std::string opener;
        std::string closer;
    } cases[] = {
        { false, false, "<p>", "</p>" },
        { true, false, "\x11<p>", "</p>\x12" },
        { false, true, "<p>\x12", "\x11</p>" },
        { true, true, "\x11<p>\x12", "\x11</p>\x12" },
    };
    for (const Case& c : cases) {
        Shape s = pair("<p>", "</p>");
        s.around = c.around;
        s.inside = c.inside;
        ShapedNode* node = shaped(s, NULL, CompileFlags());
        EXPECT_EQ(c.opener, node -> getOpener()) << "around=" << c.around << " inside=" << c.inside;
        EXPECT_EQ(c.closer, node -> getCloser()) << "around=" << c.around << " inside=" << c.inside;
        delete node;
    }
}

TEST(NodePreserve, walksUpToTheRoot) {
    Node* root = build<Node>("", NULL, at(0, 0));
    Shape keep = pair("<pre>", "</pre>");
    keep.preserve = true;
    ShapedNode* pre = shaped(keep, root, at(0, 0));
    ShapedNode* inner = shaped(pair("<b>", "</b>"), pre, at(1, 0));
    Node* leaf = build<Text>("x", inner, at(2, 0));
    ShapedNode* sibling = shaped(pair("<p>", "</p>"), root, at(0, 0));
    inner -> addChild(leaf);
    pre -> addChild(inner);
    root -> addChild(pre) -> addChild(sibling);

    EXPECT_FALSE(root -> isPreserved());
    EXPECT_TRUE(pre -> isPreserved());
    EXPECT_TRUE(inner -> isPreserved());
    EXPECT_TRUE(leaf -> isPreserved());
    EXPECT_FALSE(sibling -> isPreserved());
    EXPECT_EQ("", leaf -> outputIndent());
    EXPECT_EQ("", sibling -> outputIndent());
    delete root;
}

TEST(NodeEmit, staticTextIsIndentedAndEscaped) {
    Node node("", NULL, at(2, 1));
    node.evaluate();
    EXPECT_EQ("  $o.push \"  say \\\"hi\\\"\"\n", node.emitStaticText("say \"hi\""));
}

TEST(NodeEmit, runningCodeIsOnlyIndented) {
    Node node("", NULL, at(2, 2));
    node.evaluate();
    EXPECT_EQ("    if user.admin\n", node.emitRunningCode("if user.admin"));
}

TEST(NodeEmit, computedValueWithoutIndentation) {
    Node node("", NULL, at(0, 0));
    node.evaluate();
    EXPECT_EQ("$o.push $e(name)\n", node.emitComputedValue("name", true));
    EXPECT_EQ("$o.push name\n", node.emitComputedValue("name", false));
}

TEST(NodeEmit, computedValueKeepsIndentationOutsideTheEscape) {
    Node node("", NULL, at(2, 1));
    node.evaluate();
    EXPECT_EQ("  $o.push \"  #{$e(name)}\"\n", node.emitComputedValue("name", true));
    EXPECT_EQ("  $o.push \"  #{name}\"\n", node.emitComputedValue("name", false));
}

TEST(NodeRender, emptyTreeRendersNothing) {
    Node* root = build<Node>("", NULL, at(0, 0));
    EXPECT_EQ("", root -> render());
    delete root;
}

TEST(NodeRender, emptyTagPairIsOneStatement) {
    ShapedNode* node = shaped(pair("<p>", "</p>"), NULL, at(2, 1));
    EXPECT_EQ("  $o.push \"  <p></p>\"\n", node -> render());
    delete node;
}

TEST(NodeRender, emptyTagPairCarriesSentinels) {
    Shape s = pair("<p>", "</p>");
    s.around = true;
    ShapedNode* node = shaped(s, NULL, at(0, 0));
    EXPECT_EQ("$o.push \"\x11<p></p>\x12\"\n", node -> render());
    delete node;
}

TEST(NodeRender, selfClosingTag) {
    ShapedNode* node = shaped(pair("<br>", ""), NULL, at(1, 0));
    EXPECT_EQ("$o.push \"  <br>\"\n", node -> render());
    delete node;
}

TEST(NodeRender, selfClosingInsidePreservedRegionIsRaw) {
    Shape keep = pair("<pre>", "</pre>");
    keep.preserve = true;
    ShapedNode* pre = shaped(keep, NULL, at(0, 0));
    ShapedNode* br = shaped(pair("<br>", ""), pre, at(1, 0));
    pre -> addChild(br);
    EXPECT_EQ("<br>", br -> render());
    delete pre;
}

TEST(NodeRender, selfClosingThatPreservesItselfStillEmits) {
    Shape s = pair("<br>", "");
    s.preserve = true;
    ShapedNode* node = shaped(s, NULL, at(1, 0));
    EXPECT_EQ("$o.push \"<br>\"\n", node -> render());
    delete node;
}

TEST(NodeRender, noMarkupNoChildrenIsEmpty) {
    ShapedNode* node = shaped(Shape(), NULL, at(1, 0));
    EXPECT_EQ("", node -> render());
    delete node;
}

TEST(NodeRender, closerWithoutOpenerAndNoChildrenIsEmpty) {
    ShapedNode* node = shaped(pair("", "</p>"), NULL, at(0, 0));
    EXPECT_EQ("", node -> render());
    delete node;
}

TEST(NodeRender, preservedSubtreeIsOneLiteral) {
    Shape keep = pair("<pre>", "</pre>");
    keep.preserve = true;
    ShapedNode* pre = shaped(keep, NULL, at(1, 0));
    pre -> addChild(build<Text>("first", pre, at(2, 0)));
    pre -> addChild(build<Text>("  second", pre, at(2, 0)));
    EXPECT_EQ("$o.push \"<pre>first\\n  second</pre>\"\n", pre -> render());
    delete pre;
}

TEST(NodeRender, preservedSubtreeWithSingleChild) {
    Shape keep = pair("<textarea>", "</textarea>");
    keep.preserve = true;
    ShapedNode* area = shaped(keep, NULL, at(0, 0));
    area -> addChild(build<Text>("x", area, at(1, 0)));
    EXPECT_EQ("$o.push \"<textarea>x</textarea>\"\n", area -> render());
    delete area;
}

TEST(NodeRender, tagWithChildrenEmitsSeparateStatements) {
    ShapedNode* div = shaped(pair("<div>", "</div>"), NULL, at(0, 0));
    div -> addChild(build<Text>("a", div, at(1, 0)));
    div -> addChild(build<Text>("b", div, at(1, 0)));
    EXPECT_EQ(
        "$o.push \"<div>\"\n"
        "$o.push \"  a\"\n"
        "$o.push \"  b\"\n"
        "$o.push \"</div>\"\n", div -> render());
    delete div;
}

TEST(NodeRender, silentNodeSkipsItsChildrenEntirely) {
    int renders = 0;
    int destroyed = 0;
    Shape s;
    s.silent = true;
    ShapedNode* node = shaped(s, NULL, at(0, 0));
    CountingNode* counter = new CountingNode(&renders, &destroyed, node, at(1, 0));
    counter -> evaluate();
    node -> addChild(counter);
    node -> addChild(build<Text>("hidden", node, at(1, 0)));
    EXPECT_EQ("", node -> render());
    EXPECT_EQ(0, renders);
    delete node;
}

TEST(NodeRender, silentIsIgnoredWhenThereIsATagPair) {
    Shape s = pair("<p>", "</p>");
    s.silent = true;
    ShapedNode* node = shaped(s, NULL, at(0, 0));
    node -> addChild(build<Text>("shown", node, at(1, 0)));
    EXPECT_EQ("$o.push \"<p>\"\n$o.push \"  shown\"\n$o.push \"</p>\"\n", node -> render());
    delete node;
}

TEST(NodeRender, wrapperConcatenatesChildren) {
    int renders = 0;
    int destroyed = 0;
    Node* root = build<Node>("", NULL, at(0, 0));
    CountingNode* counter = new CountingNode(&renders, &destroyed, root, at(0, 0));
    counter -> evaluate();
    root -> addChild(build<Text>("a", root, at(0, 0))) -> addChild(counter);
    EXPECT_EQ("$o.push \"a\"\ncounted\n", root -> render());
    EXPECT_EQ(1, renders);
    delete root;
}

TEST(NodeRender, twoLevelTree) {
    Node* root = build<Node>("", NULL, at(0, 0));
    Tag* div = build<Tag>("%div", root, at(0, 0));
    div -> addChild(build<Text>("hi", div, at(1, 0)));
    root -> addChild(div);
    EXPECT_EQ(
        "$o.push \"<div>\"\n"
        "$o.push \"  hi\"\n"
        "$o.push \"</div>\"\n", root -> render());
    delete root;
}

TEST(NodeRender, renderDoesNotChangeTheTree) {
    Shape keep = pair("<pre>", "</pre>");
    keep.preserve = true;
    ShapedNode* pre = shaped(keep, NULL, at(0, 0));
    pre -> addChild(build<Text>("x", pre, at(1, 0)));
    std::string first = pre -> render();
    EXPECT_FALSE(pre -> wsRemoval.inside);
    EXPECT_EQ("<pre>", pre -> opener);
    EXPECT_EQ(first, pre -> render());
    delete pre;
}

TEST(NodeTree, addChildChainsOnTheParent) {
    Node* root = build<Node>("", NULL, at(0, 0));
    Node* a = build<Text>("a", root, at(0, 0));
    Node* b = build<Text>("b", root, at(0, 0));
    EXPECT_EQ(root, root -> addChild(a) -> addChild(b));
    ASSERT_EQ(2u, root -> children.size());
    EXPECT_EQ(a, root -> children[0]);
    EXPECT_EQ(b, root -> children[1]);
    EXPECT_EQ(root, b -> parent);
    delete root;
}

TEST(NodeTree, childrenAreDestroyedWithTheirParent) {
    int renders = 0;
    int destroyed = 0;
    Node* root = build<Node>("", NULL, at(0, 0));
    for (int i = 0; i < 3; i ++) {
        CountingNode* counter = new CountingNode(&renders, &destroyed, root, at(0, 0));
        counter -> evaluate();
        root -> addChild(counter);
    }
    delete root;
    EXPECT_EQ(3, destroyed);
}

TEST(NodeTree, pTreePrintsEveryNode) {
    Node* root = build<Node>("", NULL, at(0, 0));
    Tag* p = build<Tag>("%p", root, at(0, 0));
    p -> addChild(build<Text>("hello", p, at(1, 0)));
    root -> addChild(p);
    testing::internal::CaptureStdout();
    root -> pTree();
    std::string printed = testing::internal::GetCapturedStdout();
    EXPECT_EQ("Node (root)\n\tTag p\n\t\tText content 'hello'\n", printed);
    delete root;
}

TEST(NodeContractDeathTest, renderBeforeEvaluate) {
    Node node("", NULL, CompileFlags());
    EXPECT_DEATH(node.render(), "before it was evaluated");
}

TEST(NodeContractDeathTest, evaluateTwice) {
    Node node("", NULL, CompileFlags());
    node.evaluate();
    EXPECT_DEATH(node.evaluate(), "evaluated twice");
}

TEST(NodeContractDeathTest, attachBeforeEvaluate) {
    Node node("", NULL, CompileFlags());
    Text* child = build<Text>("x", NULL, CompileFlags());
    EXPECT_DEATH(node.addChild(child), "never evaluated");
    delete child;
}

TEST(NodeContractDeathTest, attachToSecondParent) {
    Node* first = build<Node>("", NULL, CompileFlags());
    Node* second = build<Node>("", NULL, CompileFlags());
    Text* child = build<Text>("x", first, CompileFlags());
    first -> addChild(child);
    EXPECT_DEATH(second -> addChild(child), "second parent");
    delete first;
    delete second;
}
