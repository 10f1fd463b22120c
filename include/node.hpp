#pragma once
#include <string>
#include <vector>
#include <compileflags.h>
#include <defs.h>


struct Node { // superclass for every template construct. Variants only fill in onEvaluate(); render() lives here.
    std::string expression; // the raw source fragment behind this node. Empty for the root.
    Node* parent = NULL; // observer only, never owns. The root has a NULL parent.
    std::vector<Node*> children; // owned: deleted along with this node

    std::string opener; // markup set by onEvaluate(); empty means there is none
    std::string closer;

    struct WhitespaceRemoval {
        bool around = false; // trim outside the tag pair
        bool inside = false; // trim just inside the tag pair
    } wsRemoval;

    bool silent = false; // children produce no output at all
    bool preserve = false; // whitespace inside this node is kept verbatim

    CompileFlags flags; // configuration from the compiler invocation, never changed after construction
    std::string codeIndent; // prefixed to every emitted line of CoffeeScript
    std::string htmlIndent; // prefixed to emitted markup

    bool evaluated = false;

    Node(std::string expression, Node* parent, CompileFlags flags);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    virtual ~Node();

    void evaluate(); // runs onEvaluate() exactly once. Must happen before children are attached or the node is rendered.

    Node* addChild(Node* child); // returns this, so siblings can be chained

    std::string getOpener(); // opener/closer with their whitespace sentinels

    std::string getCloser();

    bool isPreserved();

    std::string outputIndent(); // htmlIndent, unless we're somewhere inside a preserved region

    std::string emitStaticText(std::string text);

    std::string emitRunningCode(std::string code);

    std::string emitComputedValue(std::string code, bool escape);

    virtual std::string render(); // returns the CoffeeScript for this node and everything under it

    virtual void pTree(int tabLevel = 0);

protected:
    virtual void onEvaluate(); // the variant hook; the base version leaves every field at its default

    void checkEvaluated();
};


template <typename T>
T* build(std::string expression, Node* parent, CompileFlags flags) { // construct and evaluate in one go, the way the parser creates nodes
    T* node = new T(expression, parent, flags);
    node -> evaluate();
    return node;
}
