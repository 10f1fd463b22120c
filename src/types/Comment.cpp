#include <types/Comment.hpp>
#include <util.hpp>
#include <stdio.h>


Comment::Comment(std::string expression, Node* parent, CompileFlags flags) : Node(expression, parent, flags) {}

void Comment::onEvaluate() {
    if (expression.compare(0, 2, "-#") == 0) {
        silent = true;
        return;
    }
    if (expression.size() == 0 || expression[0] != '/') {
        printf(WARNING "'%s' is not a comment. It will be dropped.\n", expression.c_str());
        silent = true;
        return;
    }
    std::string text = trim(expression.substr(1));
    if (text.size() > 0 && text[0] == '[') { // conditional comment, /[if IE]
        conditional = true;
        opener = "<!--" + text + ">";
        closer = "<![endif]-->";
    }
    else if (text.size() > 0) {
        opener = "<!-- " + text + " -->";
    }
    else {
        opener = "<!--";
        closer = "-->";
    }
}

void Comment::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    if (silent) {
        printf("Silent comment\n");
    }
    else {
        printf("HTML comment%s\n", conditional ? " (conditional)" : "");
    }
    for (Node* child : children) {
        child -> pTree(tabLevel + 1);
    }
}
