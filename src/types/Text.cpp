#include <types/Text.hpp>
#include <stdio.h>


Text::Text(std::string expression, Node* parent, CompileFlags flags) : Node(expression, parent, flags) {}

void Text::onEvaluate() {
    opener = expression;
}

void Text::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    printf("Text content '%s'\n", expression.c_str());
}
