#pragma once

#include <node.hpp>
#include <defs.h>


struct Comment : Node { // "-#" is a template comment and never reaches the output; "/" is an HTML comment
    bool conditional = false;

    Comment(std::string expression, Node* parent, CompileFlags flags);

    void pTree(int tabLevel = 0);

protected:
    void onEvaluate();
};
