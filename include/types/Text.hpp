#pragma once

#include <node.hpp>
#include <defs.h>


struct Text : Node { // a plain run of template text. It's emitted as-is; escaping for the literal happens at emission.
    Text(std::string expression, Node* parent, CompileFlags flags);

    void pTree(int tabLevel = 0);

protected:
    void onEvaluate();
};
