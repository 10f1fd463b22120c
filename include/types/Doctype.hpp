#pragma once

#include <node.hpp>
#include <defs.h>


struct Doctype : Node { // "!!!" with an optional type, resolved against the output format
    Doctype(std::string expression, Node* parent, CompileFlags flags);

protected:
    void onEvaluate();
};
