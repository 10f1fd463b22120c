#pragma once

#include <string>
#include <node.hpp>
#include <defs.h>


struct Code : Node { // embedded CoffeeScript. "- code" just runs, "= code" inserts its result into the output.
    enum Kind {
        Running,
        Inserting
    } kind = Running;

    std::string code; // the expression without its marker
    bool escape = false;

    Code(std::string expression, Node* parent, CompileFlags flags);

    std::string render(); // code nodes have no markup, so the base algorithm would never emit them

    bool opensBlock(); // ends in -> or =>, so the children are the body of a function passed to the code

    void pTree(int tabLevel = 0);

protected:
    void onEvaluate();
};
