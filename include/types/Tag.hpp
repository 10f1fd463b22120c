#pragma once

#include <string>
#include <node.hpp>
#include <defs.h>


// An element: %name.class#id(attributes) followed by any of the modifiers > < /
// Only the (name="value") attribute form is understood. A {...} hash is skipped with a warning, since
// turning it into markup would mean evaluating host code at compile time.
struct Tag : Node {
    std::string name;
    std::string attributes; // everything that ends up between the tag name and the >
    bool selfClosing = false;

    Tag(std::string expression, Node* parent, CompileFlags flags);

    void pTree(int tabLevel = 0);

protected:
    void onEvaluate();
};
