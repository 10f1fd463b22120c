// Session holds the configuration for one compiler invocation and drives the render of a finished tree.
// Configure it first; nodes copy its flags when they're built, so later changes don't reach existing nodes.
#pragma once
#include <defs.h>
#include <string>
#include <compileflags.h>
#include <codewriter.hpp>
#include <node.hpp>


struct Session {
    CompileFlags flags;
    bool verbose = false; // print an INFO line per compile

    bool configure(std::string name, std::string value); // returns false (and warns) on an unknown key or bad value

    CompileFlags flagsAt(int blockLevel, int codeBlockLevel); // the session flags with the nesting levels filled in

    Node* createRoot(); // an evaluated, markup-free root node. The caller owns it.

    void compile(Node* root, WriteOutput& out); // render the tree and resolve the whitespace sentinels into out

    std::string compile(Node* root);
};
