// the compileflags struct
#pragma once
#include <string>


struct CompileFlags {
    enum Format {
        HTML5,
        XHTML,
        HTML4
    } format = HTML5;

    bool escapeHtml = true; // does `= code` pass its result through the escaping helper?
    bool escapeAttributes = true;
    bool uglify = false; // no html indentation at all

    int codeBlockLevel = 0; // how many code blocks (- if, - for) enclose the node
    int blockLevel = 0; // total nesting depth, code blocks included

    // comma-separated tag names
    std::string selfCloseTags = "meta,img,link,br,hr,input,area,param,col,base";
    std::string preserveTags = "pre,textarea";
};
