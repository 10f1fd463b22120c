#include <types/Code.hpp>
#include <util.hpp>
#include <stdio.h>


Code::Code(std::string expression, Node* parent, CompileFlags flags) : Node(expression, parent, flags) {}

void Code::onEvaluate() {
    std::string marker;
    size_t markerEnd = 0;
    while (markerEnd < expression.size() && markerEnd < 2 && !isWhitespace(expression[markerEnd])) {
        char c = expression[markerEnd];
        if (c != '-' && c != '=' && c != '!' && c != '&') {
            break;
        }
        markerEnd ++;
    }
    marker = expression.substr(0, markerEnd);
    code = trim(expression.substr(markerEnd));
    if (marker == "-") {
        kind = Running;
    }
    else if (marker == "=") {
        kind = Inserting;
        escape = flags.escapeHtml;
    }
    else if (marker == "&=") {
        kind = Inserting;
        escape = true;
    }
    else if (marker == "!=") {
        kind = Inserting;
        escape = false;
    }
    else { // no usable marker, treat the whole thing as code to run
        printf(WARNING "Code node '%s' has no -, =, &= or != marker. It will be run without output.\n", expression.c_str());
        kind = Running;
        code = trim(expression);
    }
}

bool Code::opensBlock() {
    if (code.size() < 2) {
        return false;
    }
    std::string tail = code.substr(code.size() - 2);
    return tail == "->" || tail == "=>";
}

std::string Code::render() {
    checkEvaluated();
    std::string output;
    if (kind == Inserting && children.size() > 0 && opensBlock()) { // "= form ->": the call stays open around the body
        std::string call = OUTPUT_BUFFER ".push(";
        std::string close = ")";
        std::string ind = outputIndent();
        if (ind.size() > 0) {
            call += "\"" + ind + "\" + ";
        }
        if (escape) {
            call += ESCAPE_HELPER "(";
            close += ")";
        }
        output = emitRunningCode(call + code);
        for (Node* child : children) {
            output += child -> render();
        }
        return output + emitRunningCode(close);
    }
    if (kind == Running) {
        output = emitRunningCode(code);
    }
    else {
        if (children.size() > 0) {
            printf(WARNING "Inserting code '%s' has a block but doesn't end in -> or =>. The block is rendered after the value.\n", code.c_str());
        }
        output = emitComputedValue(code, escape);
    }
    for (Node* child : children) { // block bodies, e.g. under "- if x"
        output += child -> render();
    }
    return output;
}

void Code::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    if (kind == Running) {
        printf("Running code '%s'\n", code.c_str());
    }
    else {
        printf("Inserting code '%s'%s\n", code.c_str(), escape ? " (escaped)" : "");
    }
    for (Node* child : children) {
        child -> pTree(tabLevel + 1);
    }
}
