#include <node.hpp>
#include <util.hpp>
#include <stdio.h>


Node::Node(std::string expr, Node* par, CompileFlags fl) : expression(expr), parent(par), flags(fl) {
    codeIndent = indent(flags.codeBlockLevel);
    if (!flags.uglify) {
        htmlIndent = indent(flags.blockLevel - flags.codeBlockLevel); // code blocks don't nest any markup
    }
}

Node::~Node() {
    for (Node* child : children) {
        delete child;
    }
}

void Node::evaluate() {
    if (evaluated) {
        contractViolation("Node evaluated twice. Opener, closer and flags may only be derived once.");
    }
    onEvaluate();
    evaluated = true;
}

void Node::onEvaluate() {}

void Node::checkEvaluated() {
    if (!evaluated) {
        contractViolation("Node rendered before it was evaluated.");
    }
}

Node* Node::addChild(Node* child) {
    if (!evaluated) {
        contractViolation("Child attached to a node that was never evaluated.");
    }
    if (child -> parent != NULL && child -> parent != this) {
        contractViolation("Child attached to a second parent.");
    }
    for (Node* existing : children) {
        if (existing == child) {
            contractViolation("Child attached twice to the same parent.");
        }
    }
    child -> parent = this;
    children.push_back(child);
    return this;
}

std::string Node::getOpener() {
    std::string ret;
    if (wsRemoval.around) {
        ret += TRIM_LEFT;
    }
    ret += opener;
    if (wsRemoval.inside) {
        ret += TRIM_RIGHT;
    }
    return ret;
}

std::string Node::getCloser() { // mirror image of getOpener: the inside sentinels bracket the content
    std::string ret;
    if (wsRemoval.inside) {
        ret += TRIM_LEFT;
    }
    ret += closer;
    if (wsRemoval.around) {
        ret += TRIM_RIGHT;
    }
    return ret;
}

bool Node::isPreserved() {
    if (preserve) {
        return true;
    }
    if (parent == NULL) {
        return false;
    }
    return parent -> isPreserved();
}

std::string Node::outputIndent() {
    if (isPreserved()) {
        return "";
    }
    return htmlIndent;
}

std::string Node::emitStaticText(std::string text) {
    return codeIndent + OUTPUT_BUFFER ".push \"" + escapeLiteral(outputIndent() + text) + "\"\n";
}

std::string Node::emitRunningCode(std::string code) {
    return codeIndent + code + "\n";
}

std::string Node::emitComputedValue(std::string code, bool escape) {
    std::string value = code;
    if (escape) {
        value = ESCAPE_HELPER "(" + code + ")";
    }
    std::string ind = outputIndent();
    if (ind.size() == 0) { // nothing to prepend, so skip the string concatenation
        return codeIndent + OUTPUT_BUFFER ".push " + value + "\n";
    }
    return codeIndent + OUTPUT_BUFFER ".push \"" + ind + "#{" + value + "}\"\n"; // indentation stays outside the escape call
}

std::string Node::render() {
    checkEvaluated();
    std::string output;
    bool tagPair = opener.size() > 0 && closer.size() > 0;
    if (children.size() == 0) {
        if (tagPair) { // empty element, <p></p>
            output = emitStaticText(getOpener() + getCloser());
        }
        else if (opener.size() > 0) {
            if (!preserve && isPreserved()) { // an ancestor folds us into its own literal
                output = getOpener();
            }
            else {
                output = emitStaticText(getOpener());
            }
        }
    }
    else if (tagPair) {
        if (preserve) { // the whole subtree becomes one literal so nothing gets re-indented
            std::string block = getOpener();
            for (Node* child : children) {
                block += child -> render();
                block += '\n';
            }
            block.pop_back();
            block += getCloser();
            output = emitStaticText(block);
        }
        else {
            output = emitStaticText(getOpener());
            for (Node* child : children) {
                output += child -> render();
            }
            output += emitStaticText(getCloser());
        }
    }
    else if (!silent) { // silent nodes don't even render their children
        for (Node* child : children) {
            output += child -> render();
        }
    }
    return output;
}

void Node::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    printf("Node");
    if (expression.size() > 0) {
        printf(" '%s'", expression.c_str());
    }
    if (parent == NULL) {
        printf(" (root)");
    }
    if (silent) {
        printf(" silent");
    }
    if (preserve) {
        printf(" preserve");
    }
    printf("\n");
    for (Node* child : children) {
        child -> pTree(tabLevel + 1);
    }
}
