#include <types/Tag.hpp>
#include <util.hpp>
#include <ctype.h>
#include <stdio.h>


static bool isNameChar(char thing) {
    return isalnum((unsigned char)thing) || thing == '-' || thing == '_' || thing == ':';
}

static std::string escapeQuotedValues(std::string raw) { // only what sits between quotes is a value; names and = stay as written
    std::string ret;
    size_t i = 0;
    while (i < raw.size()) {
        char quote = raw[i];
        ret += quote;
        i ++;
        if (quote != '"' && quote != '\'') {
            continue;
        }
        size_t end = raw.find(quote, i);
        if (end == std::string::npos) {
            end = raw.size();
        }
        ret += escapeAttribute(raw.substr(i, end - i));
        if (end < raw.size()) {
            ret += quote;
        }
        i = end + 1;
    }
    return ret;
}


Tag::Tag(std::string expression, Node* parent, CompileFlags flags) : Node(expression, parent, flags) {}

void Tag::onEvaluate() {
    std::string classes;
    std::string id;
    size_t i = 0;
    while (i < expression.size()) { // %name, .class and #id can come in any order
        char op = expression[i];
        if (op != '%' && op != '.' && op != '#') {
            break;
        }
        i ++;
        size_t wordStart = i;
        while (i < expression.size() && isNameChar(expression[i])) {
            i ++;
        }
        std::string word = expression.substr(wordStart, i - wordStart);
        if (word.size() == 0) {
            printf(WARNING "Empty '%c' in tag '%s'. It will be ignored.\n", op, expression.c_str());
        }
        else if (op == '%') {
            name = word;
        }
        else if (op == '.') {
            if (classes.size() > 0) {
                classes += ' ';
            }
            classes += word;
        }
        else {
            id = word;
        }
    }
    std::string raw;
    if (i < expression.size() && expression[i] == '{') {
        printf(WARNING "Hash attributes are not supported in tag '%s'. Use (name=\"value\") instead; the tag is emitted without them.\n", expression.c_str());
        size_t close = expression.find('}', i);
        i = close == std::string::npos ? expression.size() : close + 1;
    }
    if (i < expression.size() && expression[i] == '(') {
        size_t close = expression.find(')', i);
        if (close == std::string::npos) {
            printf(WARNING "Unterminated attribute list in tag '%s'. The rest of the line is used as attributes.\n", expression.c_str());
            close = expression.size();
        }
        raw = trim(expression.substr(i + 1, close - i - 1));
        i = close + 1;
    }
    while (i < expression.size()) {
        char mod = expression[i];
        if (mod == '>') {
            wsRemoval.around = true;
        }
        else if (mod == '<') {
            wsRemoval.inside = true;
        }
        else if (mod == '/') {
            selfClosing = true;
        }
        else if (!isWhitespace(mod)) {
            printf(WARNING "Unrecognized tag modifier %c in '%s'. Parsing will continue, but the result may be malformed.\n", mod, expression.c_str());
            break;
        }
        i ++;
    }
    if (name.size() == 0) {
        if (classes.size() == 0 && id.size() == 0) {
            printf(WARNING "Tag '%s' has no name, using div.\n", expression.c_str());
        }
        name = "div";
    }
    if (flags.escapeAttributes) {
        classes = escapeAttribute(classes);
        id = escapeAttribute(id);
        raw = escapeQuotedValues(raw);
    }
    if (classes.size() > 0) {
        attributes += " class=\"" + classes + "\"";
    }
    if (id.size() > 0) {
        attributes += " id=\"" + id + "\"";
    }
    if (raw.size() > 0) {
        attributes += " " + raw;
    }
    if (listContains(flags.selfCloseTags, name)) {
        selfClosing = true;
    }
    preserve = listContains(flags.preserveTags, name);
    if (selfClosing) {
        opener = "<" + name + attributes + (flags.format == CompileFlags::XHTML ? " />" : ">");
    }
    else {
        opener = "<" + name + attributes + ">";
        closer = "</" + name + ">";
    }
}

void Tag::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    printf("Tag %s", name.c_str());
    if (selfClosing) {
        printf(" (self-closing)");
    }
    if (preserve) {
        printf(" (preserve)");
    }
    printf("\n");
    for (Node* child : children) {
        child -> pTree(tabLevel + 1);
    }
}
