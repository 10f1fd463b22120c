#include <session.hpp>
#include <util.hpp>
#include <stdio.h>


bool Session::configure(std::string name, std::string value) {
    bool ok = true;
    if (name == "format") {
        ok = parseFormat(value, &flags.format);
    }
    else if (name == "escapeHtml") {
        ok = parseSwitch(value, &flags.escapeHtml);
    }
    else if (name == "escapeAttributes") {
        ok = parseSwitch(value, &flags.escapeAttributes);
    }
    else if (name == "uglify") {
        ok = parseSwitch(value, &flags.uglify);
    }
    else if (name == "selfCloseTags") {
        flags.selfCloseTags = value;
    }
    else if (name == "preserveTags") {
        flags.preserveTags = value;
    }
    else {
        printf(WARNING "Unknown configuration key %s. It will be ignored.\n", name.c_str());
        return false;
    }
    if (!ok) {
        printf(WARNING "Bad value '%s' for %s. The previous setting is kept.\n", value.c_str(), name.c_str());
    }
    return ok;
}

CompileFlags Session::flagsAt(int blockLevel, int codeBlockLevel) {
    CompileFlags ret = flags;
    ret.blockLevel = blockLevel;
    ret.codeBlockLevel = codeBlockLevel;
    return ret;
}

Node* Session::createRoot() {
    return build<Node>("", NULL, flagsAt(0, 0));
}

void Session::compile(Node* root, WriteOutput& out) {
    std::string code = root -> render();
    if (verbose) {
        printf(INFO "Generated %zu bytes of %s template code.\n", code.size(), formatName(flags.format));
    }
    TrimWriter writer(out);
    writer.write(code);
    writer.finish();
}

std::string Session::compile(Node* root) {
    StringWriteOutput out;
    compile(root, out);
    return out.content;
}
