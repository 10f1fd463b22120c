#include <util.hpp>
#include <stdio.h>
#include <stdlib.h>
// definitions for util functions


std::string indent(int level) {
    if (level <= 0) {
        return "";
    }
    return std::string(level * 2, ' ');
}


std::string escapeLiteral(std::string thing) { // the sentinels are left alone; TrimWriter needs to find them in the generated code
    std::string ret;
    ret.reserve(thing.size());
    for (size_t i = 0; i < thing.size(); i ++) {
        char c = thing[i];
        if (c == '\\' || c == '"') {
            ret += '\\';
            ret += c;
        }
        else if (c == '\n') {
            ret += "\\n";
        }
        else if (c == '\r') {
            ret += "\\r";
        }
        else if (c == '\t') {
            ret += "\\t";
        }
        else if (c == '#' && i + 1 < thing.size() && thing[i + 1] == '{') { // would otherwise be an interpolation
            ret += "\\#";
        }
        else {
            ret += c;
        }
    }
    return ret;
}


std::string escapeAttribute(std::string thing) {
    std::string ret;
    for (char c : thing) {
        switch (c) {
            case '&':
                ret += "&amp;";
                break;
            case '<':
                ret += "&lt;";
                break;
            case '>':
                ret += "&gt;";
                break;
            case '"':
                ret += "&quot;";
                break;
            case '\'':
                ret += "&#39;";
                break;
            default:
                ret += c;
        }
    }
    return ret;
}


bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}


std::string trim(std::string thing) {
    size_t start = 0;
    while (start < thing.size() && isWhitespace(thing[start])) {
        start ++;
    }
    size_t end = thing.size();
    while (end > start && isWhitespace(thing[end - 1])) {
        end --;
    }
    return thing.substr(start, end - start);
}


bool listContains(const std::string& list, const std::string& item) {
    size_t blobStart = 0;
    while (blobStart <= list.size()) {
        size_t blobEnd = list.find(',', blobStart);
        if (blobEnd == std::string::npos) {
            blobEnd = list.size();
        }
        if (trim(list.substr(blobStart, blobEnd - blobStart)) == item) {
            return true;
        }
        blobStart = blobEnd + 1;
    }
    return false;
}


bool parseFormat(const std::string& name, CompileFlags::Format* format) {
    if (name == "html5") {
        *format = CompileFlags::HTML5;
    }
    else if (name == "xhtml") {
        *format = CompileFlags::XHTML;
    }
    else if (name == "html4") {
        *format = CompileFlags::HTML4;
    }
    else {
        return false;
    }
    return true;
}


const char* formatName(CompileFlags::Format format) {
    switch (format) {
        case CompileFlags::XHTML:
            return "xhtml";
        case CompileFlags::HTML4:
            return "html4";
        default:
            return "html5";
    }
}


bool parseSwitch(const std::string& value, bool* result) {
    if (value == "true" || value == "on" || value == "1") {
        *result = true;
    }
    else if (value == "false" || value == "off" || value == "0") {
        *result = false;
    }
    else {
        return false;
    }
    return true;
}


void contractViolation(const char* what) {
    fflush(stdout);
    fprintf(stderr, ERROR "%s\n", what);
    abort();
}
