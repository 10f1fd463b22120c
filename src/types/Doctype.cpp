#include <types/Doctype.hpp>
#include <util.hpp>
#include <stdio.h>


Doctype::Doctype(std::string expression, Node* parent, CompileFlags flags) : Node(expression, parent, flags) {}

void Doctype::onEvaluate() {
    std::string type = expression;
    if (type.compare(0, 3, "!!!") == 0) {
        type = type.substr(3);
    }
    type = trim(type);
    if (type == "XML") { // the prolog only exists for xhtml
        if (flags.format == CompileFlags::XHTML) {
            opener = "<?xml version='1.0' encoding='utf-8' ?>";
        }
        return;
    }
    if (flags.format == CompileFlags::HTML5 || type == "5") {
        opener = "<!DOCTYPE html>";
    }
    else if (flags.format == CompileFlags::XHTML) {
        if (type == "Strict") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\">";
        }
        else if (type == "Frameset") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Frameset//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-frameset.dtd\">";
        }
        else if (type == "1.1") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.1//EN\" \"http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd\">";
        }
        else if (type == "Basic") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML Basic 1.1//EN\" \"http://www.w3.org/TR/xhtml-basic/xhtml-basic11.dtd\">";
        }
        else if (type == "Mobile") {
            opener = "<!DOCTYPE html PUBLIC \"-//WAPFORUM//DTD XHTML Mobile 1.2//EN\" \"http://www.openmobilealliance.org/tech/DTD/xhtml-mobile12.dtd\">";
        }
        else if (type == "RDFa") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML+RDFa 1.0//EN\" \"http://www.w3.org/MarkUp/DTD/xhtml-rdfa-1.dtd\">";
        }
        else {
            if (type.size() > 0) {
                printf(WARNING "Unknown doctype '%s', using Transitional.\n", type.c_str());
            }
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Transitional//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-transitional.dtd\">";
        }
    }
    else {
        if (type == "Strict") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD HTML 4.01//EN\" \"http://www.w3.org/TR/html4/strict.dtd\">";
        }
        else if (type == "Frameset") {
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD HTML 4.01 Frameset//EN\" \"http://www.w3.org/TR/html4/frameset.dtd\">";
        }
        else {
            if (type.size() > 0) {
                printf(WARNING "Unknown doctype '%s', using Transitional.\n", type.c_str());
            }
            opener = "<!DOCTYPE html PUBLIC \"-//W3C//DTD HTML 4.01 Transitional//EN\" \"http://www.w3.org/TR/html4/loose.dtd\">";
        }
    }
}
