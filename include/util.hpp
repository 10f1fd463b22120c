#pragma once
#include <string>
#include <compileflags.h>
#include <defs.h>

std::string indent(int level); // two spaces per level, nothing for level <= 0

std::string escapeLiteral(std::string thing); // make a string safe to place between double quotes in CoffeeScript

std::string escapeAttribute(std::string thing); // HTML entities for & < > " and ', for use inside attribute values

bool isWhitespace(char thing);

std::string trim(std::string thing);

bool listContains(const std::string& list, const std::string& item); // is item one of the entries of a comma-separated list?

bool parseFormat(const std::string& name, CompileFlags::Format* format);

const char* formatName(CompileFlags::Format format);

bool parseSwitch(const std::string& value, bool* result); // true/false, on/off, 1/0

[[noreturn]] void contractViolation(const char* what); // a caller broke the construction protocol. Prints and aborts.
