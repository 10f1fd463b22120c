// TrimWriter is the last step of code generation: it resolves the whitespace sentinels in the rendered code and hands the result to an output.
#include <codewriter.hpp>
#include <util.hpp>
#include <unistd.h>
#include <string.h>
#include <stdio.h>


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
            continue;
        }
        memcpy(buffer + bufferPos, data, writeSize);
        bufferPos += writeSize;
        data += writeSize;
        length -= writeSize;
    }
}

void FileWriteOutput::flush() {
    size_t written = 0;
    while (written < bufferPos) {
        ssize_t ret = ::write(file, buffer + written, bufferPos - written);
        if (ret <= 0) {
            printf(ERROR "Couldn't write generated code to file descriptor %d!\n", file);
            perror("\twrite");
            break;
        }
        written += ret;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    if (!move) { // allow this file descriptor to be moved into another FileWriteOutput without being closed.
        flush();
        ::close(file);
    }
}

FileWriteOutput::FileWriteOutput(FileWriteOutput& f) {
    file = f.file;
    f.move = true;
}

void StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
}


static const std::string pushPrefix = OUTPUT_BUFFER ".push \"";


static bool isEscapedSpace(char thing) { // the second half of an escape that stands for whitespace
    return thing == 'n' || thing == 't' || thing == 'r';
}


TrimWriter::TrimWriter(WriteOutput& out) : output(out) {}

void TrimWriter::write(const char* data, size_t length) {
    code.append(data, length);
}

void TrimWriter::write(std::string data) {
    code += data;
}

bool TrimWriter::canMerge(std::vector<Line>& lines, size_t first, size_t second) { // only neighbouring pushes in the same block
    return second < lines.size() && lines[first].literal && lines[second].literal && lines[first].indent == lines[second].indent;
}

void TrimWriter::trimForward(std::vector<Line>& lines, size_t k, size_t p) {
    while (true) {
        std::string& body = lines[k].body;
        while (p < body.size()) {
            if (body[p] == ' ' || body[p] == '\t') {
                body.erase(p, 1);
            }
            else if (body[p] == '\\' && p + 1 < body.size() && isEscapedSpace(body[p + 1])) {
                body.erase(p, 2);
            }
            else {
                return;
            }
        }
        if (!canMerge(lines, k, k + 1)) {
            return;
        }
        body += lines[k + 1].body; // dropping the statement boundary drops the newline the runtime would put there
        lines.erase(lines.begin() + k + 1);
    }
}

void TrimWriter::trimBack(std::vector<Line>& lines, size_t* k, size_t* p) {
    while (true) {
        std::string& body = lines[*k].body;
        while (*p > 0) {
            char prev = body[*p - 1];
            if (prev == ' ' || prev == '\t') {
                body.erase(*p - 1, 1);
                (*p) --;
                continue;
            }
            if (isEscapedSpace(prev) && *p >= 2) {
                size_t slashes = 0;
                while (slashes < *p - 1 && body[*p - 2 - slashes] == '\\') {
                    slashes ++;
                }
                if (slashes % 2 == 1) { // an odd run means the last backslash escapes the letter
                    body.erase(*p - 2, 2);
                    *p -= 2;
                    continue;
                }
            }
            return;
        }
        if (*k == 0 || !canMerge(lines, *k - 1, *k)) {
            return;
        }
        Line& above = lines[*k - 1];
        *p = above.body.size();
        above.body += body;
        lines.erase(lines.begin() + *k);
        (*k) --;
    }
}

void TrimWriter::finish() {
    std::vector<Line> lines;
    bool trailingNewline = code.size() > 0 && code[code.size() - 1] == '\n';
    size_t lineStart = 0;
    while (lineStart < code.size()) {
        size_t lineEnd = code.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = code.size();
        }
        std::string text = code.substr(lineStart, lineEnd - lineStart);
        Line line;
        size_t indentEnd = 0;
        while (indentEnd < text.size() && text[indentEnd] == ' ') {
            indentEnd ++;
        }
        line.indent = text.substr(0, indentEnd);
        text = text.substr(indentEnd);
        if (text.size() > pushPrefix.size() && text.compare(0, pushPrefix.size(), pushPrefix) == 0 && text[text.size() - 1] == '"') {
            line.literal = true;
            line.body = text.substr(pushPrefix.size(), text.size() - pushPrefix.size() - 1);
        }
        else {
            line.body = text;
        }
        lines.push_back(line);
        lineStart = lineEnd + 1;
    }
    code.clear();

    for (size_t k = 0; k < lines.size(); k ++) {
        size_t p = 0;
        while (p < lines[k].body.size()) {
            std::string& body = lines[k].body;
            char c = body[p];
            if (c == TRIM_LEFT) {
                body.erase(p, 1);
                if (lines[k].literal) {
                    trimBack(lines, &k, &p);
                }
            }
            else if (c == TRIM_RIGHT) {
                body.erase(p, 1);
                if (lines[k].literal) {
                    trimForward(lines, k, p);
                }
            }
            else if (c == '\\') {
                p += 2;
            }
            else if (c == '#' && lines[k].literal && p + 1 < body.size() && body[p + 1] == '{') { // interpolated code is never trimmed into
                int depth = 0;
                while (p < body.size()) {
                    if (body[p] == '{') {
                        depth ++;
                    }
                    else if (body[p] == '}') {
                        depth --;
                        if (depth == 0) {
                            break;
                        }
                    }
                    p ++;
                }
                p ++;
            }
            else {
                p ++;
            }
        }
    }

    for (size_t k = 0; k < lines.size(); k ++) {
        std::string out = lines[k].indent;
        if (lines[k].literal) {
            out += pushPrefix + lines[k].body + "\"";
        }
        else {
            out += lines[k].body;
        }
        if (k + 1 < lines.size() || trailingNewline) {
            out += '\n';
        }
        output.write(out.c_str(), out.size());
    }
}
