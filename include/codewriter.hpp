// TrimWriter is the last step of code generation: it resolves the whitespace sentinels in the rendered code and hands the result to an output.
#pragma once
#include <string>
#include <vector>
#include <stddef.h>
#include <defs.h>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool move = false;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(FileWriteOutput& f);

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file.

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct TrimWriter { // the runtime joins $o with newlines, so trimming across two pushes means merging them into one
    WriteOutput& output;
    std::string code; // everything written so far. Sentinels can reach back across statements, so nothing goes out before finish().

    struct Line {
        std::string indent;
        bool literal = false; // a $o.push "..." statement; body is then just what's between the quotes
        std::string body;
    };

    TrimWriter(WriteOutput& out);

    void write(const char* data, size_t length);

    void write(std::string data);

    void finish(); // resolve the sentinels and hand everything to the output. Call once after the last write.

private:
    bool canMerge(std::vector<Line>& lines, size_t first, size_t second);

    void trimForward(std::vector<Line>& lines, size_t k, size_t p);

    void trimBack(std::vector<Line>& lines, size_t* k, size_t* p);
};
