#pragma once

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "

// whitespace-control sentinels. They are embedded directly into generated markup and consumed by TrimWriter,
// so neither byte may ever appear in legitimate template output.
#define TRIM_LEFT  '\x11' // strip whitespace immediately before this point
#define TRIM_RIGHT '\x12' // strip whitespace immediately after this point

// names the generated CoffeeScript uses for the output buffer and the runtime escaping helper
#define OUTPUT_BUFFER "$o"
#define ESCAPE_HELPER "$e"


struct Node; // forward-declarations for everything, so headers don't have to pull each other in
struct CompileFlags;
struct WriteOutput;
struct StringWriteOutput;
struct FileWriteOutput;
struct TrimWriter;
struct Session;
