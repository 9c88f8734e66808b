// ==============================================================================
// Acordes Engine - Debug Tracing
// ==============================================================================
// Compile-time switch for engine tracing. With ACORDES_ENGINE_DEBUG at 0 (the
// default) none of this is compiled; call sites are wrapped in
// #if ACORDES_ENGINE_DEBUG. Define it to 1 on the command line to trace
// lifecycle, backend and parameter events to stderr.
// ==============================================================================

#pragma once

#ifndef ACORDES_ENGINE_DEBUG
#define ACORDES_ENGINE_DEBUG 0
#endif

#if ACORDES_ENGINE_DEBUG
#include <cstdarg>
#include <cstdio>

static inline void logEngine(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "[acordes] %s\n", buf);
}
#endif
