// log.h
#pragma once
#include <cstdio>

// One-line diagnostics to stderr, only when the run asked for them.
#define ROSTRA_LOG(on, ...)               \
    do                                    \
    {                                     \
        if (on)                           \
        {                                 \
            fprintf(stderr, __VA_ARGS__); \
            fflush(stderr);               \
        }                                 \
    } while (0)
