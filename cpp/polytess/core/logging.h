#pragma once

#include <cstdio>

#ifndef POLYTESS_ENABLE_LOGGING
#define POLYTESS_ENABLE_LOGGING 0
#endif

#if POLYTESS_ENABLE_LOGGING
#define POLYTESS_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[polytess] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define POLYTESS_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[polytess] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define POLYTESS_LOG_DEBUG(...) do { } while (0)
#define POLYTESS_LOG_WARN(...) do { } while (0)
#endif
