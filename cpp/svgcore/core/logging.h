#pragma once

#include <cstdio>

#ifndef SVGCORE_ENABLE_LOGGING
#define SVGCORE_ENABLE_LOGGING 0
#endif

#if SVGCORE_ENABLE_LOGGING
#define SVGCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[svgcore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SVGCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[svgcore][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SVGCORE_LOG_DEBUG(...) do { } while (0)
#define SVGCORE_LOG_WARN(...) do { } while (0)
#endif
