#pragma once

#include <cstdio>

#ifndef CONTOUR_ENABLE_LOGGING
#define CONTOUR_ENABLE_LOGGING 0
#endif

#if CONTOUR_ENABLE_LOGGING
#define CONTOUR_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[contour] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CONTOUR_LOG_INFO(...) \
    do { \
        std::fprintf(stderr, "[contour] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CONTOUR_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[contour] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CONTOUR_LOG_DEBUG(...) do { } while (0)
#define CONTOUR_LOG_INFO(...) do { } while (0)
#define CONTOUR_LOG_WARN(...) do { } while (0)
#endif
