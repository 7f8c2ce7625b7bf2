#ifndef PIXELOID_CORE_LOGGING_H
#define PIXELOID_CORE_LOGGING_H

#include <cstdio>

#ifndef PIXELOID_ENABLE_LOGGING
#define PIXELOID_ENABLE_LOGGING 0
#endif

#if PIXELOID_ENABLE_LOGGING
#define PIXELOID_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[pixeloid] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PIXELOID_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[pixeloid] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PIXELOID_LOG_DEBUG(...) do { } while (0)
#define PIXELOID_LOG_WARN(...) do { } while (0)
#endif

#endif // PIXELOID_CORE_LOGGING_H
