#pragma once

// Cross-platform API export/import macros
#ifdef _WIN32
#if defined(SERIAL_SHARED) && defined(SERIAL_EXPORTS)
#define SERIAL_API __declspec(dllexport)
#elif defined(SERIAL_SHARED)
#define SERIAL_API __declspec(dllimport)
#else
#define SERIAL_API
#endif
#else
    // Linux/GCC
#ifdef SERIAL_EXPORTS
#define SERIAL_API __attribute__((visibility("default")))
#else
#define SERIAL_API
#endif
#endif

#define SERIAL_VERSION_MAJOR 1
#define SERIAL_VERSION_MINOR 0
