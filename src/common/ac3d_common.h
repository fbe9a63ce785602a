//
// AC3D
//

#pragma once

#include <cstdio>
#include <string>

// Disable SIMD on GCC due to UB when compiling with optimizations.

#if defined(__GNUC__) && !defined(__clang__) && !defined(__INTEL_COMPILER)
#define HLSLPP_SCALAR
#endif

#include <hlsl++.h>

#ifdef _WIN32
#   define DLLEXPORT extern "C" __declspec(dllexport)  
#else
#   define DLLEXPORT extern "C" __attribute__((visibility("default")))
#endif

namespace AC3D {
    // Error string for the last configuration or initialization error that was caught.
    extern std::string GlobalLastError;

#ifdef NDEBUG
#   define AC3D_LOG_OPEN(x)
#   define AC3D_LOG_CLOSE()
#   define AC3D_LOG_PRINTF(x, ...)
#else
    extern FILE *GlobalLogFile;
#   define AC3D_LOG_OPEN(x) do { AC3D::GlobalLogFile = fopen(x, "w"); } while (0)
#   define AC3D_LOG_CLOSE() do { if (AC3D::GlobalLogFile != nullptr) { fclose(AC3D::GlobalLogFile); AC3D::GlobalLogFile = nullptr; } } while (0)
#   define AC3D_LOG_PRINTF(x, ...) do { if (AC3D::GlobalLogFile != nullptr) { fprintf(AC3D::GlobalLogFile, x, ## __VA_ARGS__); fprintf(AC3D::GlobalLogFile, "\n"); fflush(AC3D::GlobalLogFile); } } while (0)
#endif

    enum class Direction {
        Increase,
        Decrease
    };
};
