#pragma once
#include <cstddef>

enum class IndexFormat { UInt16, UInt32 };

// From this many vertices on, 16-bit indices can no longer address every vertex.
constexpr size_t WIDE_INDEX_VERTEX_THRESHOLD = 0xFFFF;

inline const char* toString(IndexFormat v) {
    switch (v) {
        case IndexFormat::UInt16: return "UInt16";
        case IndexFormat::UInt32: return "UInt32";
        default: return "Unknown";
    }
}
