#pragma once

#include <cassert>
#include <cstdint>
#include <functional>

namespace Goldberg {

// Identifies one lattice triangle on one seed face as a single integer.
// Layout: (triangle index << 5) | seed face id. Ordering and hashing follow
// the packed value, so it can be used directly as an array index.
struct PackedIndex {
    static constexpr uint32_t FACE_BITS = 5;
    static constexpr uint32_t FACE_MASK = (1u << FACE_BITS) - 1;  // 31
    static constexpr uint32_t MAX_FACES = 1u << FACE_BITS;        // 32

    uint32_t value = 0;

    PackedIndex() = default;
    constexpr explicit PackedIndex(uint32_t packed) : value(packed) {}

    static constexpr PackedIndex pack(uint32_t face, uint32_t index) {
        assert(face < MAX_FACES);
        return PackedIndex((index << FACE_BITS) | face);
    }

    constexpr uint32_t face() const { return value & FACE_MASK; }

    constexpr uint32_t index() const { return value >> FACE_BITS; }

    bool operator==(const PackedIndex& other) const { return value == other.value; }
    bool operator!=(const PackedIndex& other) const { return value != other.value; }
    bool operator<(const PackedIndex& other) const { return value < other.value; }
};

struct PackedIndexHash {
    size_t operator()(const PackedIndex& index) const {
        return std::hash<uint32_t>()(index.value);
    }
};

}  // namespace Goldberg
