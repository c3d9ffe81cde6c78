#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "general.hpp"

namespace rv32 {

// Sparse byte-addressable 32-bit address space. Backing slabs are allocated
// zero-filled on the first write that lands inside them; addresses in
// unallocated slabs read as absent (zero for the read* accessors).
class Memory {
public:
    static constexpr u32 SLAB_SIZE = 1024;

    Memory();

    void reset();

    std::optional<u8> get_byte(u32 index) const;
    std::optional<u16> get_half(u32 index) const;
    std::optional<u32> get_word(u32 index) const;

    void set_byte(u32 index, u8 value);
    void set_half(u32 index, u16 value);
    void set_word(u32 index, u32 value);

    u32 read32(u32 index) const;
    u16 read16(u32 index) const;
    u8 read8(u32 index) const;

    size_t slab_count() const;

private:
    static_assert((SLAB_SIZE & (SLAB_SIZE - 1)) == 0, "Slab size must be a power of two");

    std::optional<u32> get_bytes(u32 index, int count) const;
    void set_bytes(u32 index, int count, u32 value);

    // Keyed by slab base address, which is always a multiple of SLAB_SIZE
    std::unordered_map<u32, std::vector<u8>> slabs;
};

}  // namespace rv32
