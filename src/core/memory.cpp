#include "memory.hpp"

namespace rv32 {

static u32 slab_base(u32 index) { return index - (index % Memory::SLAB_SIZE); }

Memory::Memory() {}

void Memory::reset() { slabs.clear(); }

std::optional<u8> Memory::get_byte(u32 index) const {
    auto slab = slabs.find(slab_base(index));
    if (slab == slabs.end()) {
        return std::nullopt;
    }
    return slab->second[index % SLAB_SIZE];
}

std::optional<u16> Memory::get_half(u32 index) const {
    auto value = get_bytes(index, 2);
    if (!value) {
        return std::nullopt;
    }
    return (u16)*value;
}

std::optional<u32> Memory::get_word(u32 index) const { return get_bytes(index, 4); }

void Memory::set_byte(u32 index, u8 value) {
    auto& slab = slabs[slab_base(index)];
    if (slab.empty()) {
        slab.resize(SLAB_SIZE, 0);
    }
    slab[index % SLAB_SIZE] = value;
}

void Memory::set_half(u32 index, u16 value) { set_bytes(index, 2, value); }

void Memory::set_word(u32 index, u32 value) { set_bytes(index, 4, value); }

u32 Memory::read32(u32 index) const { return get_word(index).value_or(0); }

u16 Memory::read16(u32 index) const { return get_half(index).value_or(0); }

u8 Memory::read8(u32 index) const { return get_byte(index).value_or(0); }

size_t Memory::slab_count() const { return slabs.size(); }

// Little endian: byte i of the value lives at index + i (wrapping at 2^32)
std::optional<u32> Memory::get_bytes(u32 index, int count) const {
    u32 value = 0;
    for (int i = 0; i < count; i++) {
        auto byte = get_byte(index + (u32)i);
        if (!byte) {
            return std::nullopt;
        }
        value |= (u32)*byte << (8 * i);
    }
    return value;
}

void Memory::set_bytes(u32 index, int count, u32 value) {
    for (int i = 0; i < count; i++) {
        set_byte(index + (u32)i, (value >> (8 * i)) & 0xFF);
    }
}

}  // namespace rv32
