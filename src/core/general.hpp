#pragma once

#include <stdint.h>
#include <stdio.h>

#include <stdexcept>

#define FATAL(...)                                           \
    do {                                                     \
        char buff[0xFF] = "FATAL ERROR: ";                   \
        snprintf(buff + 13, sizeof(buff) - 13, __VA_ARGS__); \
        throw std::runtime_error(buff);                      \
    } while (0)

#ifndef NDEBUG
#define RV32_ASSERT(cond, ...)  \
    do {                        \
        if (!(cond)) {          \
            FATAL(__VA_ARGS__); \
        }                       \
    } while (0)
#else
#define RV32_ASSERT(cond, ...) \
    do {                       \
    } while (0)
#endif

using s64 = int64_t;
using u64 = uint64_t;

using s32 = int32_t;
using u32 = uint32_t;

using u16 = uint16_t;
using u8 = uint8_t;
