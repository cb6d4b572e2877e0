#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

#if BOARD_REV == 1
/** @brief BCM line offsets of the zone terminals on the GPIO header. */
namespace Zone {
constexpr uint8_t Z1 = 22;
constexpr uint8_t Z2 = 25;
constexpr uint8_t Z3 = 5;
constexpr uint8_t Z4 = 6;
constexpr uint8_t Z5 = 12;
constexpr uint8_t Z6 = 13;
constexpr uint8_t Z7 = 16;
constexpr uint8_t Z8 = 18;
constexpr uint8_t Z9 = 17;
constexpr uint8_t Z10 = 23;
}  // namespace Zone
#else
#error "Unsupported BOARD_REV"
#endif

}  // namespace Board
