#pragma once
#include <array>
#include <cstdint>

namespace ef::font5x7 {

constexpr int GLYPH_W = 5;
constexpr int GLYPH_H = 7;
constexpr int ADVANCE = GLYPH_W + 1;

// Seven rows, lower 5 bits each, bit 4 = leftmost column.
using Glyph = std::array<uint8_t, GLYPH_H>;

constexpr bool bit(const Glyph& g, int row, int col) {
    return ((g[row] >> (GLYPH_W - 1 - col)) & 0x1) != 0;
}

// Uppercase letters, digits and the punctuation used by the annotations.
// Lowercase maps to uppercase; anything else renders as the box glyph.
constexpr Glyph glyph(char ch) {
    if (ch >= 'a' && ch <= 'z') ch = char(ch - 'a' + 'A');
    switch (ch) {
    case ' ': return {0b00000,0b00000,0b00000,0b00000,0b00000,0b00000,0b00000};
    case 'A': return {0b01110,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001};
    case 'B': return {0b11110,0b10001,0b10001,0b11110,0b10001,0b10001,0b11110};
    case 'C': return {0b01110,0b10001,0b10000,0b10000,0b10000,0b10001,0b01110};
    case 'D': return {0b11100,0b10010,0b10001,0b10001,0b10001,0b10010,0b11100};
    case 'E': return {0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b11111};
    case 'F': return {0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b10000};
    case 'G': return {0b01110,0b10001,0b10000,0b10111,0b10001,0b10001,0b01111};
    case 'H': return {0b10001,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001};
    case 'I': return {0b01110,0b00100,0b00100,0b00100,0b00100,0b00100,0b01110};
    case 'J': return {0b00111,0b00010,0b00010,0b00010,0b00010,0b10010,0b01100};
    case 'K': return {0b10001,0b10010,0b10100,0b11000,0b10100,0b10010,0b10001};
    case 'L': return {0b10000,0b10000,0b10000,0b10000,0b10000,0b10000,0b11111};
    case 'M': return {0b10001,0b11011,0b10101,0b10101,0b10001,0b10001,0b10001};
    case 'N': return {0b10001,0b10001,0b11001,0b10101,0b10011,0b10001,0b10001};
    case 'O': return {0b01110,0b10001,0b10001,0b10001,0b10001,0b10001,0b01110};
    case 'P': return {0b11110,0b10001,0b10001,0b11110,0b10000,0b10000,0b10000};
    case 'Q': return {0b01110,0b10001,0b10001,0b10001,0b10101,0b10010,0b01101};
    case 'R': return {0b11110,0b10001,0b10001,0b11110,0b10100,0b10010,0b10001};
    case 'S': return {0b01111,0b10000,0b10000,0b01110,0b00001,0b00001,0b11110};
    case 'T': return {0b11111,0b00100,0b00100,0b00100,0b00100,0b00100,0b00100};
    case 'U': return {0b10001,0b10001,0b10001,0b10001,0b10001,0b10001,0b01110};
    case 'V': return {0b10001,0b10001,0b10001,0b10001,0b10001,0b01010,0b00100};
    case 'W': return {0b10001,0b10001,0b10001,0b10101,0b10101,0b10101,0b01010};
    case 'X': return {0b10001,0b10001,0b01010,0b00100,0b01010,0b10001,0b10001};
    case 'Y': return {0b10001,0b10001,0b10001,0b01010,0b00100,0b00100,0b00100};
    case 'Z': return {0b11111,0b00001,0b00010,0b00100,0b01000,0b10000,0b11111};
    case '0': return {0b01110,0b10001,0b10011,0b10101,0b11001,0b10001,0b01110};
    case '1': return {0b00100,0b01100,0b00100,0b00100,0b00100,0b00100,0b01110};
    case '2': return {0b01110,0b10001,0b00001,0b00010,0b00100,0b01000,0b11111};
    case '3': return {0b11111,0b00010,0b00100,0b00010,0b00001,0b10001,0b01110};
    case '4': return {0b00010,0b00110,0b01010,0b10010,0b11111,0b00010,0b00010};
    case '5': return {0b11111,0b10000,0b11110,0b00001,0b00001,0b10001,0b01110};
    case '6': return {0b00110,0b01000,0b10000,0b11110,0b10001,0b10001,0b01110};
    case '7': return {0b11111,0b00001,0b00010,0b00100,0b01000,0b01000,0b01000};
    case '8': return {0b01110,0b10001,0b10001,0b01110,0b10001,0b10001,0b01110};
    case '9': return {0b01110,0b10001,0b10001,0b01111,0b00001,0b00010,0b01100};
    case '.': return {0b00000,0b00000,0b00000,0b00000,0b00000,0b01100,0b01100};
    case ',': return {0b00000,0b00000,0b00000,0b00000,0b01100,0b00100,0b01000};
    case '-': return {0b00000,0b00000,0b00000,0b11111,0b00000,0b00000,0b00000};
    case '_': return {0b00000,0b00000,0b00000,0b00000,0b00000,0b00000,0b11111};
    case ':': return {0b00000,0b01100,0b01100,0b00000,0b01100,0b01100,0b00000};
    case '/': return {0b00000,0b00001,0b00010,0b00100,0b01000,0b10000,0b00000};
    case '!': return {0b00100,0b00100,0b00100,0b00100,0b00100,0b00000,0b00100};
    case '[': return {0b01110,0b01000,0b01000,0b01000,0b01000,0b01000,0b01110};
    case ']': return {0b01110,0b00010,0b00010,0b00010,0b00010,0b00010,0b01110};
    case '(': return {0b00010,0b00100,0b01000,0b01000,0b01000,0b00100,0b00010};
    case ')': return {0b01000,0b00100,0b00010,0b00010,0b00010,0b00100,0b01000};
    default:  return {0b11111,0b10001,0b10101,0b10001,0b10101,0b10001,0b11111};
    }
}

} // namespace ef::font5x7
