#include "utils/ebcdic.h"
#include <array>

namespace {

const char ebcdicToAscii[256] = {
    0,   1,   2,   3,   0,   9,   0,   127, 0,   0,   0,   11,  12,  13,  14,
    15,  16,  17,  18,  19,  0,   0,   8,   0,   24,  25,  0,   0,   28,  29,
    30,  31,  0,   0,   0,   0,   0,   10,  23,  27,  0,   0,   0,   0,   0,
    5,   6,   7,   0,   0,   22,  0,   0,   0,   0,   4,   0,   0,   0,   0,
    20,  21,  0,   26,  32,  0,   0,   0,   0,   0,   0,   0,   0,   0,   0,
    46,  60,  40,  43,  124, 38,  0,   0,   0,   0,   0,   0,   0,   0,   0,
    33,  36,  42,  41,  59,  94,  45,  47,  0,   0,   0,   0,   0,   0,   0,
    0,   0,   0,   44,  37,  95,  62,  63,  0,   0,   0,   0,   0,   0,   0,
    0,   0,   96,  58,  35,  64,  39,  61,  34,  97,  98,  99,  100, 101, 102,
    103, 104, 105, 0,   0,   0,   0,   0,   0,   0,   106, 107, 108, 109, 110,
    111, 112, 113, 114, 0,   0,   0,   0,   0,   0,   0,   126, 115, 116, 117,
    118, 119, 120, 121, 122, 0,   0,   0,   91,  0,   0,   0,   0,   0,   0,
    0,   0,   0,   0,   0,   0,   0,   0,   0,   93,  0,   0,   123, 65,  66,
    67,  68,  69,  70,  71,  72,  73,  0,   0,   0,   0,   0,   0,   125, 74,
    75,  76,  77,  78,  79,  80,  81,  82,  0,   0,   0,   0,   0,   0,   92,
    0,   83,  84,  85,  86,  87,  88,  89,  90,  0,   0,   0,   0,   0,   0,
    48,  49,  50,  51,  52,  53,  54,  55,  56,  57,  0,   0,   0,   0,   0,
    0};

constexpr uint8_t EBCDIC_QUESTION_MARK = 0x6F;

std::array<uint8_t, 256> buildAsciiToEbcdic() {
  std::array<uint8_t, 256> table{};
  table.fill(EBCDIC_QUESTION_MARK);
  for (int i = 255; i >= 0; --i) {
    unsigned char ascii = static_cast<unsigned char>(ebcdicToAscii[i]);
    if (ascii != 0 || i == 0) {
      table[ascii] = static_cast<uint8_t>(i);
    }
  }
  return table;
}

const std::array<uint8_t, 256> &asciiToEbcdic() {
  static const std::array<uint8_t, 256> table = buildAsciiToEbcdic();
  return table;
}

} // namespace

namespace EbcdicUtils {

std::string toAscii(const uint8_t *data, size_t length) {
  std::string result;
  result.reserve(length);

  for (size_t i = 0; i < length; ++i) {
    uint8_t byte = data[i];
    char ascii = ebcdicToAscii[byte];
    if (ascii != 0 || byte == 0) {
      result += ascii;
    } else {
      result += '?';
    }
  }

  return result;
}

std::string toAscii(const std::vector<uint8_t> &data) {
  return toAscii(data.data(), data.size());
}

uint8_t encode(char c) { return asciiToEbcdic()[static_cast<unsigned char>(c)]; }

void appendEncoded(std::vector<uint8_t> &out, std::string_view text) {
  out.reserve(out.size() + text.size());
  for (char c : text) {
    out.push_back(encode(c));
  }
}

} // namespace EbcdicUtils
