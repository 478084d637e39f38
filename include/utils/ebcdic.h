#ifndef EBCDIC_H
#define EBCDIC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// CCSID 37 conversions for character fields exchanged with the journal
// retrieval service. Unmappable bytes decode to '?'.
namespace EbcdicUtils {

std::string toAscii(const uint8_t *data, size_t length);
std::string toAscii(const std::vector<uint8_t> &data);

uint8_t encode(char c);
void appendEncoded(std::vector<uint8_t> &out, std::string_view text);

constexpr uint8_t EBCDIC_SPACE = 0x40;
constexpr uint8_t EBCDIC_ZERO = 0xF0;

} // namespace EbcdicUtils

#endif
