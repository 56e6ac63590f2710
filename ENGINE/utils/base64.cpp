#include "utils/base64.hpp"

#include <array>
#include <cctype>

namespace flipbook::base64 {
namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_reverse_table() {
    std::array<int, 256> table{};
    for (auto& entry : table) entry = -1;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

constexpr std::array<int, 256> kReverse = make_reverse_table();

}

std::optional<std::vector<std::uint8_t>> decode(std::string_view text) {
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    std::uint32_t accumulator = 0;
    int bits = 0;
    int group = 0;
    bool padding = false;

    for (unsigned char ch : text) {
        if (std::isspace(ch)) continue;
        if (ch == '=') {
            padding = true;
            continue;
        }
        // Data after padding means the input was concatenated or corrupt.
        if (padding) return std::nullopt;
        const int value = kReverse[ch];
        if (value < 0) return std::nullopt;

        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        group = (group + 1) % 4;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((accumulator >> bits) & 0xFFu));
        }
    }

    if (group == 1) {
        return std::nullopt;
    }
    return out;
}

}
