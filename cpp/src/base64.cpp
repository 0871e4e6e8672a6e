#include "sealdrop/base64.hpp"

#include <array>
#include <string>
#include <vector>

namespace sealdrop::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    for (std::size_t i = 0; i < data.size(); i += 3) {
        const std::size_t remaining = data.size() - i;
        std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
        if (remaining > 1) {
            group |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        if (remaining > 2) {
            group |= static_cast<std::uint32_t>(data[i + 2]);
        }
        out.push_back(kEncTable[(group >> 18) & 0x3F]);
        out.push_back(kEncTable[(group >> 12) & 0x3F]);
        out.push_back(remaining > 1 ? kEncTable[(group >> 6) & 0x3F] : '=');
        out.push_back(remaining > 2 ? kEncTable[group & 0x3F] : '=');
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> Decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3);
    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last = i + 4 == input.size();
        std::size_t padding = 0;
        std::uint32_t group = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const unsigned char c = static_cast<unsigned char>(input[i + j]);
            if (c == '=') {
                // Padding only in the last two positions of the final quad.
                if (!last || j < 2) {
                    return std::nullopt;
                }
                ++padding;
                group <<= 6;
                continue;
            }
            if (padding > 0 || kDecTable[c] == kInvalid) {
                return std::nullopt;
            }
            group = (group << 6) | kDecTable[c];
        }
        out.push_back(static_cast<std::uint8_t>((group >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<std::uint8_t>((group >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<std::uint8_t>(group & 0xFF));
        }
    }
    return out;
}

}  // namespace sealdrop::base64
