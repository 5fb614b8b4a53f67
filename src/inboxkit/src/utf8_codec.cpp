#include "utf8_codec.hpp"

#include <array>
#include <cassert>
#include <cstdint>

namespace inboxkit::utf8_codec {

uint32_t select_bits(uint32_t number, unsigned from, unsigned to) {
    auto mask = static_cast<uint32_t>(0xFFFFFFFF) >> (31 - to);
    return (number & mask) >> from;
}

bool encode_point(uint32_t cp, char* buff, size_t buff_size, size_t& bytes_written) {
    assert(buff_size >= 4);

    if (cp <= 0x7F) {  // 7bit
        if (buff_size < 1) {
            return false;
        }
        buff[0] = static_cast<uint8_t>(cp);
        bytes_written = 1;
        return true;
    } else if (cp <= 0x7FF) {  // 11bit
        if (buff_size < 2) {
            return false;
        }
        buff[0] = 0xC0 | select_bits(cp, 6, 10);
        buff[1] = 0x80 | select_bits(cp, 0, 5);
        bytes_written = 2;
        return true;
    } else if (cp <= 0xFFFF) {  // 16bit
        if (buff_size < 3) {
            return false;
        }
        buff[0] = 0xE0 | select_bits(cp, 12, 15);
        buff[1] = 0x80 | select_bits(cp, 6, 11);
        buff[2] = 0x80 | select_bits(cp, 0, 5);
        bytes_written = 3;
        return true;
    } else if (cp <= 0x10FFFF) {  // 21 bit

        if (buff_size < 4) {
            return false;
        }
        buff[0] = 0xF0 | select_bits(cp, 18, 20);
        buff[1] = 0x80 | select_bits(cp, 12, 17);
        buff[2] = 0x80 | select_bits(cp, 6, 11);
        buff[3] = 0x80 | select_bits(cp, 0, 5);
        bytes_written = 4;
        return true;
    } else {
        bytes_written = 0;
        return false;
    }
}

bool append_codepoint(std::string& s, uint32_t codepoint) {
    std::array<char, 4> buff;
    size_t bytes_written;
    if (!encode_point(codepoint, buff.data(), buff.size(), bytes_written)) {
        return false;
    }
    s.append(buff.data(), bytes_written);
    return true;
}

bool decode_point(std::string_view s, uint32_t& cp, size_t& bytes_read) {
    if (s.empty()) {
        return false;
    }

    const auto lead = static_cast<uint8_t>(s[0]);
    size_t len = 0;
    uint32_t min_cp = 0;

    if (lead <= 0x7F) {
        cp = lead;
        bytes_read = 1;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
        min_cp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
        min_cp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
        min_cp = 0x10000;
    } else {
        return false;
    }

    if (s.size() < len) {
        return false;
    }

    for (size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<uint8_t>(s[i]);
        if ((cont & 0xC0) != 0x80) {
            return false;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
    }

    bytes_read = len;
    return true;
}

}  // namespace inboxkit::utf8_codec
