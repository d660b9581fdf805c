#include "Utf.h"

namespace ednkit::edn {

bool utf8_next_codepoint(const char *data, std::size_t len, std::size_t &pos, std::uint32_t &codepoint) {
    unsigned char ch = static_cast<unsigned char>(data[pos]);
    if (ch < 0x80) {
        codepoint = ch;
        pos += 1;
        return true;
    }
    std::size_t needed = utf8_sequence_length(ch);
    if (needed == 0) {
        return false;
    }
    needed -= 1;
    std::uint32_t code = 0;
    std::uint32_t min_value = 0;
    if (needed == 1) {
        code = ch & 0x1F;
        min_value = 0x80;
    } else if (needed == 2) {
        code = ch & 0x0F;
        min_value = 0x800;
    } else {
        code = ch & 0x07;
        min_value = 0x10000;
    }
    if (pos + needed >= len) {
        return false;
    }
    for (std::size_t idx = 1; idx <= needed; ++idx) {
        unsigned char next = static_cast<unsigned char>(data[pos + idx]);
        if ((next & 0xC0) != 0x80) {
            return false;
        }
        code = (code << 6) | (next & 0x3F);
    }
    if (code < min_value || !is_scalar_value(code)) {
        return false;
    }
    pos += needed + 1;
    codepoint = code;
    return true;
}

bool utf8_validate(const char *data, std::size_t len) {
    std::size_t pos = 0;
    while (pos < len) {
        // ascii runs dominate typical documents
        if (static_cast<unsigned char>(data[pos]) < 0x80) {
            ++pos;
            continue;
        }
        std::uint32_t codepoint = 0;
        if (!utf8_next_codepoint(data, len, pos, codepoint)) {
            return false;
        }
    }
    return true;
}

std::size_t utf8_sequence_length(std::uint8_t lead) noexcept {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

bool is_scalar_value(std::uint32_t codepoint) noexcept {
    return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

void utf8_append(std::uint32_t codepoint, std::string &out) {
    if (!is_scalar_value(codepoint)) {
        codepoint = 0xFFFD;
    }
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

} // namespace ednkit::edn
