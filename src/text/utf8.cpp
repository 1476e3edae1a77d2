#include "text/utf8.hpp"

namespace diktat::utf8 {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// Latin-1 letters live in 0xC0..0xFE, with the two arithmetic signs in
// between. 0xDF (sharp s) has no single-character uppercase form.
bool isLatin1Upper(char32_t c) {
    return c >= 0xC0 && c <= 0xDE && c != 0xD7;
}

bool isLatin1Lower(char32_t c) {
    return c >= 0xDF && c <= 0xFF && c != 0xF7;
}

} // namespace

std::u32string decode(std::string_view in) {
    std::u32string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        unsigned char b = static_cast<unsigned char>(in[i]);
        char32_t cp = 0;
        size_t extra = 0;

        if (b < 0x80) {
            out.push_back(b);
            ++i;
            continue;
        } else if ((b & 0xE0) == 0xC0) {
            cp = b & 0x1F;
            extra = 1;
        } else if ((b & 0xF0) == 0xE0) {
            cp = b & 0x0F;
            extra = 2;
        } else if ((b & 0xF8) == 0xF0) {
            cp = b & 0x07;
            extra = 3;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        if (i + extra >= in.size()) {
            // truncated sequence at the end of the input
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool ok = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cont = static_cast<unsigned char>(in[i + k]);
            if ((cont & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!ok) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string encode(char32_t c) {
    std::string out;
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out += encode(kReplacement);
    }
    return out;
}

std::string encode(std::u32string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char32_t c : in) out += encode(c);
    return out;
}

char32_t toLower(char32_t c) {
    if (c >= U'A' && c <= U'Z') return c + 0x20;
    if (isLatin1Upper(c)) return c + 0x20;
    if (c == 0x1E9E) return 0xDF; // capital sharp s
    return c;
}

std::u32string toLower(std::u32string_view s) {
    std::u32string out(s);
    for (auto& c : out) c = toLower(c);
    return out;
}

bool isUpper(char32_t c) {
    return (c >= U'A' && c <= U'Z') || isLatin1Upper(c) || c == 0x1E9E;
}

bool isLower(char32_t c) {
    return (c >= U'a' && c <= U'z') || isLatin1Lower(c);
}

bool isSpace(char32_t c) {
    switch (c) {
    case U' ': case U'\t': case U'\n': case U'\r': case U'\f': case U'\v':
    case 0xA0: case 0x2007: case 0x202F: case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

bool isAlnum(char32_t c) {
    if (c < 0x80) {
        return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
    }
    if (c < 0xC0) return c == 0xAA || c == 0xB5 || c == 0xBA;
    if (c <= 0xFF) return c != 0xD7 && c != 0xF7;
    if (c == kReplacement) return false;
    // General punctuation, symbols and arrows blocks.
    if (c >= 0x2000 && c <= 0x2BFF) return false;
    if (c >= 0x3000 && c <= 0x303F) return false;
    return true;
}

} // namespace diktat::utf8
