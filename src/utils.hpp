#ifndef UTILS_INCLUDE_GUARD
#define UTILS_INCLUDE_GUARD

#include <string>
#include <stdexcept>
#include <boost/cstdint.hpp>

namespace sentseg {

typedef boost::uint32_t codepoint_t;
typedef std::basic_string<codepoint_t> ustring;

inline bool is_whitespace(codepoint_t c) {
    return ((c >= 0x0009) && (c <= 0x000D)) ||
            (c == 0x0020) ||
            (c == 0x0085) ||
            (c == 0x00A0) ||
            (c == 0x1680) ||
            (c == 0x180E) ||
           ((c >= 0x2000) && c <= (0x200A)) ||
           ((c >= 0x2028) && (c <= 0x2029)) ||
            (c == 0x202F) ||
            (c == 0x205F) ||
            (c == 0x3000);
}

// Reads the character starting at buffer[offset] and moves offset past it.
inline codepoint_t utf8char_to_unicode(char const *buffer, size_t length,
                                       size_t &offset) {
    // C++ char type is signed, so we cast the array to uint8_t,
    // so the values are interpreted as naturals
    boost::uint8_t const *ubuffer = (boost::uint8_t const*)buffer;

    size_t n_bytes;
    codepoint_t codepoint;
    if (ubuffer[offset] >> 7 == 0 /*0xxxxxxx*/) {
        // An ASCII singleton.
        codepoint = ubuffer[offset];
        offset++;
        return codepoint;
    } else if (ubuffer[offset] >> 5 == 6 /*110xxxxx*/) {
        n_bytes = 2;
        codepoint = ubuffer[offset] & 31 /*last 5 bits*/;
    } else if (ubuffer[offset] >> 4 == 14 /*1110xxxx*/) {
        n_bytes = 3;
        codepoint = ubuffer[offset] & 15 /*last 4 bits*/;
    } else if (ubuffer[offset] >> 3 == 30 /*11110xxx*/) {
        n_bytes = 4;
        codepoint = ubuffer[offset] & 7 /*last 3 bits*/;
    } else {
        throw std::domain_error
            ("buffer does not hold a valid UTF-8 character.");
    }

    if (length - offset < n_bytes) {
        throw std::domain_error("truncated UTF-8 character at end of buffer.");
    }
    for (size_t i = 1; i < n_bytes; i++) {
        if (ubuffer[offset + i] >> 6 != 2 /*10xxxxxx*/) {
            throw std::domain_error
                ("buffer does not hold a valid UTF-8 character.");
        }
        codepoint = (codepoint << 6) | (ubuffer[offset + i] & 63);
    }
    offset += n_bytes;
    return codepoint;
}

inline ustring utf8_to_unicode(std::string const &str) {
    std::string::size_type i = 0;
    ustring codepoints;

    while (i < str.length()) {
        codepoints.push_back(utf8char_to_unicode(str.data(), str.length(), i));
    }

    return codepoints;
}

}
#endif
