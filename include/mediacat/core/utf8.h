#pragma once

#include <string>
#include <string_view>

namespace mediacat::common {

// Replace invalid UTF-8 byte sequences with U+FFFD so binary metadata fields survive a JSON dump.
inline std::string sanitizeUtf8(std::string_view input) {
    static constexpr const char* kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(input.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    const size_t n = input.size();
    auto cont = [&](size_t at) { return at < n && (data[at] & 0xC0) == 0x80; };

    while (i < n) {
        unsigned char c = data[i];
        size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF && cont(i + 1)) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF && cont(i + 1) && cont(i + 2)) {
            // reject overlongs and UTF-16 surrogates
            unsigned char c1 = data[i + 1];
            if (!(c == 0xE0 && c1 < 0xA0) && !(c == 0xED && c1 > 0x9F))
                len = 3;
        } else if (c >= 0xF0 && c <= 0xF4 && cont(i + 1) && cont(i + 2) && cont(i + 3)) {
            unsigned char c1 = data[i + 1];
            if (!(c == 0xF0 && c1 < 0x90) && !(c == 0xF4 && c1 > 0x8F))
                len = 4;
        }

        if (len == 0) {
            out.append(kReplacement);
            ++i;
        } else {
            out.append(input.substr(i, len));
            i += len;
        }
    }
    return out;
}

// Latin-1 to UTF-8, used for PNG tEXt payloads
inline std::string latin1ToUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace mediacat::common
