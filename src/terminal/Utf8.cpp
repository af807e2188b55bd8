#include "terminal/Utf8.h"
#include <cstdint>

namespace ViewPane::Terminal::Utf8 {

namespace {
constexpr char32_t kReplacementChar = 0xFFFD;

// Scalar values only: no surrogates, nothing past U+10FFFF
bool IsScalarValue(char32_t ch) {
    return ch <= 0x10FFFF && (ch < 0xD800 || ch > 0xDFFF);
}

// Smallest codepoint that needs a sequence of the given length
char32_t MinimumForLength(int length) {
    switch (length) {
        case 2:  return 0x80;
        case 3:  return 0x800;
        default: return 0x10000;
    }
}
} // anonymous namespace

std::u32string Decode(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());

    uint8_t buffer[4] = {};
    int bytesNeeded = 0;
    int bytesReceived = 0;

    for (char c : text) {
        uint8_t byte = static_cast<uint8_t>(c);

        if (bytesNeeded > 0) {
            // Expecting continuation byte (10xxxxxx)
            if ((byte & 0xC0) == 0x80) {
                buffer[bytesReceived++] = byte;
                if (bytesReceived == bytesNeeded) {
                    char32_t codepoint = 0;
                    if (bytesNeeded == 2) {
                        codepoint = ((buffer[0] & 0x1F) << 6) |
                                    (buffer[1] & 0x3F);
                    } else if (bytesNeeded == 3) {
                        codepoint = ((buffer[0] & 0x0F) << 12) |
                                    ((buffer[1] & 0x3F) << 6) |
                                    (buffer[2] & 0x3F);
                    } else {
                        codepoint = ((buffer[0] & 0x07) << 18) |
                                    ((buffer[1] & 0x3F) << 12) |
                                    ((buffer[2] & 0x3F) << 6) |
                                    (buffer[3] & 0x3F);
                    }
                    // Overlong forms, surrogates and values past U+10FFFF
                    // decode to a single replacement
                    if (codepoint < MinimumForLength(bytesNeeded) || !IsScalarValue(codepoint)) {
                        codepoint = kReplacementChar;
                    }
                    bytesNeeded = 0;
                    bytesReceived = 0;
                    result.push_back(codepoint);
                }
                continue;
            }

            // Truncated sequence - emit a replacement and reprocess this byte
            result.push_back(kReplacementChar);
            bytesNeeded = 0;
            bytesReceived = 0;
        }

        if ((byte & 0x80) == 0) {
            result.push_back(static_cast<char32_t>(byte));
        } else if ((byte & 0xE0) == 0xC0) {
            buffer[0] = byte;
            bytesNeeded = 2;
            bytesReceived = 1;
        } else if ((byte & 0xF0) == 0xE0) {
            buffer[0] = byte;
            bytesNeeded = 3;
            bytesReceived = 1;
        } else if ((byte & 0xF8) == 0xF0) {
            buffer[0] = byte;
            bytesNeeded = 4;
            bytesReceived = 1;
        } else {
            // Stray continuation or invalid lead byte
            result.push_back(kReplacementChar);
        }
    }

    if (bytesNeeded > 0) {
        result.push_back(kReplacementChar);
    }

    return result;
}

void AppendCodepoint(std::string& out, char32_t ch) {
    if (!IsScalarValue(ch)) {
        ch = kReplacementChar;
    }

    if (ch < 0x80) {
        out.push_back(static_cast<char>(ch));
    } else if (ch < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (ch >> 6)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else if (ch < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (ch >> 12)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (ch >> 18)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
}

std::string Encode(const std::u32string& text) {
    std::string result;
    result.reserve(text.size());
    for (char32_t ch : text) {
        AppendCodepoint(result, ch);
    }
    return result;
}

size_t Length(const std::string& text) {
    return Decode(text).size();
}

} // namespace ViewPane::Terminal::Utf8
