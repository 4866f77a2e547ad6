#include "csvlint/encoding.h"
#include <cstring>

namespace csvlint {

const char* encoding_to_string(Encoding enc) {
    switch (enc) {
        case Encoding::UTF8:     return "UTF-8";
        case Encoding::UTF8_BOM: return "UTF-8 (BOM)";
        case Encoding::UTF16_LE: return "UTF-16LE";
        case Encoding::UTF16_BE: return "UTF-16BE";
        case Encoding::UTF32_LE: return "UTF-32LE";
        case Encoding::UTF32_BE: return "UTF-32BE";
    }
    return "Unknown";
}

// BOM (Byte Order Mark) patterns
static constexpr uint8_t UTF8_BOM[] = {0xEF, 0xBB, 0xBF};
static constexpr uint8_t UTF16_LE_BOM[] = {0xFF, 0xFE};
static constexpr uint8_t UTF16_BE_BOM[] = {0xFE, 0xFF};
static constexpr uint8_t UTF32_LE_BOM[] = {0xFF, 0xFE, 0x00, 0x00};
static constexpr uint8_t UTF32_BE_BOM[] = {0x00, 0x00, 0xFE, 0xFF};

static bool has_bom(const uint8_t* buf, size_t len,
                    const uint8_t* bom, size_t bom_len) {
    if (len < bom_len) return false;
    return std::memcmp(buf, bom, bom_len) == 0;
}

BomResult detect_bom(const uint8_t* buf, size_t len) {
    BomResult result;

    // UTF-32 LE starts with the UTF-16 LE BOM, so test the longer one first
    if (has_bom(buf, len, UTF32_LE_BOM, 4)) {
        result.encoding = Encoding::UTF32_LE;
        result.bom_length = 4;
    } else if (has_bom(buf, len, UTF32_BE_BOM, 4)) {
        result.encoding = Encoding::UTF32_BE;
        result.bom_length = 4;
    } else if (has_bom(buf, len, UTF16_LE_BOM, 2)) {
        result.encoding = Encoding::UTF16_LE;
        result.bom_length = 2;
    } else if (has_bom(buf, len, UTF16_BE_BOM, 2)) {
        result.encoding = Encoding::UTF16_BE;
        result.bom_length = 2;
    } else if (has_bom(buf, len, UTF8_BOM, 3)) {
        result.encoding = Encoding::UTF8_BOM;
        result.bom_length = 3;
    }

    return result;
}

bool Utf8Validator::start_sequence(uint8_t byte) {
    // Lead byte ranges and the constraint on the first continuation byte,
    // which is where overlong forms and surrogates are ruled out.
    if (byte >= 0xC2 && byte <= 0xDF) {
        needed_ = 1;
    } else if (byte == 0xE0) {
        needed_ = 2;
        lower_ = 0xA0;
    } else if (byte >= 0xE1 && byte <= 0xEC) {
        needed_ = 2;
    } else if (byte == 0xED) {
        needed_ = 2;
        upper_ = 0x9F;
    } else if (byte >= 0xEE && byte <= 0xEF) {
        needed_ = 2;
    } else if (byte == 0xF0) {
        needed_ = 3;
        lower_ = 0x90;
    } else if (byte >= 0xF1 && byte <= 0xF3) {
        needed_ = 3;
    } else if (byte == 0xF4) {
        needed_ = 3;
        upper_ = 0x8F;
    } else {
        // Continuation byte without a lead, C0/C1, or F5..FF
        return false;
    }
    return true;
}

size_t utf8_validate(const uint8_t* buf, size_t len) {
    Utf8Validator v;
    size_t seq_start = 0;
    for (size_t i = 0; i < len; ++i) {
        if (v.complete()) seq_start = i;
        if (!v.feed(buf[i])) return i;
    }
    return v.complete() ? len : seq_start;
}

} // namespace csvlint
