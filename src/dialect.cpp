#include "csvlint/dialect.h"
#include <sstream>

namespace csvlint {

std::string_view line_ending_bytes(LineEnding le) {
    switch (le) {
        case LineEnding::NONE: return std::string_view();
        case LineEnding::LF:   return std::string_view("\n", 1);
        case LineEnding::CRLF: return std::string_view("\r\n", 2);
        case LineEnding::CR:   return std::string_view("\r", 1);
    }
    return std::string_view();
}

const char* line_ending_to_string(LineEnding le) {
    switch (le) {
        case LineEnding::NONE: return "none";
        case LineEnding::LF:   return "LF";
        case LineEnding::CRLF: return "CRLF";
        case LineEnding::CR:   return "CR";
    }
    return "unknown";
}

std::string delimiter_name(char delimiter) {
    switch (delimiter) {
        case ',':  return "comma";
        case '\t': return "tab";
        case '|':  return "pipe";
        case ':':  return "colon";
        case ';':  return "semicolon";
        default:   return std::string(1, delimiter);
    }
}

std::optional<char> parse_delimiter(std::string_view text) {
    if (text == "," || text == "comma") return ',';
    if (text == "\t" || text == "\\t" || text == "tab") return '\t';
    if (text == "|" || text == "pipe") return '|';
    if (text == ":" || text == "colon") return ':';
    if (text == ";" || text == "semicolon") return ';';
    return std::nullopt;
}

std::string Dialect::to_string() const {
    std::ostringstream ss;
    ss << "Dialect{delimiter=" << delimiter_name(delimiter)
       << ", lazy_quotes=" << (lazy_quotes ? "true" : "false")
       << ", rfc4180=" << (strict_rfc4180 ? "true" : "false") << "}";
    return ss.str();
}

}  // namespace csvlint
