#include "csvlint/error.h"
#include <sstream>

namespace csvlint {

const char* category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::FIELD_COUNT_MISMATCH: return "FIELD_COUNT_MISMATCH";
        case ErrorCategory::LINE_ENDING_ERROR: return "LINE_ENDING_ERROR";
        case ErrorCategory::QUOTE_ERROR: return "QUOTE_ERROR";
        case ErrorCategory::UNESCAPED_SPECIAL_CHARACTER: return "UNESCAPED_SPECIAL_CHARACTER";
        case ErrorCategory::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCategory::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

const char* quote_error_kind_to_string(QuoteErrorKind kind) {
    switch (kind) {
        case QuoteErrorKind::NONE: return "NONE";
        case QuoteErrorKind::UNTERMINATED_QUOTE: return "UNTERMINATED_QUOTE";
        case QuoteErrorKind::BARE_QUOTE: return "BARE_QUOTE";
        case QuoteErrorKind::MALFORMED_ESCAPE: return "MALFORMED_ESCAPE";
    }
    return "UNKNOWN";
}

std::string Defect::to_string() const {
    std::ostringstream ss;
    if (record_number == 0) {
        ss << "Error: " << message;
    } else {
        ss << "Record #" << record_number << " has error: " << message;
    }

    if (!context.empty()) {
        ss << "\n  Context: " << context;
    }

    return ss.str();
}

bool Defect::operator==(const Defect& other) const {
    return record_number == other.record_number &&
           category == other.category &&
           quote_kind == other.quote_kind &&
           field == other.field &&
           byte_offset == other.byte_offset &&
           fatal == other.fatal &&
           message == other.message &&
           context == other.context;
}

size_t ValidationResult::count(ErrorCategory category) const {
    size_t n = 0;
    for (const auto& err : errors) {
        if (err.category == category) ++n;
    }
    return n;
}

const Defect* ValidationResult::fatal_error() const {
    if (!halted || errors.empty() || !errors.back().fatal) {
        return nullptr;
    }
    return &errors.back();
}

size_t DefectCollector::count(ErrorCategory category) const {
    size_t n = 0;
    for (const auto& err : errors_) {
        if (err.category == category) ++n;
    }
    return n;
}

std::vector<Defect> DefectCollector::take() {
    std::vector<Defect> out = std::move(errors_);
    clear();
    return out;
}

void DefectCollector::truncate_to_limit() {
    if (max_errors_ != 0 && errors_.size() > max_errors_) {
        errors_.erase(errors_.begin() + static_cast<long>(max_errors_), errors_.end());
    }
}

std::string DefectCollector::summary() const {
    if (errors_.empty()) {
        return "No errors";
    }

    std::ostringstream ss;
    size_t field_count = 0, line_ending = 0, quote = 0, special = 0, encoding = 0, io = 0;

    for (const auto& err : errors_) {
        switch (err.category) {
            case ErrorCategory::FIELD_COUNT_MISMATCH: field_count++; break;
            case ErrorCategory::LINE_ENDING_ERROR: line_ending++; break;
            case ErrorCategory::QUOTE_ERROR: quote++; break;
            case ErrorCategory::UNESCAPED_SPECIAL_CHARACTER: special++; break;
            case ErrorCategory::ENCODING_ERROR: encoding++; break;
            case ErrorCategory::IO_ERROR: io++; break;
        }
    }

    ss << "Total errors: " << errors_.size() << " (";
    const char* sep = "";
    auto part = [&](const char* label, size_t n) {
        if (n > 0) {
            ss << sep << label << ": " << n;
            sep = ", ";
        }
    };
    part("Field count", field_count);
    part("Line ending", line_ending);
    part("Quote", quote);
    part("Unescaped", special);
    part("Encoding", encoding);
    part("I/O", io);
    ss << ")";

    ss << "\n\nDetails:\n";
    for (const auto& err : errors_) {
        ss << err.to_string() << "\n";
    }

    return ss.str();
}

} // namespace csvlint
