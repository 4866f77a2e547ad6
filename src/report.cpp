#include "csvlint/report.h"

namespace csvlint {

void write_report(std::ostream& out, const ValidationResult& result,
                  const ReportOptions& options) {
    if (result.valid) {
        if (options.rfc4180) {
            out << "file is valid and complies with RFC 4180\n";
        } else {
            out << "file is valid\n";
        }
        return;
    }

    size_t field_count = result.count(ErrorCategory::FIELD_COUNT_MISMATCH);
    size_t line_ending = result.count(ErrorCategory::LINE_ENDING_ERROR);
    size_t quoting = result.count(ErrorCategory::QUOTE_ERROR) +
                     result.count(ErrorCategory::UNESCAPED_SPECIAL_CHARACTER);
    size_t other = result.count(ErrorCategory::ENCODING_ERROR) +
                   result.count(ErrorCategory::IO_ERROR);

    out << "Found " << result.errors.size() << " validation error(s):\n";
    if (field_count > 0) {
        out << "  - " << field_count << " field count error(s)\n";
    }
    if (line_ending > 0) {
        out << "  - " << line_ending << " line ending error(s) (RFC 4180 requires CRLF)\n";
    }
    if (quoting > 0) {
        out << "  - " << quoting << " quote/escaping error(s)\n";
    }
    if (other > 0) {
        out << "  - " << other << " other error(s)\n";
    }
    out << "\n";

    for (const auto& err : result.errors) {
        if (options.show_context) {
            out << err.to_string() << "\n";
        } else {
            Defect bare = err;
            bare.context.clear();
            out << bare.to_string() << "\n";
        }
    }

    if (result.fatal_error() != nullptr) {
        out << "\nunable to parse any further\n";
    } else if (result.error_limit_reached) {
        out << "\nstopped after " << result.errors.size() << " error(s); the rest of the input was not checked\n";
    }
}

int exit_code(const ValidationResult& result) {
    if (result.valid) return 0;
    if (result.halted) return 1;
    return 2;
}

}  // namespace csvlint
