/**
 * @file report.h
 * @brief Human-readable rendering of a ValidationResult.
 */

#ifndef CSVLINT_REPORT_H
#define CSVLINT_REPORT_H

#include "csvlint/error.h"

#include <ostream>

namespace csvlint {

struct ReportOptions {
    bool rfc4180 = false;       // Word the verdict as RFC 4180 compliance
    bool show_context = true;   // Print defect context lines
};

/**
 * @brief Write the verdict, per-category counts and every defect.
 *
 * A valid result prints a single line. Otherwise the output is:
 *
 *     Found 3 validation error(s):
 *       - 2 field count error(s)
 *       - 1 quote/escaping error(s)
 *
 *     Record #2 has error: wrong number of fields: expected 3, found 2
 *     ...
 */
void write_report(std::ostream& out, const ValidationResult& result,
                  const ReportOptions& options = ReportOptions());

/// 0 when valid, 1 after a fatal abort, 2 when validation errors were found.
int exit_code(const ValidationResult& result);

}  // namespace csvlint

#endif  // CSVLINT_REPORT_H
