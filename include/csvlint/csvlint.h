/**
 * @file csvlint.h
 * @brief csvlint - streaming RFC 4180 validation.
 *
 * Include this header to get the whole public API:
 * - Dialect and parse_delimiter() for choosing the validation mode
 * - ByteSource implementations for files, streams and memory
 * - Scanner for pulling records one at a time
 * - Validator and validate() for running the rules
 * - write_report() and exit_code() for presenting the outcome
 */

#ifndef CSVLINT_H
#define CSVLINT_H

#define CSVLINT_VERSION_MAJOR 0
#define CSVLINT_VERSION_MINOR 1
#define CSVLINT_VERSION_PATCH 0
#define CSVLINT_VERSION_STRING "0.1.0"

#include "csvlint/common_defs.h"
#include "csvlint/dialect.h"
#include "csvlint/encoding.h"
#include "csvlint/error.h"
#include "csvlint/io_util.h"
#include "csvlint/report.h"
#include "csvlint/scanner.h"
#include "csvlint/utf8.h"
#include "csvlint/validator.h"

#endif  // CSVLINT_H
