#ifndef CSVLINT_COMMON_DEFS_H
#define CSVLINT_COMMON_DEFS_H

#include <cstddef>

// Bytes requested from a ByteSource per read. Records may span any number of
// reads; this only bounds the scanner's read buffer.
#define CSVLINT_DEFAULT_CHUNK_SIZE (64 * 1024)

// Maximum bytes of record text kept as context on a defect.
#define CSVLINT_DEFAULT_CONTEXT_WIDTH 60

#ifdef _MSC_VER

#define really_inline inline

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

#else

#define really_inline inline __attribute__((always_inline, unused))

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

#endif  // _MSC_VER

#endif // CSVLINT_COMMON_DEFS_H
