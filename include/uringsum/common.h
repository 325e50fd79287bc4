/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the preprocessor helpers and small inline utility
/// functions shared by every translation unit of the checksum engine.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_COMMON_H
#define URINGSUM_COMMON_H

/*////////////////
//   Includes   //
////////////////*/
#include <time.h>
#include <stddef.h>
#include <stdint.h>

/*////////////////////
//   Preprocessor   //
////////////////////*/
/// @summary Tag used to mark a function as available for use only within the
/// translation unit that defines it.
#ifndef internal_function
#define internal_function          static
#endif

/// @summary Tag used to mark a variable as visible only within the translation
/// unit that defines it.
#ifndef global_variable
#define global_variable            static
#endif

/// @summary Check an engine invariant. Unlike assert(), the check is performed
/// in every build configuration; a failed check reports the condition and the
/// source location, and then terminates the process.
#define URINGSUM_VERIFY(cond)                                                  \
    do {                                                                       \
        if (!(cond)) uringsum_verify_failed(#cond, __FILE__, __LINE__);        \
    } while (0)

/*/////////////////
//   Constants   //
/////////////////*/
/// The scale used to convert from seconds into nanoseconds.
static uint64_t const SEC_TO_NANOSEC = 1000000000ULL;

/*////////////////
//   Functions  //
////////////////*/
/// @summary Reports a failed URINGSUM_VERIFY() check and aborts the process.
/// @param cond The text of the condition that evaluated to false.
/// @param file The source file containing the check.
/// @param line The line number of the check within file.
void uringsum_verify_failed(char const *cond, char const *file, int line) __attribute__((noreturn));

/// @summary Rounds a size up to the nearest even multiple of a given power-of-two.
/// @param size The size value to round up.
/// @param pow2 The power-of-two alignment.
/// @return The input size, rounded up to the nearest even multiple of pow2. A
/// size of zero rounds up to pow2.
static inline size_t align_up(size_t size, size_t pow2)
{
    return (size == 0) ? pow2 : ((size + (pow2-1)) & ~(pow2-1));
}

/// @summary Rounds a file offset down to the nearest even multiple of a given power-of-two.
/// @param offset The byte offset to round down.
/// @param pow2 The power-of-two alignment.
/// @return The largest multiple of pow2 less than or equal to offset.
static inline int64_t align_down(int64_t offset, size_t pow2)
{
    return (offset & ~(int64_t(pow2) - 1));
}

/// @summary Clamps a value to a given maximum.
/// @param size The size value to clamp.
/// @param limit The upper-bound to clamp to.
/// @return The smaller of size and limit.
static inline size_t clamp_to(size_t size, size_t limit)
{
    return (size > limit) ? limit : size;
}

/// @summary Determine whether a value is a non-zero power of two.
static inline bool is_pow2(size_t value)
{
    return (value != 0) && ((value & (value-1)) == 0);
}

/// @summary Reads the current tick count for use as a timestamp.
/// @return The current timestamp value, in nanoseconds.
static inline uint64_t nanotime(void)
{
    struct timespec tsc;
    clock_gettime(CLOCK_MONOTONIC, &tsc);
    return (SEC_TO_NANOSEC * uint64_t(tsc.tv_sec) + uint64_t(tsc.tv_nsec));
}

#endif /* !defined(URINGSUM_COMMON_H) */
