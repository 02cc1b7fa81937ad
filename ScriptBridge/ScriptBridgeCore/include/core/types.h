/**
 * @file types.h
 * @brief Primitive types definitions
 * @ingroup Core
 */
#pragma once

#include "defines.h"

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

/** @brief Alias for C-style strings (const char*). */
typedef const char *sb_str;

typedef void sb_no_ret; ///< Return type for functions that do not return a value.
typedef void *sb_ptr;   ///< Generic pointer type (void*).

typedef uint8_t sb_bool; ///< Boolean type (0 = false, non-zero = true).
typedef char sb_char;
typedef int sb_int;
typedef long long sb_long_long;
typedef size_t sb_size;  ///< Size type (platform dependent, usually size_t).
typedef float sb_float;
typedef double sb_double;
typedef long double sb_long_double;

// Fixed width unsigned integers
typedef uint8_t sb_uint8;
typedef uint32_t sb_uint32;
typedef uint64_t sb_uint64;

// Fixed width signed integers
typedef int32_t sb_int32;
typedef int64_t sb_int64;

#define sb_true  ((sb_bool)1)
#define sb_false ((sb_bool)0)

/** @brief Index into the engine value stack (1-based, 0 means "no slot"). */
typedef sb_int sb_stack_idx;
