/**
 * @file extract.h
 * @brief Typed extraction of the value on top of the stack.
 *
 * Every function expects exactly one value on top of the stack and pops it,
 * whatever the outcome. When the value is nil (NON_EXISTENT) or has the wrong
 * type (WRONG_TYPE) the default is substituted if one is given, otherwise
 * FATAL is added and the output receives the kind's zero value.
 *
 * Numbers convert across all numeric kinds. Strings, booleans and pointers
 * require an exact type match.
 *
 * @ingroup Bridge
 */
#pragma once

#include "engine.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Closed set of host numeric kinds. */
typedef enum {
  SB_NUM_INT32,
  SB_NUM_INT64,
  SB_NUM_FLOAT,
  SB_NUM_DOUBLE,
  SB_NUM_LONG_DOUBLE
} Sb_Number_Kind;

/** @brief A host number tagged with its kind. */
typedef struct {
  Sb_Number_Kind kind;
  union {
    sb_int32 i32;
    sb_int64 i64;
    sb_float f32;
    sb_double f64;
    sb_long_double f80;
  } as;
} Sb_Number;

SB_API Sb_Number sb_number_make(Sb_Number_Kind kind, sb_double value);
/** @brief Size in bytes of one element of the given kind. */
SB_API sb_size sb_number_kind_size(Sb_Number_Kind kind);
SB_API sb_str sb_number_kind_name(Sb_Number_Kind kind);

/**
 * @brief Extracts a number of the requested kind.
 * @param def Default value, read as `kind` regardless of def->kind. NULL for none.
 * @param out Receives the value, its kind is set to `kind`.
 */
SB_API Sb_Error_Flags sb_extract_number(Sb_Ctx ctx, Sb_Number_Kind kind,
                                        const Sb_Number* def, Sb_Number* out);

SB_API Sb_Error_Flags sb_extract_boolean(Sb_Ctx ctx, const sb_bool* def, sb_bool* out);
SB_API Sb_Error_Flags sb_extract_integer(Sb_Ctx ctx, const sb_int32* def, sb_int32* out);
SB_API Sb_Error_Flags sb_extract_long(Sb_Ctx ctx, const sb_int64* def, sb_int64* out);
SB_API Sb_Error_Flags sb_extract_float(Sb_Ctx ctx, const sb_float* def, sb_float* out);
SB_API Sb_Error_Flags sb_extract_double(Sb_Ctx ctx, const sb_double* def, sb_double* out);
SB_API Sb_Error_Flags sb_extract_long_double(Sb_Ctx ctx, const sb_long_double* def, sb_long_double* out);
SB_API Sb_Error_Flags sb_extract_pointer(Sb_Ctx ctx, const sb_ptr* def, sb_ptr* out);

/**
 * @brief Extracts a string into a caller buffer.
 *
 * A string longer than cap - 1 bytes is truncated silently; the buffer is
 * always NUL terminated when cap > 0. Without a default and on failure the
 * buffer receives an empty string.
 *
 * @param def Default string, NULL for none.
 * @param out_len Optional, receives the number of bytes written (without NUL).
 */
SB_API Sb_Error_Flags sb_extract_string(Sb_Ctx ctx, sb_str def, char* buf, sb_size cap,
                                        sb_size* out_len);

/** @brief Byte length of the string on top of the stack, 0 if it is not a string. Pops nothing. */
SB_API sb_size sb_top_string_length(Sb_Ctx ctx);

#ifdef __cplusplus
}
#endif
