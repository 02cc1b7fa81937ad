/**
 * @file accessors.h
 * @brief Host-typed get/set against a table handle or a global name.
 *
 * Getters resolve their source like sb_push(), extract it and leave the stack
 * as they found it. Setters with a table write table[key] or table[position]
 * (key preferred); without a table and with a key they write the global key.
 *
 * @ingroup Bridge
 */
#pragma once

#include "navigator.h"
#include "extract.h"

#ifdef __cplusplus
extern "C" {
#endif

/* --- Scalar getters --- */

SB_API Sb_Error_Flags sb_get_number(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    Sb_Number_Kind kind, const Sb_Number* def, Sb_Number* out);
SB_API Sb_Error_Flags sb_get_boolean(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_bool* def, sb_bool* out);
SB_API Sb_Error_Flags sb_get_integer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_int32* def, sb_int32* out);
SB_API Sb_Error_Flags sb_get_long(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                  const sb_int64* def, sb_int64* out);
SB_API Sb_Error_Flags sb_get_float(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   const sb_float* def, sb_float* out);
SB_API Sb_Error_Flags sb_get_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    const sb_double* def, sb_double* out);
SB_API Sb_Error_Flags sb_get_long_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                         const sb_long_double* def, sb_long_double* out);
SB_API Sb_Error_Flags sb_get_pointer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_ptr* def, sb_ptr* out);
/** @brief See sb_extract_string() for the truncation policy. */
SB_API Sb_Error_Flags sb_get_string(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    sb_str def, char* buf, sb_size cap, sb_size* out_len);

/** @brief True when the resolved value is not nil. Net stack effect is zero. */
SB_API sb_bool sb_exists(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);

/* --- Scalar setters --- */

SB_API sb_bool sb_set_nil(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);
SB_API sb_bool sb_set_number(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, Sb_Number value);
SB_API sb_bool sb_set_boolean(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_bool value);
SB_API sb_bool sb_set_integer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_int32 value);
SB_API sb_bool sb_set_long(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_int64 value);
SB_API sb_bool sb_set_float(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_float value);
SB_API sb_bool sb_set_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_double value);
SB_API sb_bool sb_set_long_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_long_double value);
SB_API sb_bool sb_set_pointer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_ptr value);
SB_API sb_bool sb_set_string(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_str value);

/**
 * @brief Pops the value on top of the stack and stores it.
 * @return false if the destination is invalid; the value is popped anyway.
 */
SB_API sb_bool sb_set_from_top(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);

/* --- 1-D arrays --- */

/**
 * @brief Builds a new table {values[0], ..., values[count-1]} and leaves it on top.
 * @param values Array of `count` elements of the given kind.
 */
SB_API sb_no_ret sb_push_number_array(Sb_Ctx ctx, Sb_Number_Kind kind, const void* values, sb_size count);
SB_API sb_no_ret sb_push_string_array(Sb_Ctx ctx, const sb_str* values, sb_size count);

SB_API sb_bool sb_set_number_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   Sb_Number_Kind kind, const void* values, sb_size count);
SB_API sb_bool sb_set_string_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   const sb_str* values, sb_size count);

/**
 * @brief Reads a sequence into a host array.
 *
 * Reads min(sequence length, capacity) elements in order. Every element is
 * extracted with `def`; the flags of the first failing element are returned
 * but the remaining elements are still read. When the source is not a table
 * the result follows the scalar default-or-fatal rule and count is 0.
 *
 * @param out Array of `capacity` elements of the given kind.
 * @param out_count Optional, receives the number of elements written.
 */
SB_API Sb_Error_Flags sb_get_number_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                          Sb_Number_Kind kind, const Sb_Number* def,
                                          void* out, sb_size capacity, sb_size* out_count);

#ifdef __cplusplus
}
#endif
