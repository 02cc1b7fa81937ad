/**
 * @file engine.h
 * @brief Engine instance and stack primitives.
 *
 * An Sb_Ctx owns one embedded interpreter, its value stack and its registry.
 * Every other bridge component borrows a context for the duration of a call.
 * A context must only be used by one thread of control at a time; the bridge
 * performs no internal locking.
 *
 * @defgroup Bridge Dynamic-Value Bridge
 * @{
 */
#pragma once

#include "../core/types.h"
#include "../core/error.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Opaque pointer to a bridge context (one interpreter). */
typedef sb_ptr Sb_Ctx;

struct Sb_Config;

/**
 * @brief Type tag of a stack slot.
 * Values follow the interpreter's own tags, SB_TYPE_NONE marks an invalid slot.
 */
typedef enum {
  SB_TYPE_NONE = -1,
  SB_TYPE_NIL = 0,
  SB_TYPE_BOOLEAN,
  SB_TYPE_LIGHTUSERDATA,
  SB_TYPE_NUMBER,
  SB_TYPE_STRING,
  SB_TYPE_TABLE,
  SB_TYPE_FUNCTION,
  SB_TYPE_USERDATA,
  SB_TYPE_THREAD
} Sb_Type;

/** @brief Request every result of a call. */
#define SB_MULTRET (-1)

/** @brief Creates a new context with the standard libraries opened. */
SB_API Sb_Ctx sb_create_ctx();

/** @brief Creates a new context and applies the given configuration to it. */
SB_API Sb_Ctx sb_create_ctx_with_config(const struct Sb_Config* config);

/**
 * @brief Destroys a context and frees all associated resources.
 * Live references and open handles are reported before the interpreter is closed.
 */
SB_API sb_no_ret sb_destroy_ctx(Sb_Ctx ctx);

/* --- Script loading --- */

/** @brief Compiles a chunk and pushes it as a function. Pushes nothing on failure. */
SB_API Sb_Status sb_load_string(Sb_Ctx ctx, sb_str code);
/** @brief Compiles a file and pushes it as a function. Pushes nothing on failure. */
SB_API Sb_Status sb_load_file(Sb_Ctx ctx, sb_str file_path);
/** @brief Compiles and runs a chunk, discarding its results. Net stack effect is zero. */
SB_API Sb_Status sb_do_string(Sb_Ctx ctx, sb_str code);
/** @brief Compiles and runs a file, discarding its results. Net stack effect is zero. */
SB_API Sb_Status sb_do_file(Sb_Ctx ctx, sb_str file_path);

/* --- Errors --- */

SB_API Sb_Status sb_get_last_error(Sb_Ctx ctx);
SB_API sb_str sb_get_last_error_str(Sb_Ctx ctx);
SB_API Sb_Error_Info sb_get_last_error_info(Sb_Ctx ctx);
SB_API sb_no_ret sb_clear_error(Sb_Ctx ctx);

/**
 * @brief Classifies a status and optionally aborts.
 *
 * On SB_STATUS_OK returns true. Otherwise the status and the context's last
 * error text are written to the out-parameters that were supplied and false is
 * returned. When both out-parameters are NULL the context message and the
 * engine's error text are logged as critical and the process terminates.
 *
 * @param context Caller supplied description, e.g. "loading settings.lua".
 */
SB_API sb_bool sb_check(Sb_Ctx ctx, Sb_Status status, sb_str context,
                        Sb_Status* out_status, sb_str* out_msg);

/* --- Stack primitives (1-based indexing) --- */

SB_API sb_stack_idx sb_stack_size(Sb_Ctx ctx);
/** @brief Sets the stack top, truncating or padding with nil. */
SB_API sb_no_ret sb_stack_set_size(Sb_Ctx ctx, sb_stack_idx size);
SB_API sb_no_ret sb_pop(Sb_Ctx ctx, sb_int n);
SB_API Sb_Type sb_stack_type(Sb_Ctx ctx, sb_stack_idx i);
SB_API sb_str sb_type_name(Sb_Type type);
SB_API sb_no_ret sb_stack_dump(Sb_Ctx ctx);

SB_API sb_no_ret sb_push_nil(Sb_Ctx ctx);
SB_API sb_no_ret sb_push_boolean(Sb_Ctx ctx, sb_bool val);
SB_API sb_no_ret sb_push_integer(Sb_Ctx ctx, sb_int32 val);
SB_API sb_no_ret sb_push_long(Sb_Ctx ctx, sb_int64 val);
SB_API sb_no_ret sb_push_float(Sb_Ctx ctx, sb_float val);
SB_API sb_no_ret sb_push_double(Sb_Ctx ctx, sb_double val);
SB_API sb_no_ret sb_push_long_double(Sb_Ctx ctx, sb_long_double val);
SB_API sb_no_ret sb_push_string(Sb_Ctx ctx, sb_str val);
SB_API sb_no_ret sb_push_lstring(Sb_Ctx ctx, sb_str val, sb_size len);
SB_API sb_no_ret sb_push_pointer(Sb_Ctx ctx, sb_ptr val);
/** @brief Pushes a copy of the value at slot i. */
SB_API sb_no_ret sb_push_copy(Sb_Ctx ctx, sb_stack_idx i);

/* --- Diagnostics --- */

/** @brief Number of registry references taken and not yet released. */
SB_API sb_size sb_ref_count(Sb_Ctx ctx);
/** @brief Number of table and call handles currently open. */
SB_API sb_size sb_open_handle_count(Sb_Ctx ctx);
SB_API sb_no_ret sb_gc_collect(Sb_Ctx ctx);
/** @brief Bytes currently allocated by the interpreter. */
SB_API sb_size sb_get_mem_used(Sb_Ctx ctx);

#ifdef __cplusplus
}
#endif
/** @} */
