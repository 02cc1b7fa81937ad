/**
 * @file call.h
 * @brief Invocation of script functions through a callable handle.
 *
 * A callable handle moves through:
 *   Unbound -> Bound (arguments accumulate) -> Invoked -> Bound ... -> closed.
 * Opening places a copy of the function at the handle's base slot. Each
 * invocation calls a fresh copy of it, so a handle can be invoked repeatedly.
 * Closing truncates the stack to one below the base slot, removing the
 * function, pending arguments and unread results.
 *
 * @ingroup Bridge
 */
#pragma once

#include "navigator.h"
#include "extract.h"
#include "reference.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Argument count of a handle whose arguments were consumed by a call. */
#define SB_CALL_INVOKED (-1)

typedef struct {
  sb_stack_idx base;      ///< Slot of the function, 0 when unbound.
  sb_int arg_count;       ///< Pending arguments or SB_CALL_INVOKED.
  sb_uint64 identity;     ///< Tag derived from the function's address. Not dereferenceable.
  sb_uint32 generation;
} Sb_Call;

typedef enum {
  SB_CALL_STATE_UNBOUND,
  SB_CALL_STATE_BOUND,
  SB_CALL_STATE_INVOKED
} Sb_Call_State;

/**
 * @brief Opens table[key], table[position] or, without a table, the global key.
 * @return An unbound handle if the value is not callable. The stack is unchanged then.
 */
SB_API Sb_Call sb_call_open(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);
SB_API Sb_Call sb_call_open_ref(Sb_Ctx ctx, Sb_Ref ref);
/** @brief Opens a copy of the value on top of the stack. */
SB_API Sb_Call sb_call_open_top(Sb_Ctx ctx);

SB_API Sb_Call_State sb_call_state(const Sb_Call* call);
SB_API sb_uint64 sb_call_identity(const Sb_Call* call);

/* Each push adds one argument. After an invocation the first push starts a fresh argument list. */
SB_API sb_bool sb_call_push_nil(Sb_Ctx ctx, Sb_Call* call);
SB_API sb_bool sb_call_push_boolean(Sb_Ctx ctx, Sb_Call* call, sb_bool value);
SB_API sb_bool sb_call_push_integer(Sb_Ctx ctx, Sb_Call* call, sb_int32 value);
SB_API sb_bool sb_call_push_long(Sb_Ctx ctx, Sb_Call* call, sb_int64 value);
SB_API sb_bool sb_call_push_number(Sb_Ctx ctx, Sb_Call* call, Sb_Number value);
SB_API sb_bool sb_call_push_double(Sb_Ctx ctx, Sb_Call* call, sb_double value);
SB_API sb_bool sb_call_push_string(Sb_Ctx ctx, Sb_Call* call, sb_str value);
SB_API sb_bool sb_call_push_pointer(Sb_Ctx ctx, Sb_Call* call, sb_ptr value);
/** @brief Uses the value already on top of the stack as the next argument. */
SB_API sb_bool sb_call_push_top(Sb_Ctx ctx, Sb_Call* call);
/** @brief Pushes the array as a single table argument. */
SB_API sb_bool sb_call_push_number_array(Sb_Ctx ctx, Sb_Call* call, Sb_Number_Kind kind,
                                         const void* values, sb_size count);
SB_API sb_bool sb_call_push_string_array(Sb_Ctx ctx, Sb_Call* call, const sb_str* values, sb_size count);

/**
 * @brief Calls the function in protected mode with the pending arguments.
 *
 * On success `n_results` values (or all of them with SB_MULTRET) are left on
 * the stack and SB_ERROR_NONE is returned. On failure nothing is left, the
 * error message is recorded as the context's last error and
 * SB_ERROR_FATAL is returned. The handle is Invoked afterwards either way.
 *
 * @param out_info Optional, receives the engine status and message.
 * @param out_results Optional, receives the number of results left on the stack.
 */
SB_API Sb_Error_Flags sb_call_invoke(Sb_Ctx ctx, Sb_Call* call, sb_int n_results,
                                     Sb_Error_Info* out_info, sb_int* out_results);

/**
 * @brief Closes the handle and zeroes it.
 * @return false if the handle is stale or not the innermost open handle.
 */
SB_API sb_bool sb_call_close(Sb_Ctx ctx, Sb_Call* call);

#ifdef __cplusplus
}
#endif
