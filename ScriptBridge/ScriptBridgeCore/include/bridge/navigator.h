/**
 * @file navigator.h
 * @brief Table handles, element pushes and key enumeration.
 *
 * A table handle names a stack slot holding a table. Handles nest strictly
 * LIFO: a handle opened after another must be closed before it. Closing
 * truncates the stack to one below the handle's slot, so everything pushed
 * above it goes away too.
 *
 * Element resolution used by sb_push(), sb_type_of() and every accessor:
 * - table + key      : table[key]
 * - table + position : table[position] (key wins when both are given)
 * - key only         : global key
 * - position only    : illegal, nil is pushed
 * - nothing          : the current top is reported and left alone
 *
 * @ingroup Bridge
 */
#pragma once

#include "engine.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Position meaning "no position given". */
#define SB_NO_POS (0)

/**
 * @brief Handle to a table held on the stack.
 * A zero slot is the null handle ("absent" or "not given").
 */
typedef struct {
  sb_stack_idx slot;
  sb_uint32 generation;
} Sb_Table;

#ifdef __cplusplus
#define SB_NULL_TABLE (Sb_Table{ 0, 0 })
#else
#define SB_NULL_TABLE ((Sb_Table){ 0, 0 })
#endif

SB_API sb_bool sb_table_is_null(Sb_Table table);

/** @brief Returns true when the handle is open and was not closed or discarded. */
SB_API sb_bool sb_table_is_valid(Sb_Ctx ctx, Sb_Table table);

/**
 * @brief Opens a table.
 *
 * With a parent, opens parent[key] or parent[position]; without a parent and
 * with a key, opens the global key; with nothing given, creates a new empty
 * table. On success the table sits at the returned slot.
 *
 * @return The null handle when the target does not exist or is not a table.
 *         The stack is left unchanged in that case.
 */
SB_API Sb_Table sb_table_open(Sb_Ctx ctx, Sb_Table parent, sb_str key, sb_int position);

/** @brief Opens the table already on top of the stack without pushing a copy. */
SB_API Sb_Table sb_table_open_top(Sb_Ctx ctx);

/**
 * @brief Closes a handle, truncating the stack to one below its slot.
 * @return false if the handle is stale or is not the innermost open handle;
 *         the stack is not touched in that case.
 */
SB_API sb_bool sb_table_close(Sb_Ctx ctx, Sb_Table table);

/**
 * @brief Pushes an element following the resolution rules above.
 * @return The type of the pushed (or reported) value. SB_TYPE_NONE with
 *         nothing pushed when the stack cannot grow.
 */
SB_API Sb_Type sb_push(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);

/**
 * @brief Same resolution as sb_push(). The resolved value stays on the stack,
 * the caller must pop it.
 */
SB_API Sb_Type sb_type_of(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);

/**
 * @brief Begins enumeration. Pushes the first key and value when the table is
 * not empty.
 * @return true if a pair was pushed.
 */
SB_API sb_bool sb_table_first(Sb_Ctx ctx, Sb_Table table);

/**
 * @brief Advances enumeration. Expects the current key on top (the value must
 * already be popped or extracted). Pops the key and pushes the next pair.
 * @return false when exhausted, in which case nothing is pushed.
 */
SB_API sb_bool sb_table_next(Sb_Ctx ctx, Sb_Table table);

/** @brief Total number of entries, counted by full enumeration. */
SB_API sb_size sb_table_length(Sb_Ctx ctx, Sb_Table table);

/** @brief Length of the contiguous integer-keyed prefix (border). */
SB_API sb_size sb_table_array_length(Sb_Ctx ctx, Sb_Table table);

#ifdef __cplusplus
}
#endif
