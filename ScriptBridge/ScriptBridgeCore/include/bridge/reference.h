/**
 * @file reference.h
 * @brief Durable registry references to script values.
 *
 * A reference survives any amount of unrelated stack traffic. It stays alive
 * until sb_unreference() is called or the context is destroyed.
 *
 * @ingroup Bridge
 */
#pragma once

#include "navigator.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Integer key into the registry. */
typedef sb_int Sb_Ref;

/** @brief Reference to nil. Pushing it yields nil, releasing it is a no-op. */
#define SB_REF_NIL (-1)
/** @brief No reference at all. */
#define SB_NO_REF (-2)

/**
 * @brief Resolves a value like sb_push() and stores it in the registry.
 *
 * With no table, key or position the current top is used. The value is
 * popped in every case.
 */
SB_API Sb_Ref sb_reference_for(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position);

/**
 * @brief Pushes the referenced value. The reference is not consumed.
 * @return Type of the pushed value. Unknown references push nil.
 */
SB_API Sb_Type sb_reference_to_top(Sb_Ctx ctx, Sb_Ref ref);

/**
 * @brief Releases a reference.
 * @return false if the reference is unknown or was already released.
 */
SB_API sb_bool sb_unreference(Sb_Ctx ctx, Sb_Ref ref);

SB_API sb_bool sb_reference_is_live(Sb_Ctx ctx, Sb_Ref ref);

#ifdef __cplusplus
}
#endif
