/**
 * @file error.h
 * @brief Failure vocabulary shared by every bridge component.
 *
 * Two independent classifications exist:
 * - Sb_Error_Flags describe why a typed extraction or table access did not
 *   produce the real value (the value may still be a usable default).
 * - Sb_Status is the engine-level outcome of a load or protected call,
 *   passed through from the embedded interpreter.
 *
 * @ingroup Core
 */
#pragma once

#include "defines.h"
#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Extraction failure flags. Combine with bitwise OR.
 */
typedef enum {
	SB_ERROR_NONE         = 0,
	SB_ERROR_NON_EXISTENT = 1 << 0, ///< The source value was nil or absent.
	SB_ERROR_WRONG_TYPE   = 1 << 1, ///< The source value has an incompatible type.
	SB_ERROR_FATAL        = 1 << 2  ///< No default was supplied, the result is unusable.
} Sb_Error_Flag;

/** @brief Set of Sb_Error_Flag values. */
typedef sb_uint32 Sb_Error_Flags;

/**
 * @brief Engine-level status of a load or protected call.
 */
typedef enum {
	SB_STATUS_OK,
	SB_STATUS_YIELD,
	SB_STATUS_ERR_RUNTIME,
	SB_STATUS_ERR_SYNTAX,
	SB_STATUS_ERR_MEMORY,
	SB_STATUS_ERR_HANDLER,   ///< Error while running the message handler.
	SB_STATUS_ERR_FILE,
	SB_STATUS_ERR_INVALID    ///< The bridge rejected the request before reaching the engine.
} Sb_Status;

/**
 * @brief Last error recorded by a context.
 * @note message is owned by the context and valid until the next error or sb_clear_error().
 */
typedef struct {
	Sb_Status status;
	sb_str message;
} Sb_Error_Info;

/** @brief Returns true when the FATAL flag is not set. */
SB_API sb_bool sb_error_flags_usable(Sb_Error_Flags flags);

/** @brief Returns true when every flag in `flag` is set in `flags`. */
SB_API sb_bool sb_error_flags_has(Sb_Error_Flags flags, Sb_Error_Flags flag);

/**
 * @brief Writes a readable form such as "non-existent|fatal" into buf.
 * @return buf, always NUL terminated when cap > 0.
 */
SB_API sb_str sb_error_flags_to_str(Sb_Error_Flags flags, char* buf, sb_size cap);

SB_API sb_str sb_status_to_str(Sb_Status status);

#ifdef __cplusplus
}
#endif
