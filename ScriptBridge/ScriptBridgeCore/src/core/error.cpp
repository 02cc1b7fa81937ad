#include "../../include/core/error.h"

#include <string.h>
#include <string>

sb_bool sb_error_flags_usable(Sb_Error_Flags flags) {
	return (flags & SB_ERROR_FATAL) ? sb_false : sb_true;
}

sb_bool sb_error_flags_has(Sb_Error_Flags flags, Sb_Error_Flags flag) {
	return (flag != SB_ERROR_NONE && (flags & flag) == flag) ? sb_true : sb_false;
}

sb_str sb_error_flags_to_str(Sb_Error_Flags flags, char* buf, sb_size cap) {
	if (!buf || cap == 0) return buf;

	std::string out;
	if (flags & SB_ERROR_NON_EXISTENT) out += "non-existent";
	if (flags & SB_ERROR_WRONG_TYPE) {
		if (!out.empty()) out += '|';
		out += "wrong-type";
	}
	if (flags & SB_ERROR_FATAL) {
		if (!out.empty()) out += '|';
		out += "fatal";
	}
	if (out.empty()) out = "none";

	sb_size len = out.size() < cap - 1 ? out.size() : cap - 1;
	memcpy(buf, out.data(), len);
	buf[len] = '\0';
	return buf;
}

sb_str sb_status_to_str(Sb_Status status) {
	switch (status) {
	case SB_STATUS_OK: return "ok";
	case SB_STATUS_YIELD: return "yield";
	case SB_STATUS_ERR_RUNTIME: return "runtime error";
	case SB_STATUS_ERR_SYNTAX: return "syntax error";
	case SB_STATUS_ERR_MEMORY: return "memory error";
	case SB_STATUS_ERR_HANDLER: return "error in message handler";
	case SB_STATUS_ERR_FILE: return "file error";
	case SB_STATUS_ERR_INVALID: return "invalid request";
	}
	return "unknown status";
}
