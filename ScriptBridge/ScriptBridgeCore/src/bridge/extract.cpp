#include "../../include/bridge/extract.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/core/log.h"

#include <string.h>
#include <cmath>
#include <limits>

// Classifies the top slot against the expected engine type.
static Sb_Error_Flags sb_classify_top(lua_State* L, int expected) {
    int type = lua_type(L, -1);
    if (type == LUA_TNONE || type == LUA_TNIL) return SB_ERROR_NON_EXISTENT;
    if (type != expected) return SB_ERROR_WRONG_TYPE;
    return SB_ERROR_NONE;
}

static void sb_pop_extracted(lua_State* L) {
    if (lua_gettop(L) > 0) lua_pop(L, 1);
}

template<typename T>
static bool sb_fits(lua_Integer value) {
    return value >= (lua_Integer)std::numeric_limits<T>::min() &&
           value <= (lua_Integer)std::numeric_limits<T>::max();
}

// The upper bound is exclusive: max() rounds up to a power of two as a float,
// while -min() is that power exactly.
template<typename T>
static bool sb_fits(lua_Number value) {
    return !std::isnan(value) &&
           value >= (lua_Number)std::numeric_limits<T>::min() &&
           value < -(lua_Number)std::numeric_limits<T>::min();
}

// Converts the number on top into `kind`. Integral kinds truncate floats; values
// that do not fit the kind are reported as a type mismatch.
static bool sb_convert_top(lua_State* L, Sb_Number_Kind kind, Sb_Number* out) {
    int is_int = lua_isinteger(L, -1);
    lua_Integer i = is_int ? lua_tointeger(L, -1) : 0;
    lua_Number n = lua_tonumber(L, -1);

    switch (kind) {
    case SB_NUM_INT32:
        if (is_int ? !sb_fits<sb_int32>(i) : !sb_fits<sb_int32>(n)) return false;
        out->as.i32 = is_int ? (sb_int32)i : (sb_int32)n;
        return true;
    case SB_NUM_INT64:
        if (!is_int && !sb_fits<sb_int64>(n)) return false;
        out->as.i64 = is_int ? (sb_int64)i : (sb_int64)n;
        return true;
    case SB_NUM_FLOAT:
        out->as.f32 = is_int ? (sb_float)i : (sb_float)n;
        return true;
    case SB_NUM_DOUBLE:
        out->as.f64 = is_int ? (sb_double)i : (sb_double)n;
        return true;
    case SB_NUM_LONG_DOUBLE:
        out->as.f80 = is_int ? (sb_long_double)i : (sb_long_double)n;
        return true;
    }
    return false;
}

static void sb_copy_as_kind(const Sb_Number* def, Sb_Number_Kind kind, Sb_Number* out) {
    switch (kind) {
    case SB_NUM_INT32: out->as.i32 = def->as.i32; break;
    case SB_NUM_INT64: out->as.i64 = def->as.i64; break;
    case SB_NUM_FLOAT: out->as.f32 = def->as.f32; break;
    case SB_NUM_DOUBLE: out->as.f64 = def->as.f64; break;
    case SB_NUM_LONG_DOUBLE: out->as.f80 = def->as.f80; break;
    }
}

static Sb_Number sb_number_zero(Sb_Number_Kind kind) {
    Sb_Number num;
    memset(&num, 0, sizeof(num));
    num.kind = kind;
    return num;
}

SB_API Sb_Number sb_number_make(Sb_Number_Kind kind, sb_double value)
{
    Sb_Number num = sb_number_zero(kind);
    switch (kind) {
    case SB_NUM_INT32: num.as.i32 = (sb_int32)value; break;
    case SB_NUM_INT64: num.as.i64 = (sb_int64)value; break;
    case SB_NUM_FLOAT: num.as.f32 = (sb_float)value; break;
    case SB_NUM_DOUBLE: num.as.f64 = value; break;
    case SB_NUM_LONG_DOUBLE: num.as.f80 = (sb_long_double)value; break;
    }
    return num;
}

SB_API sb_size sb_number_kind_size(Sb_Number_Kind kind)
{
    switch (kind) {
    case SB_NUM_INT32: return sizeof(sb_int32);
    case SB_NUM_INT64: return sizeof(sb_int64);
    case SB_NUM_FLOAT: return sizeof(sb_float);
    case SB_NUM_DOUBLE: return sizeof(sb_double);
    case SB_NUM_LONG_DOUBLE: return sizeof(sb_long_double);
    }
    return 0;
}

SB_API sb_str sb_number_kind_name(Sb_Number_Kind kind)
{
    switch (kind) {
    case SB_NUM_INT32: return "int32";
    case SB_NUM_INT64: return "int64";
    case SB_NUM_FLOAT: return "float";
    case SB_NUM_DOUBLE: return "double";
    case SB_NUM_LONG_DOUBLE: return "long double";
    }
    return "unknown";
}

SB_API Sb_Error_Flags sb_extract_number(Sb_Ctx ctx, Sb_Number_Kind kind, const Sb_Number* def, Sb_Number* out)
{
    Sb_Number result = sb_number_zero(kind);
    if (!ctx) {
        if (out) *out = result;
        return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    }

    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();

    Sb_Error_Flags flags = sb_classify_top(L, LUA_TNUMBER);
    if (flags == SB_ERROR_NONE && !sb_convert_top(L, kind, &result)) {
        flags = SB_ERROR_WRONG_TYPE;
    }

    if (flags != SB_ERROR_NONE) {
        result = sb_number_zero(kind);
        if (def) sb_copy_as_kind(def, kind, &result);
        else flags |= SB_ERROR_FATAL;
    }

    sb_pop_extracted(L);
    if (out) *out = result;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_integer(Sb_Ctx ctx, const sb_int32* def, sb_int32* out)
{
    Sb_Number d = sb_number_zero(SB_NUM_INT32), r;
    if (def) d.as.i32 = *def;
    Sb_Error_Flags flags = sb_extract_number(ctx, SB_NUM_INT32, def ? &d : NULL, &r);
    if (out) *out = r.as.i32;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_long(Sb_Ctx ctx, const sb_int64* def, sb_int64* out)
{
    Sb_Number d = sb_number_zero(SB_NUM_INT64), r;
    if (def) d.as.i64 = *def;
    Sb_Error_Flags flags = sb_extract_number(ctx, SB_NUM_INT64, def ? &d : NULL, &r);
    if (out) *out = r.as.i64;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_float(Sb_Ctx ctx, const sb_float* def, sb_float* out)
{
    Sb_Number d = sb_number_zero(SB_NUM_FLOAT), r;
    if (def) d.as.f32 = *def;
    Sb_Error_Flags flags = sb_extract_number(ctx, SB_NUM_FLOAT, def ? &d : NULL, &r);
    if (out) *out = r.as.f32;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_double(Sb_Ctx ctx, const sb_double* def, sb_double* out)
{
    Sb_Number d = sb_number_zero(SB_NUM_DOUBLE), r;
    if (def) d.as.f64 = *def;
    Sb_Error_Flags flags = sb_extract_number(ctx, SB_NUM_DOUBLE, def ? &d : NULL, &r);
    if (out) *out = r.as.f64;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_long_double(Sb_Ctx ctx, const sb_long_double* def, sb_long_double* out)
{
    Sb_Number d = sb_number_zero(SB_NUM_LONG_DOUBLE), r;
    if (def) d.as.f80 = *def;
    Sb_Error_Flags flags = sb_extract_number(ctx, SB_NUM_LONG_DOUBLE, def ? &d : NULL, &r);
    if (out) *out = r.as.f80;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_boolean(Sb_Ctx ctx, const sb_bool* def, sb_bool* out)
{
    sb_bool result = sb_false;
    if (!ctx) {
        if (out) *out = result;
        return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    }

    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();

    Sb_Error_Flags flags = sb_classify_top(L, LUA_TBOOLEAN);
    if (flags == SB_ERROR_NONE) {
        result = lua_toboolean(L, -1) ? sb_true : sb_false;
    }
    else if (def) {
        result = *def;
    }
    else {
        flags |= SB_ERROR_FATAL;
    }

    sb_pop_extracted(L);
    if (out) *out = result;
    return flags;
}

SB_API Sb_Error_Flags sb_extract_pointer(Sb_Ctx ctx, const sb_ptr* def, sb_ptr* out)
{
    sb_ptr result = nullptr;
    if (!ctx) {
        if (out) *out = result;
        return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    }

    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();

    Sb_Error_Flags flags = sb_classify_top(L, LUA_TLIGHTUSERDATA);
    if (flags == SB_ERROR_NONE) {
        result = lua_touserdata(L, -1);
    }
    else if (def) {
        result = *def;
    }
    else {
        flags |= SB_ERROR_FATAL;
    }

    sb_pop_extracted(L);
    if (out) *out = result;
    return flags;
}

static sb_size sb_copy_truncated(const char* src, sb_size len, char* buf, sb_size cap) {
    if (!buf || cap == 0) return 0;
    sb_size n = len < cap - 1 ? len : cap - 1;
    if (n > 0) memcpy(buf, src, n);
    buf[n] = '\0';
    return n;
}

SB_API Sb_Error_Flags sb_extract_string(Sb_Ctx ctx, sb_str def, char* buf, sb_size cap, sb_size* out_len)
{
    sb_size written = 0;
    if (!ctx) {
        written = sb_copy_truncated("", 0, buf, cap);
        if (out_len) *out_len = written;
        return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    }

    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();

    Sb_Error_Flags flags = sb_classify_top(L, LUA_TSTRING);
    if (flags == SB_ERROR_NONE) {
        size_t len = 0;
        const char* str = lua_tolstring(L, -1, &len);
        if (len >= cap && cap > 0) {
            SB_LOG_TRACE("String of %zu bytes truncated to %zu", len, cap - 1);
        }
        written = sb_copy_truncated(str, len, buf, cap);
    }
    else if (def) {
        written = sb_copy_truncated(def, strlen(def), buf, cap);
    }
    else {
        flags |= SB_ERROR_FATAL;
        written = sb_copy_truncated("", 0, buf, cap);
    }

    sb_pop_extracted(L);
    if (out_len) *out_len = written;
    return flags;
}

SB_API sb_size sb_top_string_length(Sb_Ctx ctx)
{
    if (!ctx) return 0;
    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();
    if (lua_type(L, -1) != LUA_TSTRING) return 0;
    return (sb_size)lua_rawlen(L, -1);
}
