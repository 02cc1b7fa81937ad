#include "../../include/bridge/accessors.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/core/log.h"

#include <string.h>

// Nothing to resolve: the getter works on the current top.
static bool sb_is_top_source(Sb_Table table, sb_str key, sb_int position) {
    return table.slot <= 0 && !key && position == SB_NO_POS;
}

static Sb_Number sb_read_element(Sb_Number_Kind kind, const void* values, sb_size i) {
    Sb_Number num;
    memset(&num, 0, sizeof(num));
    num.kind = kind;

    const char* base = static_cast<const char*>(values) + i * sb_number_kind_size(kind);
    switch (kind) {
    case SB_NUM_INT32: memcpy(&num.as.i32, base, sizeof(sb_int32)); break;
    case SB_NUM_INT64: memcpy(&num.as.i64, base, sizeof(sb_int64)); break;
    case SB_NUM_FLOAT: memcpy(&num.as.f32, base, sizeof(sb_float)); break;
    case SB_NUM_DOUBLE: memcpy(&num.as.f64, base, sizeof(sb_double)); break;
    case SB_NUM_LONG_DOUBLE: memcpy(&num.as.f80, base, sizeof(sb_long_double)); break;
    }
    return num;
}

static void sb_write_element(const Sb_Number& num, void* out, sb_size i) {
    char* base = static_cast<char*>(out) + i * sb_number_kind_size(num.kind);
    switch (num.kind) {
    case SB_NUM_INT32: memcpy(base, &num.as.i32, sizeof(sb_int32)); break;
    case SB_NUM_INT64: memcpy(base, &num.as.i64, sizeof(sb_int64)); break;
    case SB_NUM_FLOAT: memcpy(base, &num.as.f32, sizeof(sb_float)); break;
    case SB_NUM_DOUBLE: memcpy(base, &num.as.f64, sizeof(sb_double)); break;
    case SB_NUM_LONG_DOUBLE: memcpy(base, &num.as.f80, sizeof(sb_long_double)); break;
    }
}

void sb_internal_push_number(lua_State* L, const Sb_Number& value) {
    switch (value.kind) {
    case SB_NUM_INT32: lua_pushinteger(L, (lua_Integer)value.as.i32); break;
    case SB_NUM_INT64: lua_pushinteger(L, (lua_Integer)value.as.i64); break;
    case SB_NUM_FLOAT: lua_pushnumber(L, (lua_Number)value.as.f32); break;
    case SB_NUM_DOUBLE: lua_pushnumber(L, (lua_Number)value.as.f64); break;
    case SB_NUM_LONG_DOUBLE: lua_pushnumber(L, (lua_Number)value.as.f80); break;
    }
}

// Builds the sequence under its own handle; the handle is released without
// truncating so the finished table stays on top.
static Sb_Table sb_begin_array(SbBridgeCtx* sctx, sb_size count) {
    lua_State* L = sctx->get_raw_state();
    if (!sctx->reserve(2)) return SB_NULL_TABLE;
    lua_createtable(L, (int)count, 0);

    Sb_Table array;
    array.slot = lua_gettop(L);
    array.generation = sctx->open_scope(array.slot, ScopeKind::Table);
    return array;
}

static void sb_end_array(SbBridgeCtx* sctx, Sb_Table array) {
    if (sctx->close_scope(array.slot, array.generation) != ScopeCheck::Ok) {
        SB_LOG_ERROR("Array builder handle at slot %d was disturbed", array.slot);
    }
}

bool sb_internal_push_number_array(SbBridgeCtx* sctx, Sb_Number_Kind kind, const void* values, sb_size count) {
    if (!values) count = 0;
    lua_State* L = sctx->get_raw_state();

    Sb_Table array = sb_begin_array(sctx, count);
    if (sb_table_is_null(array)) return false;
    for (sb_size i = 0; i < count; ++i) {
        sb_internal_push_number(L, sb_read_element(kind, values, i));
        sb_internal_store_top(sctx, array, nullptr, (sb_int)(i + 1));
    }
    sb_end_array(sctx, array);
    return true;
}

bool sb_internal_push_string_array(SbBridgeCtx* sctx, const sb_str* values, sb_size count) {
    if (!values) count = 0;
    lua_State* L = sctx->get_raw_state();

    Sb_Table array = sb_begin_array(sctx, count);
    if (sb_table_is_null(array)) return false;
    for (sb_size i = 0; i < count; ++i) {
        if (values[i]) lua_pushstring(L, values[i]);
        else lua_pushnil(L);
        sb_internal_store_top(sctx, array, nullptr, (sb_int)(i + 1));
    }
    sb_end_array(sctx, array);
    return true;
}

/* --- Getters --- */

// Pushes the value a getter reads. A missing context is left to the extractor.
static bool sb_push_source(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position) {
    if (!ctx) return true;
    Sb_Type type = sb_internal_push(sb_ctx_cast(ctx), table, key, position);
    return type != SB_TYPE_NONE || sb_is_top_source(table, key, position);
}

SB_API Sb_Error_Flags sb_get_number(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    Sb_Number_Kind kind, const Sb_Number* def, Sb_Number* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_number(ctx, kind, def, out);
}

SB_API Sb_Error_Flags sb_get_boolean(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_bool* def, sb_bool* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_boolean(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_integer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_int32* def, sb_int32* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_integer(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_long(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                  const sb_int64* def, sb_int64* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_long(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_float(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   const sb_float* def, sb_float* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_float(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    const sb_double* def, sb_double* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_double(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_long_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                         const sb_long_double* def, sb_long_double* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_long_double(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_pointer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                     const sb_ptr* def, sb_ptr* out)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_pointer(ctx, def, out);
}

SB_API Sb_Error_Flags sb_get_string(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                    sb_str def, char* buf, sb_size cap, sb_size* out_len)
{
    if (!sb_push_source(ctx, table, key, position)) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    return sb_extract_string(ctx, def, buf, cap, out_len);
}

SB_API sb_bool sb_exists(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!ctx) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);
    Sb_Type type = sb_internal_push(sctx, table, key, position);
    if (type != SB_TYPE_NONE && !sb_is_top_source(table, key, position)) {
        lua_pop(sctx->get_raw_state(), 1);
    }
    return (type != SB_TYPE_NIL && type != SB_TYPE_NONE) ? sb_true : sb_false;
}

/* --- Setters --- */

static bool sb_begin_set(Sb_Ctx ctx) {
    return ctx && sb_ctx_cast(ctx)->reserve(1);
}

static sb_bool sb_store(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position) {
    if (!sb_internal_store_top(sb_ctx_cast(ctx), table, key, position)) {
        SB_LOG_WARN("Could not store value (slot %d, key %s, position %d)",
                    table.slot, key ? key : "none", position);
        return sb_false;
    }
    return sb_true;
}

SB_API sb_bool sb_set_nil(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushnil(sb_ctx_cast(ctx)->get_raw_state());
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_number(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, Sb_Number value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    sb_internal_push_number(sb_ctx_cast(ctx)->get_raw_state(), value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_boolean(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_bool value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushboolean(sb_ctx_cast(ctx)->get_raw_state(), value ? 1 : 0);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_integer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_int32 value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushinteger(sb_ctx_cast(ctx)->get_raw_state(), (lua_Integer)value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_long(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_int64 value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushinteger(sb_ctx_cast(ctx)->get_raw_state(), (lua_Integer)value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_float(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_float value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushnumber(sb_ctx_cast(ctx)->get_raw_state(), (lua_Number)value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_double value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushnumber(sb_ctx_cast(ctx)->get_raw_state(), (lua_Number)value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_long_double(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_long_double value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushnumber(sb_ctx_cast(ctx)->get_raw_state(), (lua_Number)value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_pointer(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_ptr value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_pushlightuserdata(sb_ctx_cast(ctx)->get_raw_state(), value);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_string(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position, sb_str value)
{
    if (!sb_begin_set(ctx)) return sb_false;
    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();
    if (value) lua_pushstring(L, value);
    else lua_pushnil(L);
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_from_top(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!ctx) return sb_false;
    if (lua_gettop(sb_ctx_cast(ctx)->get_raw_state()) == 0) {
        SB_LOG_WARN("Nothing on the stack to store");
        return sb_false;
    }
    return sb_store(ctx, table, key, position);
}

/* --- 1-D arrays --- */

SB_API sb_no_ret sb_push_number_array(Sb_Ctx ctx, Sb_Number_Kind kind, const void* values, sb_size count)
{
    if (!ctx) return;
    sb_internal_push_number_array(sb_ctx_cast(ctx), kind, values, count);
}

SB_API sb_no_ret sb_push_string_array(Sb_Ctx ctx, const sb_str* values, sb_size count)
{
    if (!ctx) return;
    sb_internal_push_string_array(sb_ctx_cast(ctx), values, count);
}

SB_API sb_bool sb_set_number_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   Sb_Number_Kind kind, const void* values, sb_size count)
{
    if (!ctx || !sb_internal_push_number_array(sb_ctx_cast(ctx), kind, values, count)) return sb_false;
    return sb_store(ctx, table, key, position);
}

SB_API sb_bool sb_set_string_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                   const sb_str* values, sb_size count)
{
    if (!ctx || !sb_internal_push_string_array(sb_ctx_cast(ctx), values, count)) return sb_false;
    return sb_store(ctx, table, key, position);
}

SB_API Sb_Error_Flags sb_get_number_array(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position,
                                          Sb_Number_Kind kind, const Sb_Number* def,
                                          void* out, sb_size capacity, sb_size* out_count)
{
    if (out_count) *out_count = 0;
    if (!ctx) return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    bool from_top = sb_is_top_source(table, key, position);
    Sb_Type type = sb_internal_push(sctx, table, key, position);
    if (type != SB_TYPE_TABLE) {
        Sb_Error_Flags flags = (type == SB_TYPE_NIL || type == SB_TYPE_NONE)
            ? SB_ERROR_NON_EXISTENT : SB_ERROR_WRONG_TYPE;
        if (!def) flags |= SB_ERROR_FATAL;
        if ((type != SB_TYPE_NONE || from_top) && lua_gettop(L) > 0) lua_pop(L, 1);
        return flags;
    }

    SB_STACK_CHECK_START(L);

    const int source = lua_gettop(L);
    sb_size length = (sb_size)lua_rawlen(L, source);
    sb_size count = length < capacity ? length : capacity;
    if (!out) count = 0;

    Sb_Error_Flags first_error = SB_ERROR_NONE;
    for (sb_size i = 0; i < count; ++i) {
        lua_rawgeti(L, source, (lua_Integer)(i + 1));

        Sb_Number element;
        Sb_Error_Flags flags = sb_extract_number(ctx, kind, def, &element);
        if (flags != SB_ERROR_NONE && first_error == SB_ERROR_NONE) {
            first_error = flags;
        }
        sb_write_element(element, out, i);
    }

    SB_STACK_CHECK(L, 0);

    lua_pop(L, 1);
    if (out_count) *out_count = count;
    return first_error;
}
