#include "../../include/bridge/call.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/core/log.h"

#include <stdint.h>
#include <string.h>

static Sb_Call sb_call_unbound() {
    Sb_Call call;
    memset(&call, 0, sizeof(call));
    return call;
}

static bool sb_is_callable(lua_State* L, int idx) {
    if (lua_type(L, idx) == LUA_TFUNCTION) return true;
    if (luaL_getmetafield(L, idx, "__call") != LUA_TNIL) {
        lua_pop(L, 1);
        return true;
    }
    return false;
}

// Binds a handle to the callable on top, or pops it and returns an unbound handle.
static Sb_Call sb_call_bind_top(SbBridgeCtx* sctx, const char* what) {
    lua_State* L = sctx->get_raw_state();

    if (!sb_is_callable(L, -1)) {
        SB_LOG_WARN("%s is a %s value, not a function", what, luaL_typename(L, -1));
        lua_pop(L, 1);
        return sb_call_unbound();
    }

    Sb_Call call;
    call.base = lua_gettop(L);
    call.arg_count = 0;
    call.identity = (sb_uint64)(uintptr_t)lua_topointer(L, -1);
    call.generation = sctx->open_scope(call.base, ScopeKind::Call);

    SB_LOG_TRACE("Opened callable %s at slot %d", what, call.base);
    return call;
}

static bool sb_call_usable(SbBridgeCtx* sctx, const Sb_Call* call) {
    if (!call || call->base <= 0) return false;
    if (!sctx->is_scope_open(call->base, call->generation)) {
        SB_LOG_WARN("Stale callable handle (slot %d)", call->base);
        return false;
    }
    return true;
}

SB_API Sb_Call sb_call_open(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!ctx) return sb_call_unbound();

    if (table.slot <= 0 && !key) {
        SB_LOG_WARN("Callable needs a key or a table position");
        return sb_call_unbound();
    }

    auto* sctx = sb_ctx_cast(ctx);
    if (sb_internal_push(sctx, table, key, position) == SB_TYPE_NONE) return sb_call_unbound();
    return sb_call_bind_top(sctx, key ? key : "table element");
}

SB_API Sb_Call sb_call_open_ref(Sb_Ctx ctx, Sb_Ref ref)
{
    if (!ctx) return sb_call_unbound();

    auto* sctx = sb_ctx_cast(ctx);
    if (!sctx->reserve(2)) return sb_call_unbound();
    sctx->get_from_registry(ref);
    return sb_call_bind_top(sctx, "reference");
}

SB_API Sb_Call sb_call_open_top(Sb_Ctx ctx)
{
    if (!ctx) return sb_call_unbound();

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();
    if (lua_gettop(L) == 0 || !sctx->reserve(2)) return sb_call_unbound();

    lua_pushvalue(L, -1);
    return sb_call_bind_top(sctx, "top value");
}

SB_API Sb_Call_State sb_call_state(const Sb_Call* call)
{
    if (!call || call->base <= 0) return SB_CALL_STATE_UNBOUND;
    if (call->arg_count == SB_CALL_INVOKED) return SB_CALL_STATE_INVOKED;
    return SB_CALL_STATE_BOUND;
}

SB_API sb_uint64 sb_call_identity(const Sb_Call* call)
{
    return call ? call->identity : 0;
}

/* --- Arguments --- */

// Validates the handle and makes room before an argument is pushed.
static bool sb_call_begin_arg(SbBridgeCtx* sctx, Sb_Call* call) {
    if (!sb_call_usable(sctx, call)) return false;
    if (!sctx->reserve(1)) return false;
    if (call->arg_count == SB_CALL_INVOKED) call->arg_count = 0;
    return true;
}

SB_API sb_bool sb_call_push_nil(Sb_Ctx ctx, Sb_Call* call)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushnil(sb_ctx_cast(ctx)->get_raw_state());
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_boolean(Sb_Ctx ctx, Sb_Call* call, sb_bool value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushboolean(sb_ctx_cast(ctx)->get_raw_state(), value ? 1 : 0);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_integer(Sb_Ctx ctx, Sb_Call* call, sb_int32 value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushinteger(sb_ctx_cast(ctx)->get_raw_state(), (lua_Integer)value);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_long(Sb_Ctx ctx, Sb_Call* call, sb_int64 value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushinteger(sb_ctx_cast(ctx)->get_raw_state(), (lua_Integer)value);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_number(Sb_Ctx ctx, Sb_Call* call, Sb_Number value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    sb_internal_push_number(sb_ctx_cast(ctx)->get_raw_state(), value);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_double(Sb_Ctx ctx, Sb_Call* call, sb_double value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushnumber(sb_ctx_cast(ctx)->get_raw_state(), (lua_Number)value);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_string(Sb_Ctx ctx, Sb_Call* call, sb_str value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();
    if (value) lua_pushstring(L, value);
    else lua_pushnil(L);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_pointer(Sb_Ctx ctx, Sb_Call* call, sb_ptr value)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    lua_pushlightuserdata(sb_ctx_cast(ctx)->get_raw_state(), value);
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_top(Sb_Ctx ctx, Sb_Call* call)
{
    if (!ctx) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);
    if (!sb_call_usable(sctx, call)) return sb_false;

    int pending = call->arg_count == SB_CALL_INVOKED ? 0 : call->arg_count;
    if (lua_gettop(sctx->get_raw_state()) <= call->base + pending) {
        SB_LOG_WARN("No value above the pending arguments of the callable at slot %d", call->base);
        return sb_false;
    }

    call->arg_count = pending + 1;
    return sb_true;
}

SB_API sb_bool sb_call_push_number_array(Sb_Ctx ctx, Sb_Call* call, Sb_Number_Kind kind,
                                         const void* values, sb_size count)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    if (!sb_internal_push_number_array(sb_ctx_cast(ctx), kind, values, count)) return sb_false;
    call->arg_count++;
    return sb_true;
}

SB_API sb_bool sb_call_push_string_array(Sb_Ctx ctx, Sb_Call* call, const sb_str* values, sb_size count)
{
    if (!ctx || !sb_call_begin_arg(sb_ctx_cast(ctx), call)) return sb_false;
    if (!sb_internal_push_string_array(sb_ctx_cast(ctx), values, count)) return sb_false;
    call->arg_count++;
    return sb_true;
}

/* --- Invocation --- */

static void sb_fill_info(Sb_Error_Info* out_info, Sb_Status status, sb_str message) {
    if (!out_info) return;
    out_info->status = status;
    out_info->message = message;
}

SB_API Sb_Error_Flags sb_call_invoke(Sb_Ctx ctx, Sb_Call* call, sb_int n_results,
                                     Sb_Error_Info* out_info, sb_int* out_results)
{
    if (out_results) *out_results = 0;
    if (!ctx) {
        sb_fill_info(out_info, SB_STATUS_ERR_INVALID, "No context");
        return SB_ERROR_FATAL;
    }

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    if (!sb_call_usable(sctx, call)) {
        sctx->set_internal_error(SB_STATUS_ERR_INVALID, "Invoking an unbound or stale callable");
        sb_fill_info(out_info, SB_STATUS_ERR_INVALID, sctx->get_error_info().message);
        return SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL;
    }

    int n_args = call->arg_count == SB_CALL_INVOKED ? 0 : call->arg_count;
    int first_arg = lua_gettop(L) - n_args + 1;
    if (first_arg <= call->base) {
        sctx->set_internal_error(SB_STATUS_ERR_INVALID, "Pending arguments were removed from the stack");
        sb_fill_info(out_info, SB_STATUS_ERR_INVALID, sctx->get_error_info().message);
        call->arg_count = SB_CALL_INVOKED;
        return SB_ERROR_FATAL;
    }

    // handler and function copy, plus room for fixed result counts
    if (!sctx->reserve(2 + (n_results > 0 ? n_results : 0))) {
        sb_fill_info(out_info, SB_STATUS_ERR_MEMORY, sctx->get_error_info().message);
        return SB_ERROR_FATAL;
    }

    // [handler, function copy] go right below the arguments
    lua_pushcfunction(L, sb_message_handler);
    lua_pushvalue(L, call->base);
    lua_rotate(L, first_arg, 2);
    int handler_idx = first_arg;

    SB_LOG_TRACE("Invoking callable %llx with %d argument(s)",
                 (unsigned long long)call->identity, n_args);

    int wanted = n_results < 0 ? LUA_MULTRET : n_results;
    Sb_Status status = sb_status_from_lua(lua_pcall(L, n_args, wanted, handler_idx));
    call->arg_count = SB_CALL_INVOKED;

    if (status != SB_STATUS_OK) {
        const char* err = lua_tostring(L, -1);
        sctx->set_internal_error(status, err ? err : "Runtime Error");
        lua_pop(L, 2);
        sb_fill_info(out_info, status, sctx->get_error_info().message);
        return SB_ERROR_FATAL;
    }

    lua_remove(L, handler_idx);
    if (out_results) *out_results = lua_gettop(L) - handler_idx + 1;

    sb_fill_info(out_info, SB_STATUS_OK, nullptr);
    return SB_ERROR_NONE;
}

SB_API sb_bool sb_call_close(Sb_Ctx ctx, Sb_Call* call)
{
    if (!ctx || !call || call->base <= 0) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);

    switch (sctx->close_scope(call->base, call->generation)) {
    case ScopeCheck::Stale:
        SB_LOG_ERROR("Closing a stale callable handle (slot %d)", call->base);
        return sb_false;
    case ScopeCheck::OutOfOrder:
        SB_LOG_ERROR("Callable at slot %d closed before a handle opened after it", call->base);
        return sb_false;
    case ScopeCheck::Ok:
        break;
    }

    lua_settop(sctx->get_raw_state(), call->base - 1);
    SB_LOG_TRACE("Closed callable at slot %d", call->base);
    *call = sb_call_unbound();
    return sb_true;
}
