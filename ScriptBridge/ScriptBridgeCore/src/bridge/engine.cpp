#include "../../include/bridge/engine.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/config/config.h"
#include "../../include/core/log.h"

#include <stdlib.h>
#include <string.h>
#include <string>

static void* sb_lua_alloc(void* ud, void* ptr, size_t osize, size_t nsize);

static Sb_Ctx sb_make_ctx(sb_bool open_libs) {
    auto* sctx = new SbBridgeCtx(nullptr);

    lua_State* state = lua_newstate(sb_lua_alloc, sctx);
    if (!state) {
        SB_LOG_CRITICAL("Could not create the interpreter state");
        delete sctx;
        return nullptr;
    }
    sctx->set_raw_state(state);

    if (open_libs) {
        luaL_openlibs(state);
    }

    SB_LOG_DEBUG("Context %p created", (void*)sctx);
    return static_cast<Sb_Ctx>(sctx);
}

Sb_Ctx sb_create_ctx() {
    return sb_make_ctx(sb_true);
}

Sb_Ctx sb_create_ctx_with_config(const Sb_Config* config) {
    if (!config) return sb_create_ctx();

    Sb_Ctx ctx = sb_make_ctx(config->open_libs);
    if (ctx) sb_config_apply(ctx, config);
    return ctx;
}

SB_API sb_no_ret sb_destroy_ctx(Sb_Ctx ctx)
{
    if (!ctx) return;
    SB_LOG_DEBUG("Context %p destroyed", ctx);
    delete sb_ctx_cast(ctx);
}

static void* sb_lua_alloc(void* ud, void* ptr, size_t osize, size_t nsize) {
    auto* sctx = static_cast<SbBridgeCtx*>(ud);
    // osize holds a type tag, not a size, when ptr is NULL
    size_t old_size = ptr ? osize : 0;

    if (nsize == 0) {
        free(ptr);
        if (sctx) sctx->track_alloc(old_size, 0);
        return nullptr;
    }

    void* block = realloc(ptr, nsize);
    if (block && sctx) sctx->track_alloc(old_size, nsize);
    return block;
}

Sb_Status sb_status_from_lua(int code) {
    switch (code) {
    case LUA_OK: return SB_STATUS_OK;
    case LUA_YIELD: return SB_STATUS_YIELD;
    case LUA_ERRRUN: return SB_STATUS_ERR_RUNTIME;
    case LUA_ERRSYNTAX: return SB_STATUS_ERR_SYNTAX;
    case LUA_ERRMEM: return SB_STATUS_ERR_MEMORY;
    case LUA_ERRERR: return SB_STATUS_ERR_HANDLER;
    case LUA_ERRFILE: return SB_STATUS_ERR_FILE;
    }
    return SB_STATUS_ERR_RUNTIME;
}

int sb_message_handler(lua_State* L) {
    const char* msg = lua_tostring(L, 1);
    if (msg == NULL) {
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING) {
            return 1;
        }
        else {
            msg = lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
        }
    }

    luaL_traceback(L, L, msg, 1);

    const char* full_trace = lua_tostring(L, -1);
    SB_LOG_ERROR("[SCRIPT EXCEPTION] %s", full_trace);

    return 1;
}

/* --- Script loading --- */

static Sb_Status sb_finish_load(SbBridgeCtx* sctx, int code, const char* fallback) {
    lua_State* L = sctx->get_raw_state();
    Sb_Status status = sb_status_from_lua(code);
    if (status != SB_STATUS_OK) {
        const char* err = lua_tostring(L, -1);
        sctx->set_internal_error(status, err ? err : fallback);
        SB_LOG_ERROR("%s: %s", fallback, err ? err : "(no message)");
        lua_pop(L, 1);
    }
    return status;
}

SB_API Sb_Status sb_load_string(Sb_Ctx ctx, sb_str code)
{
    if (!ctx || !code) return SB_STATUS_ERR_INVALID;
    auto* sctx = sb_ctx_cast(ctx);
    if (!sctx->reserve(2)) return SB_STATUS_ERR_MEMORY;
    return sb_finish_load(sctx, luaL_loadstring(sctx->get_raw_state(), code), "Failed to load string");
}

SB_API Sb_Status sb_load_file(Sb_Ctx ctx, sb_str file_path)
{
    if (!ctx || !file_path) return SB_STATUS_ERR_INVALID;
    auto* sctx = sb_ctx_cast(ctx);
    if (!sctx->reserve(2)) return SB_STATUS_ERR_MEMORY;
    return sb_finish_load(sctx, luaL_loadfile(sctx->get_raw_state(), file_path), "Failed to load file");
}

static Sb_Status sb_run_loaded(SbBridgeCtx* sctx, Sb_Status load_status) {
    if (load_status != SB_STATUS_OK) return load_status;

    lua_State* L = sctx->get_raw_state();

    lua_pushcfunction(L, sb_message_handler);
    lua_insert(L, -2);
    int err_func_idx = lua_gettop(L) - 1;

    Sb_Status status = sb_status_from_lua(lua_pcall(L, 0, 0, err_func_idx));
    if (status != SB_STATUS_OK) {
        const char* err = lua_tostring(L, -1);
        sctx->set_internal_error(status, err ? err : "Runtime Error");
        lua_pop(L, 2);
        return status;
    }

    lua_pop(L, 1);
    return SB_STATUS_OK;
}

SB_API Sb_Status sb_do_string(Sb_Ctx ctx, sb_str code)
{
    if (!ctx || !code) return SB_STATUS_ERR_INVALID;
    auto* sctx = sb_ctx_cast(ctx);
    SB_STACK_CHECK_START(sctx->get_raw_state());

    Sb_Status status = sb_run_loaded(sctx, sb_load_string(ctx, code));

    SB_STACK_CHECK(sctx->get_raw_state(), 0);
    return status;
}

SB_API Sb_Status sb_do_file(Sb_Ctx ctx, sb_str file_path)
{
    if (!ctx || !file_path) return SB_STATUS_ERR_INVALID;
    auto* sctx = sb_ctx_cast(ctx);
    SB_STACK_CHECK_START(sctx->get_raw_state());

    Sb_Status status = sb_run_loaded(sctx, sb_load_file(ctx, file_path));

    SB_STACK_CHECK(sctx->get_raw_state(), 0);
    return status;
}

/* --- Errors --- */

SB_API Sb_Status sb_get_last_error(Sb_Ctx ctx)
{
    if (!ctx) return SB_STATUS_ERR_INVALID;
    return sb_ctx_cast(ctx)->get_error_info().status;
}

SB_API sb_str sb_get_last_error_str(Sb_Ctx ctx)
{
    if (!ctx) return NULL;
    return sb_ctx_cast(ctx)->get_error_info().message;
}

SB_API Sb_Error_Info sb_get_last_error_info(Sb_Ctx ctx)
{
    if (!ctx) {
        Sb_Error_Info info;
        info.status = SB_STATUS_ERR_INVALID;
        info.message = "Sb_Ctx was not created!";
        return info;
    }
    return sb_ctx_cast(ctx)->get_error_info();
}

SB_API sb_no_ret sb_clear_error(Sb_Ctx ctx)
{
    if (!ctx) return;
    sb_ctx_cast(ctx)->clear_error();
}

SB_API sb_bool sb_check(Sb_Ctx ctx, Sb_Status status, sb_str context, Sb_Status* out_status, sb_str* out_msg)
{
    if (status == SB_STATUS_OK) return sb_true;

    // The last error only describes this status if the failure recorded it
    sb_str engine_msg = (ctx && sb_get_last_error(ctx) == status) ? sb_get_last_error_str(ctx) : NULL;
    if (!engine_msg) engine_msg = sb_status_to_str(status);

    if (out_status) *out_status = status;
    if (out_msg) *out_msg = engine_msg;

    if (!out_status && !out_msg) {
        SB_LOG_CRITICAL("%s: %s", context ? context : "Unrecoverable script error", engine_msg);
        exit(EXIT_FAILURE);
    }

    return sb_false;
}

/* --- Stack primitives --- */

SB_API sb_stack_idx sb_stack_size(Sb_Ctx ctx)
{
    if (!ctx) return 0;
    return lua_gettop(sb_ctx_cast(ctx)->get_raw_state());
}

SB_API sb_no_ret sb_stack_set_size(Sb_Ctx ctx, sb_stack_idx size)
{
    if (!ctx || size < 0) return;
    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();
    int grow = size - lua_gettop(L);
    if (grow > 0 && !sctx->reserve(grow)) return;
    lua_settop(L, size);
}

SB_API sb_no_ret sb_pop(Sb_Ctx ctx, sb_int n)
{
    if (!ctx || n <= 0) return;
    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();
    int top = lua_gettop(L);
    lua_pop(L, n > top ? top : n);
}

SB_API Sb_Type sb_stack_type(Sb_Ctx ctx, sb_stack_idx i)
{
    if (!ctx) return SB_TYPE_NONE;
    return static_cast<Sb_Type>(lua_type(sb_ctx_cast(ctx)->get_raw_state(), i));
}

SB_API sb_str sb_type_name(Sb_Type type)
{
    switch (type) {
    case SB_TYPE_NONE: return "none";
    case SB_TYPE_NIL: return "nil";
    case SB_TYPE_BOOLEAN: return "boolean";
    case SB_TYPE_LIGHTUSERDATA: return "lightuserdata";
    case SB_TYPE_NUMBER: return "number";
    case SB_TYPE_STRING: return "string";
    case SB_TYPE_TABLE: return "table";
    case SB_TYPE_FUNCTION: return "function";
    case SB_TYPE_USERDATA: return "userdata";
    case SB_TYPE_THREAD: return "thread";
    }
    return "unknown";
}

SB_API sb_no_ret sb_stack_dump(Sb_Ctx ctx)
{
    if (!ctx) return;
    lua_State* L = sb_ctx_cast(ctx)->get_raw_state();

    int top = lua_gettop(L);
    SB_LOG_TRACE("=== STACK (size=%d) ===", top);

    for (int i = 1; i <= top; i++) {
        switch (lua_type(L, i)) {
        case LUA_TNUMBER:
            SB_LOG_TRACE("[%d] number: %g", i, (double)lua_tonumber(L, i));
            break;
        case LUA_TSTRING:
            SB_LOG_TRACE("[%d] string: %s", i, lua_tostring(L, i));
            break;
        case LUA_TBOOLEAN:
            SB_LOG_TRACE("[%d] boolean: %s", i, lua_toboolean(L, i) ? "true" : "false");
            break;
        case LUA_TNIL:
            SB_LOG_TRACE("[%d] nil", i);
            break;
        default:
            SB_LOG_TRACE("[%d] %s: %p", i, lua_typename(L, lua_type(L, i)), lua_topointer(L, i));
            break;
        }
    }

    SB_LOG_TRACE("======================");
}

// The state to push onto, or NULL when the stack cannot grow.
static lua_State* sb_push_target(Sb_Ctx ctx) {
    if (!ctx) return NULL;
    auto* sctx = sb_ctx_cast(ctx);
    return sctx->reserve(1) ? sctx->get_raw_state() : NULL;
}

SB_API sb_no_ret sb_push_nil(Sb_Ctx ctx)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushnil(L);
}

SB_API sb_no_ret sb_push_boolean(Sb_Ctx ctx, sb_bool val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushboolean(L, val ? 1 : 0);
}

SB_API sb_no_ret sb_push_integer(Sb_Ctx ctx, sb_int32 val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushinteger(L, (lua_Integer)val);
}

SB_API sb_no_ret sb_push_long(Sb_Ctx ctx, sb_int64 val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushinteger(L, (lua_Integer)val);
}

SB_API sb_no_ret sb_push_float(Sb_Ctx ctx, sb_float val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushnumber(L, (lua_Number)val);
}

SB_API sb_no_ret sb_push_double(Sb_Ctx ctx, sb_double val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushnumber(L, (lua_Number)val);
}

SB_API sb_no_ret sb_push_long_double(Sb_Ctx ctx, sb_long_double val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushnumber(L, (lua_Number)val);
}

SB_API sb_no_ret sb_push_string(Sb_Ctx ctx, sb_str val)
{
    lua_State* L = sb_push_target(ctx);
    if (!L) return;
    if (val) lua_pushstring(L, val);
    else lua_pushnil(L);
}

SB_API sb_no_ret sb_push_lstring(Sb_Ctx ctx, sb_str val, sb_size len)
{
    lua_State* L = sb_push_target(ctx);
    if (!L) return;
    if (val) lua_pushlstring(L, val, len);
    else lua_pushnil(L);
}

SB_API sb_no_ret sb_push_pointer(Sb_Ctx ctx, sb_ptr val)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushlightuserdata(L, val);
}

SB_API sb_no_ret sb_push_copy(Sb_Ctx ctx, sb_stack_idx i)
{
    lua_State* L = sb_push_target(ctx);
    if (L) lua_pushvalue(L, i);
}

/* --- Diagnostics --- */

SB_API sb_size sb_ref_count(Sb_Ctx ctx)
{
    if (!ctx) return 0;
    return sb_ctx_cast(ctx)->live_ref_count();
}

SB_API sb_size sb_open_handle_count(Sb_Ctx ctx)
{
    if (!ctx) return 0;
    return sb_ctx_cast(ctx)->open_scope_count();
}

SB_API sb_no_ret sb_gc_collect(Sb_Ctx ctx)
{
    if (!ctx) return;
    lua_gc(sb_ctx_cast(ctx)->get_raw_state(), LUA_GCCOLLECT, 0);
}

SB_API sb_size sb_get_mem_used(Sb_Ctx ctx)
{
    if (!ctx) return 0;
    return sb_ctx_cast(ctx)->mem_used();
}
