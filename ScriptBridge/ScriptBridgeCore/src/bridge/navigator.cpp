#include "../../include/bridge/navigator.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/core/log.h"

static bool sb_table_usable(SbBridgeCtx* sctx, Sb_Table table) {
    if (table.slot <= 0) return false;
    if (!sctx->is_scope_open(table.slot, table.generation)) {
        SB_LOG_WARN("Stale table handle (slot %d, generation %u)", table.slot, table.generation);
        return false;
    }
    return lua_type(sctx->get_raw_state(), table.slot) == LUA_TTABLE;
}

// Globals are read and written raw on the globals table, so `_G` metamethods
// never run outside a protected call.
static void sb_push_globals(lua_State* L) {
    lua_rawgeti(L, LUA_REGISTRYINDEX, LUA_RIDX_GLOBALS);
}

Sb_Type sb_internal_push(SbBridgeCtx* sctx, Sb_Table table, sb_str key, sb_int position) {
    lua_State* L = sctx->get_raw_state();

    if (!sctx->reserve(2)) return SB_TYPE_NONE;

    if (table.slot > 0) {
        if (!sb_table_usable(sctx, table)) {
            lua_pushnil(L);
            return SB_TYPE_NIL;
        }
        if (key) {
            lua_pushstring(L, key);
            return static_cast<Sb_Type>(lua_rawget(L, table.slot));
        }
        if (position != SB_NO_POS) {
            return static_cast<Sb_Type>(lua_rawgeti(L, table.slot, position));
        }
        lua_pushvalue(L, table.slot);
        return SB_TYPE_TABLE;
    }

    if (key) {
        sb_push_globals(L);
        lua_pushstring(L, key);
        int type = lua_rawget(L, -2);
        lua_remove(L, -2);
        return static_cast<Sb_Type>(type);
    }

    if (position != SB_NO_POS) {
        SB_LOG_WARN("Position %d given without a table, pushing nil", position);
        lua_pushnil(L);
        return SB_TYPE_NIL;
    }

    return static_cast<Sb_Type>(lua_type(L, -1));
}

bool sb_internal_store_top(SbBridgeCtx* sctx, Sb_Table table, sb_str key, sb_int position) {
    lua_State* L = sctx->get_raw_state();

    if (!sctx->reserve(2)) {
        lua_pop(L, 1);
        return false;
    }

    if (table.slot > 0) {
        if (!sb_table_usable(sctx, table) || (!key && position == SB_NO_POS)) {
            lua_pop(L, 1);
            return false;
        }
        if (key) {
            lua_pushstring(L, key);
            lua_insert(L, -2);
            lua_rawset(L, table.slot);
        }
        else {
            lua_rawseti(L, table.slot, position);
        }
        return true;
    }

    if (key) {
        // [value] -> [globals, key, value]
        sb_push_globals(L);
        lua_insert(L, -2);
        lua_pushstring(L, key);
        lua_insert(L, -2);
        lua_rawset(L, -3);
        lua_pop(L, 1);
        return true;
    }

    SB_LOG_WARN("Store without a table or key, value discarded");
    lua_pop(L, 1);
    return false;
}

SB_API sb_bool sb_table_is_null(Sb_Table table)
{
    return table.slot <= 0;
}

SB_API sb_bool sb_table_is_valid(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx || table.slot <= 0) return sb_false;
    return sb_ctx_cast(ctx)->is_scope_open(table.slot, table.generation);
}

SB_API Sb_Table sb_table_open(Sb_Ctx ctx, Sb_Table parent, sb_str key, sb_int position)
{
    if (!ctx) return SB_NULL_TABLE;

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    if (parent.slot > 0 || key) {
        Sb_Type type = sb_internal_push(sctx, parent, key, position);
        if (type == SB_TYPE_NONE) return SB_NULL_TABLE;
        if (type != SB_TYPE_TABLE) {
            lua_pop(L, 1);
            return SB_NULL_TABLE;
        }
    }
    else if (position != SB_NO_POS) {
        SB_LOG_WARN("Cannot open position %d without a parent table", position);
        return SB_NULL_TABLE;
    }
    else {
        if (!sctx->reserve(1)) return SB_NULL_TABLE;
        lua_newtable(L);
    }

    Sb_Table table;
    table.slot = lua_gettop(L);
    table.generation = sctx->open_scope(table.slot, ScopeKind::Table);

    SB_LOG_TRACE("Opened table at slot %d (%s)", table.slot, key ? key : "anonymous");
    return table;
}

SB_API Sb_Table sb_table_open_top(Sb_Ctx ctx)
{
    if (!ctx) return SB_NULL_TABLE;

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    if (lua_type(L, -1) != LUA_TTABLE) return SB_NULL_TABLE;

    Sb_Table table;
    table.slot = lua_gettop(L);
    table.generation = sctx->open_scope(table.slot, ScopeKind::Table);
    return table;
}

SB_API sb_bool sb_table_close(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx || table.slot <= 0) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);

    switch (sctx->close_scope(table.slot, table.generation)) {
    case ScopeCheck::Stale:
        SB_LOG_ERROR("Closing a stale table handle (slot %d)", table.slot);
        return sb_false;
    case ScopeCheck::OutOfOrder:
        SB_LOG_ERROR("Table handle at slot %d closed before a handle opened after it", table.slot);
        return sb_false;
    case ScopeCheck::Ok:
        break;
    }

    lua_settop(sctx->get_raw_state(), table.slot - 1);
    SB_LOG_TRACE("Closed table at slot %d", table.slot);
    return sb_true;
}

SB_API Sb_Type sb_push(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!ctx) return SB_TYPE_NONE;
    return sb_internal_push(sb_ctx_cast(ctx), table, key, position);
}

SB_API Sb_Type sb_type_of(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    return sb_push(ctx, table, key, position);
}

SB_API sb_bool sb_table_first(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);
    if (!sb_table_usable(sctx, table)) return sb_false;

    lua_State* L = sctx->get_raw_state();
    if (!sctx->reserve(2)) return sb_false;
    lua_pushnil(L);
    return lua_next(L, table.slot) != 0 ? sb_true : sb_false;
}

SB_API sb_bool sb_table_next(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx) return sb_false;

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    if (!sb_table_usable(sctx, table) || lua_gettop(L) <= table.slot) {
        if (lua_gettop(L) > table.slot && table.slot > 0) lua_pop(L, 1);
        return sb_false;
    }

    if (!sctx->reserve(1)) {
        lua_pop(L, 1);
        return sb_false;
    }
    return lua_next(L, table.slot) != 0 ? sb_true : sb_false;
}

SB_API sb_size sb_table_length(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx) return 0;

    auto* sctx = sb_ctx_cast(ctx);
    if (!sb_table_usable(sctx, table)) return 0;

    lua_State* L = sctx->get_raw_state();
    if (!sctx->reserve(2)) return 0;
    SB_STACK_CHECK_START(L);

    sb_size count = 0;
    lua_pushnil(L);
    while (lua_next(L, table.slot) != 0) {
        count++;
        lua_pop(L, 1);
    }

    SB_STACK_CHECK(L, 0);
    return count;
}

SB_API sb_size sb_table_array_length(Sb_Ctx ctx, Sb_Table table)
{
    if (!ctx) return 0;

    auto* sctx = sb_ctx_cast(ctx);
    if (!sb_table_usable(sctx, table)) return 0;

    return (sb_size)lua_rawlen(sctx->get_raw_state(), table.slot);
}
