#pragma once

#include "./engine.h"
#include "./navigator.h"
#include "./reference.h"
#include "./extract.h"
#ifdef __cplusplus
extern "C" {
#endif
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
#ifdef __cplusplus
}
#endif
#include <string>
#include <vector>
#include <unordered_set>
#include <algorithm>
#include "../core/log.h"

enum class ScopeKind {
	Table,
	Call
};

enum class ScopeCheck {
	Ok,
	Stale,
	OutOfOrder
};

struct OpenScope {
	sb_stack_idx slot;
	sb_uint32 generation;
	ScopeKind kind;
};

class SbBridgeCtx {
public:
	SbBridgeCtx(lua_State* state) :
		p_state(state),
		p_error_info{
			.status = SB_STATUS_OK,
			.message = nullptr
		}
	{}

	~SbBridgeCtx() {
		if (!p_scopes.empty()) {
			SB_LOG_WARN("Context destroyed with %zu open handle(s)", p_scopes.size());
		}
		if (!p_refs.empty()) {
			SB_LOG_WARN("Context destroyed with %zu live reference(s)", p_refs.size());
		}
		if (p_state) lua_close(p_state);
	}

	lua_State* get_raw_state() { return p_state; }

	void set_raw_state(lua_State* state) {
		p_state = state;
	}

	void set_internal_error(Sb_Status status, const std::string& msg) {
		p_error_message = msg;
		p_error_info.status = status;
		p_error_info.message = p_error_message.c_str();
	}

	void clear_error() {
		p_error_message.clear();
		p_error_info.status = SB_STATUS_OK;
		p_error_info.message = nullptr;
	}

	const Sb_Error_Info& get_error_info() const { return p_error_info; }

	// The host side only gets LUA_MINSTACK free slots; every push path grows the stack first.
	bool reserve(int slots) {
		if (lua_checkstack(p_state, slots)) return true;
		set_internal_error(SB_STATUS_ERR_MEMORY, "Stack overflow");
		SB_LOG_ERROR("Could not grow the stack by %d slot(s) (size %d)", slots, lua_gettop(p_state));
		return false;
	}

	/* --- Open handle bookkeeping --- */

	sb_uint32 open_scope(sb_stack_idx slot, ScopeKind kind) {
		discard_dead_scopes();
		sb_uint32 generation = ++p_generation;
		p_scopes.push_back({ slot, generation, kind });
		return generation;
	}

	bool is_scope_open(sb_stack_idx slot, sb_uint32 generation) {
		discard_dead_scopes();
		for (const auto& scope : p_scopes) {
			if (scope.slot == slot && scope.generation == generation) return true;
		}
		return false;
	}

	ScopeCheck close_scope(sb_stack_idx slot, sb_uint32 generation) {
		discard_dead_scopes();
		if (!is_scope_open(slot, generation)) return ScopeCheck::Stale;

		const OpenScope& innermost = p_scopes.back();
		if (innermost.slot != slot || innermost.generation != generation) {
			return ScopeCheck::OutOfOrder;
		}

		p_scopes.pop_back();
		return ScopeCheck::Ok;
	}

	sb_size open_scope_count() {
		discard_dead_scopes();
		return p_scopes.size();
	}

	/* --- Registry --- */

	Sb_Ref store_in_registry() {
		Sb_Ref ref = luaL_ref(p_state, LUA_REGISTRYINDEX);
		if (ref != LUA_REFNIL && ref != LUA_NOREF) {
			p_refs.insert(ref);
		}
		return ref;
	}

	bool get_from_registry(Sb_Ref ref) {
		if (ref == LUA_REFNIL || p_refs.find(ref) == p_refs.end()) {
			lua_pushnil(p_state);
			return ref == LUA_REFNIL;
		}
		lua_rawgeti(p_state, LUA_REGISTRYINDEX, ref);
		return true;
	}

	bool release_from_registry(Sb_Ref ref) {
		auto found = p_refs.find(ref);
		if (found == p_refs.end()) return false;
		p_refs.erase(found);
		luaL_unref(p_state, LUA_REGISTRYINDEX, ref);
		return true;
	}

	bool is_live_ref(Sb_Ref ref) const { return p_refs.find(ref) != p_refs.end(); }
	sb_size live_ref_count() const { return p_refs.size(); }

	/* --- Allocation accounting --- */

	void track_alloc(sb_size old_size, sb_size new_size) {
		p_mem_used = p_mem_used - old_size + new_size;
	}

	sb_size mem_used() const { return p_mem_used; }

private:
	// Handles whose slot was truncated away by a raw stack operation can never be closed.
	void discard_dead_scopes() {
		if (!p_state) return;
		sb_stack_idx top = lua_gettop(p_state);
		while (!p_scopes.empty() && p_scopes.back().slot > top) {
			SB_LOG_WARN("Handle at slot %d was discarded without being closed", p_scopes.back().slot);
			p_scopes.pop_back();
		}
	}

private:
	lua_State* p_state = nullptr;
	Sb_Error_Info p_error_info;
	std::string p_error_message;
	std::vector<OpenScope> p_scopes;
	std::unordered_set<Sb_Ref> p_refs;
	sb_uint32 p_generation = 0;
	sb_size p_mem_used = 0;
};

inline SbBridgeCtx* sb_ctx_cast(Sb_Ctx ctx) {
	return static_cast<SbBridgeCtx*>(ctx);
}

/* Pushes `table[key]`, `table[position]`, global `key`, or nil. Shared by every component.
 * Returns SB_TYPE_NONE without pushing when the stack cannot grow. */
Sb_Type sb_internal_push(SbBridgeCtx* sctx, Sb_Table table, sb_str key, sb_int position);
/* Stores the value on top into the resolved destination, popping it. */
bool sb_internal_store_top(SbBridgeCtx* sctx, Sb_Table table, sb_str key, sb_int position);
/* Pushes a host number, integral kinds as engine integers. */
void sb_internal_push_number(lua_State* L, const Sb_Number& value);
/* Pushes a new sequence table built from a host array, false when nothing was pushed. */
bool sb_internal_push_number_array(SbBridgeCtx* sctx, Sb_Number_Kind kind, const void* values, sb_size count);
bool sb_internal_push_string_array(SbBridgeCtx* sctx, const sb_str* values, sb_size count);
Sb_Status sb_status_from_lua(int code);
int sb_message_handler(lua_State* L);

#ifndef NDEBUG
inline void sb_stack_check(lua_State* L, int base, int delta, const char* where, int line) {
	int top = lua_gettop(L);
	if (top != base + delta) {
		SB_LOG_ERROR("Stack imbalance in %s:%d: expected %d, found %d", where, line, base + delta, top);
	}
}
#define SB_STACK_CHECK_START(L) const int sb_stack_base_ = lua_gettop(L)
#define SB_STACK_CHECK(L, delta) sb_stack_check((L), sb_stack_base_, (delta), __func__, __LINE__)
#else
#define SB_STACK_CHECK_START(L) ((void)0)
#define SB_STACK_CHECK(L, delta) ((void)0)
#endif
