#include "../../include/bridge/reference.h"
#include "../../include/bridge/bridge_internal.h"
#include "../../include/core/log.h"

SB_API Sb_Ref sb_reference_for(Sb_Ctx ctx, Sb_Table table, sb_str key, sb_int position)
{
    if (!ctx) return SB_NO_REF;

    auto* sctx = sb_ctx_cast(ctx);
    lua_State* L = sctx->get_raw_state();

    bool from_top = table.slot <= 0 && !key && position == SB_NO_POS;
    if (from_top && lua_gettop(L) == 0) {
        SB_LOG_WARN("Nothing on the stack to reference");
        return SB_NO_REF;
    }

    if (!from_top && sb_internal_push(sctx, table, key, position) == SB_TYPE_NONE) return SB_NO_REF;

    Sb_Ref ref = sctx->store_in_registry();
    SB_LOG_TRACE("Reference %d created", ref);
    return ref;
}

SB_API Sb_Type sb_reference_to_top(Sb_Ctx ctx, Sb_Ref ref)
{
    if (!ctx) return SB_TYPE_NONE;

    auto* sctx = sb_ctx_cast(ctx);
    if (!sctx->reserve(1)) return SB_TYPE_NONE;
    if (!sctx->get_from_registry(ref)) {
        SB_LOG_WARN("Unknown reference %d, pushed nil", ref);
        return SB_TYPE_NIL;
    }
    return static_cast<Sb_Type>(lua_type(sctx->get_raw_state(), -1));
}

SB_API sb_bool sb_unreference(Sb_Ctx ctx, Sb_Ref ref)
{
    if (!ctx) return sb_false;
    if (ref == SB_REF_NIL) return sb_true;

    if (!sb_ctx_cast(ctx)->release_from_registry(ref)) {
        SB_LOG_WARN("Releasing unknown reference %d", ref);
        return sb_false;
    }
    SB_LOG_TRACE("Reference %d released", ref);
    return sb_true;
}

SB_API sb_bool sb_reference_is_live(Sb_Ctx ctx, Sb_Ref ref)
{
    if (!ctx) return sb_false;
    return sb_ctx_cast(ctx)->is_live_ref(ref) ? sb_true : sb_false;
}
