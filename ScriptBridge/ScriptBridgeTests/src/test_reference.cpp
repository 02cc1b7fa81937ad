#include <doctest/doctest.h>
#include "../include/common.h"

TEST_CASE("C API: References") {
    Sb_Ctx ctx = sb_create_ctx();
    REQUIRE(ctx != nullptr);
    REQUIRE(sb_do_file(ctx, script_path("game.lua").c_str()) == SB_STATUS_OK);

    sb_stack_idx base = sb_stack_size(ctx);

    SUBCASE("A reference outlives stack traffic and the original binding") {
        Sb_Ref ref = sb_reference_for(ctx, SB_NULL_TABLE, "player", SB_NO_POS);
        REQUIRE(ref >= 0);
        CHECK(sb_stack_size(ctx) == base);
        CHECK(sb_ref_count(ctx) == 1);

        for (int i = 0; i < 50; i++) sb_push_integer(ctx, i);
        sb_pop(ctx, 50);
        REQUIRE(run(ctx, "player = nil; collectgarbage()"));

        CHECK(sb_reference_to_top(ctx, ref) == SB_TYPE_TABLE);
        Sb_Table player = sb_table_open_top(ctx);
        char name[16];
        CHECK(sb_get_string(ctx, player, "name", SB_NO_POS, nullptr, name, sizeof(name), nullptr) == SB_ERROR_NONE);
        CHECK(strcmp(name, "Ada") == 0);
        CHECK(sb_table_close(ctx, player));

        CHECK(sb_reference_to_top(ctx, ref) == SB_TYPE_TABLE);
        sb_pop(ctx, 1);

        CHECK(sb_unreference(ctx, ref));
        CHECK_FALSE(sb_reference_is_live(ctx, ref));
        CHECK(sb_ref_count(ctx) == 0);
    }

    SUBCASE("Referencing table elements and the top") {
        Sb_Table player = sb_table_open(ctx, SB_NULL_TABLE, "player", SB_NO_POS);
        Sb_Ref stats = sb_reference_for(ctx, player, "stats", SB_NO_POS);
        Sb_Ref second = sb_reference_for(ctx, player, nullptr, 2);
        CHECK(sb_stack_size(ctx) == player.slot);
        CHECK(sb_table_close(ctx, player));

        CHECK(sb_reference_to_top(ctx, stats) == SB_TYPE_TABLE);
        sb_pop(ctx, 1);

        sb_push_string(ctx, "on top");
        Sb_Ref top = sb_reference_for(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);
        CHECK(sb_stack_size(ctx) == base);
        CHECK(sb_reference_to_top(ctx, top) == SB_TYPE_STRING);
        char buf[16];
        sb_extract_string(ctx, nullptr, buf, sizeof(buf), nullptr);
        CHECK(strcmp(buf, "on top") == 0);

        CHECK(sb_reference_is_live(ctx, stats));
        CHECK(sb_unreference(ctx, stats));
        CHECK(sb_unreference(ctx, top));
        CHECK(second == SB_REF_NIL);
        CHECK(sb_unreference(ctx, second));
    }

    SUBCASE("Nil references") {
        Sb_Ref ref = sb_reference_for(ctx, SB_NULL_TABLE, "undefined_global", SB_NO_POS);
        CHECK(ref == SB_REF_NIL);
        CHECK(sb_stack_size(ctx) == base);
        CHECK(sb_reference_to_top(ctx, ref) == SB_TYPE_NIL);
        sb_pop(ctx, 1);
        CHECK(sb_unreference(ctx, ref));
        CHECK(sb_ref_count(ctx) == 0);
    }

    SUBCASE("Unknown references") {
        CHECK(sb_reference_for(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS) == SB_NO_REF);

        CHECK(sb_reference_to_top(ctx, 4242) == SB_TYPE_NIL);
        CHECK(sb_stack_size(ctx) == base + 1);
        sb_pop(ctx, 1);

        CHECK_FALSE(sb_unreference(ctx, 4242));

        Sb_Ref ref = sb_reference_for(ctx, SB_NULL_TABLE, "add", SB_NO_POS);
        CHECK(sb_unreference(ctx, ref));
        CHECK_FALSE(sb_unreference(ctx, ref));
    }

    SUBCASE("Distinct references to the same value") {
        Sb_Ref a = sb_reference_for(ctx, SB_NULL_TABLE, "add", SB_NO_POS);
        Sb_Ref b = sb_reference_for(ctx, SB_NULL_TABLE, "add", SB_NO_POS);
        CHECK(a != b);
        CHECK(sb_ref_count(ctx) == 2);

        CHECK(sb_unreference(ctx, a));
        CHECK(sb_reference_to_top(ctx, b) == SB_TYPE_FUNCTION);
        sb_pop(ctx, 1);
        CHECK(sb_unreference(ctx, b));
    }

    CHECK(sb_stack_size(ctx) == base);
    sb_destroy_ctx(ctx);
}
