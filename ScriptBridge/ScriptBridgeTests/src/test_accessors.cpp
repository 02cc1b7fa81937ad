#include <doctest/doctest.h>
#include "../include/common.h"

TEST_CASE("C API: Accessors") {
    Sb_Ctx ctx = sb_create_ctx();
    REQUIRE(ctx != nullptr);
    REQUIRE(sb_do_file(ctx, script_path("game.lua").c_str()) == SB_STATUS_OK);

    sb_stack_idx base = sb_stack_size(ctx);

    SUBCASE("Getters leave the stack unchanged") {
        Sb_Table player = sb_table_open(ctx, SB_NULL_TABLE, "player", SB_NO_POS);
        sb_stack_idx size = sb_stack_size(ctx);

        char name[32];
        CHECK(sb_get_string(ctx, player, "name", SB_NO_POS, nullptr, name, sizeof(name), nullptr) == SB_ERROR_NONE);
        CHECK(strcmp(name, "Ada") == 0);
        CHECK(sb_stack_size(ctx) == size);

        sb_float speed = 0.0f;
        CHECK(sb_get_float(ctx, player, "speed", SB_NO_POS, nullptr, &speed) == SB_ERROR_NONE);
        CHECK(speed == doctest::Approx(4.5f));

        sb_bool alive = sb_false;
        CHECK(sb_get_boolean(ctx, player, "alive", SB_NO_POS, nullptr, &alive) == SB_ERROR_NONE);
        CHECK(alive == sb_true);

        sb_int64 hp = 0;
        CHECK(sb_get_long(ctx, player, "hp", SB_NO_POS, nullptr, &hp) == SB_ERROR_NONE);
        CHECK(hp == 120);

        Sb_Number num;
        CHECK(sb_get_number(ctx, player, "hp", SB_NO_POS, SB_NUM_DOUBLE, nullptr, &num) == SB_ERROR_NONE);
        CHECK(num.as.f64 == 120.0);

        CHECK(sb_stack_size(ctx) == size);
        CHECK(sb_table_close(ctx, player));
    }

    SUBCASE("Default substitution") {
        Sb_Table player = sb_table_open(ctx, SB_NULL_TABLE, "player", SB_NO_POS);

        sb_int32 def = 7, out = 0;
        CHECK(sb_get_integer(ctx, player, "mana", SB_NO_POS, &def, &out) == SB_ERROR_NON_EXISTENT);
        CHECK(out == 7);

        CHECK(sb_get_integer(ctx, player, "name", SB_NO_POS, &def, &out) == SB_ERROR_WRONG_TYPE);
        CHECK(out == 7);

        Sb_Error_Flags flags = sb_get_integer(ctx, player, "mana", SB_NO_POS, nullptr, &out);
        CHECK_FALSE(sb_error_flags_usable(flags));

        CHECK(sb_stack_size(ctx) == base + 1);
        CHECK(sb_table_close(ctx, player));
    }

    SUBCASE("Globals") {
        sb_double gravity = 0.0;
        CHECK(sb_set_double(ctx, SB_NULL_TABLE, "gravity", SB_NO_POS, 9.81));
        CHECK(sb_get_double(ctx, SB_NULL_TABLE, "gravity", SB_NO_POS, nullptr, &gravity) == SB_ERROR_NONE);
        CHECK(gravity == doctest::Approx(9.81));

        CHECK(sb_set_string(ctx, SB_NULL_TABLE, "title", SB_NO_POS, "ScriptBridge"));
        CHECK(run(ctx, "assert(title == 'ScriptBridge')"));

        CHECK(sb_exists(ctx, SB_NULL_TABLE, "title", SB_NO_POS));
        CHECK(sb_set_nil(ctx, SB_NULL_TABLE, "title", SB_NO_POS));
        CHECK_FALSE(sb_exists(ctx, SB_NULL_TABLE, "title", SB_NO_POS));

        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Setters write into tables") {
        Sb_Table cfg = sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);

        CHECK(sb_set_integer(ctx, cfg, "width", SB_NO_POS, 1280));
        CHECK(sb_set_long(ctx, cfg, "seed", SB_NO_POS, 1LL << 40));
        CHECK(sb_set_float(ctx, cfg, "scale", SB_NO_POS, 0.5f));
        CHECK(sb_set_long_double(ctx, cfg, "ratio", SB_NO_POS, 1.25L));
        CHECK(sb_set_boolean(ctx, cfg, "vsync", SB_NO_POS, sb_true));
        CHECK(sb_set_number(ctx, cfg, "depth", SB_NO_POS, sb_number_make(SB_NUM_INT32, 24)));
        CHECK(sb_set_string(ctx, cfg, nullptr, 1, "first"));

        int marker = 0;
        CHECK(sb_set_pointer(ctx, cfg, "owner", SB_NO_POS, &marker));

        CHECK(sb_stack_size(ctx) == cfg.slot);

        sb_push(ctx, cfg, nullptr, SB_NO_POS);
        CHECK(sb_set_from_top(ctx, SB_NULL_TABLE, "cfg", SB_NO_POS));
        CHECK(run(ctx,
            "assert(cfg.width == 1280 and math.type(cfg.width) == 'integer')\n"
            "assert(cfg.seed == 2^40)\n"
            "assert(cfg.scale == 0.5 and cfg.ratio == 1.25)\n"
            "assert(cfg.vsync == true and cfg.depth == 24)\n"
            "assert(cfg[1] == 'first')\n"
            "assert(type(cfg.owner) == 'userdata')"));

        sb_ptr owner = nullptr;
        CHECK(sb_get_pointer(ctx, cfg, "owner", SB_NO_POS, nullptr, &owner) == SB_ERROR_NONE);
        CHECK(owner == &marker);

        CHECK(sb_table_close(ctx, cfg));
    }

    SUBCASE("Set then get returns the value") {
        Sb_Table t = sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);

        CHECK(sb_set_double(ctx, t, "x", SB_NO_POS, -3.75));
        sb_double x = 0.0;
        CHECK(sb_get_double(ctx, t, "x", SB_NO_POS, nullptr, &x) == SB_ERROR_NONE);
        CHECK(x == -3.75);

        CHECK(sb_set_string(ctx, t, nullptr, 4, "four"));
        char buf[8];
        CHECK(sb_get_string(ctx, t, nullptr, 4, nullptr, buf, sizeof(buf), nullptr) == SB_ERROR_NONE);
        CHECK(strcmp(buf, "four") == 0);

        CHECK(sb_table_close(ctx, t));
    }

    SUBCASE("Set then get for every scalar, by name and by position") {
        Sb_Table t = sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);
        int marker = 0;

        struct Slot { sb_str key; sb_int position; };
        const Slot slots[] = { { "value", SB_NO_POS }, { nullptr, 7 } };

        for (const Slot& slot : slots) {
            CAPTURE(slot.position);

            sb_int32 i32 = 0;
            CHECK(sb_set_integer(ctx, t, slot.key, slot.position, INT32_MIN));
            CHECK(sb_get_integer(ctx, t, slot.key, slot.position, nullptr, &i32) == SB_ERROR_NONE);
            CHECK(i32 == INT32_MIN);
            CHECK(sb_set_integer(ctx, t, slot.key, slot.position, INT32_MAX));
            CHECK(sb_get_integer(ctx, t, slot.key, slot.position, nullptr, &i32) == SB_ERROR_NONE);
            CHECK(i32 == INT32_MAX);

            sb_int64 i64 = 0;
            CHECK(sb_set_long(ctx, t, slot.key, slot.position, INT64_MIN));
            CHECK(sb_get_long(ctx, t, slot.key, slot.position, nullptr, &i64) == SB_ERROR_NONE);
            CHECK(i64 == INT64_MIN);
            CHECK(sb_set_long(ctx, t, slot.key, slot.position, INT64_MAX));
            CHECK(sb_get_long(ctx, t, slot.key, slot.position, nullptr, &i64) == SB_ERROR_NONE);
            CHECK(i64 == INT64_MAX);

            sb_float f = 0.0f;
            CHECK(sb_set_float(ctx, t, slot.key, slot.position, 0.15625f));
            CHECK(sb_get_float(ctx, t, slot.key, slot.position, nullptr, &f) == SB_ERROR_NONE);
            CHECK(f == 0.15625f);

            sb_bool b = sb_true;
            CHECK(sb_set_boolean(ctx, t, slot.key, slot.position, sb_false));
            CHECK(sb_get_boolean(ctx, t, slot.key, slot.position, nullptr, &b) == SB_ERROR_NONE);
            CHECK(b == sb_false);
            CHECK(sb_set_boolean(ctx, t, slot.key, slot.position, sb_true));
            CHECK(sb_get_boolean(ctx, t, slot.key, slot.position, nullptr, &b) == SB_ERROR_NONE);
            CHECK(b == sb_true);

            sb_ptr p = nullptr;
            CHECK(sb_set_pointer(ctx, t, slot.key, slot.position, &marker));
            CHECK(sb_get_pointer(ctx, t, slot.key, slot.position, nullptr, &p) == SB_ERROR_NONE);
            CHECK(p == &marker);
        }

        CHECK(sb_table_close(ctx, t));
        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Strict globals never abort lookups") {
        REQUIRE(run(ctx,
            "setmetatable(_G, {\n"
            "  __index = function(_, k) error('undefined global ' .. tostring(k), 2) end,\n"
            "  __newindex = function(_, k) error('assignment to undeclared ' .. tostring(k), 2) end,\n"
            "})"));

        sb_int32 out = 0;
        CHECK(sb_get_integer(ctx, SB_NULL_TABLE, "undefined", SB_NO_POS, nullptr, &out) == (SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL));
        sb_int32 def = 9;
        CHECK(sb_get_integer(ctx, SB_NULL_TABLE, "undefined", SB_NO_POS, &def, &out) == SB_ERROR_NON_EXISTENT);
        CHECK(out == 9);
        CHECK_FALSE(sb_exists(ctx, SB_NULL_TABLE, "undefined", SB_NO_POS));
        CHECK(sb_table_is_null(sb_table_open(ctx, SB_NULL_TABLE, "undefined", SB_NO_POS)));
        CHECK(sb_stack_size(ctx) == base);

        CHECK(sb_set_integer(ctx, SB_NULL_TABLE, "declared_late", SB_NO_POS, 11));
        CHECK(sb_get_integer(ctx, SB_NULL_TABLE, "declared_late", SB_NO_POS, nullptr, &out) == SB_ERROR_NONE);
        CHECK(out == 11);
        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Invalid destinations") {
        CHECK_FALSE(sb_set_integer(ctx, SB_NULL_TABLE, nullptr, 2, 5));
        CHECK_FALSE(sb_set_integer(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS, 5));
        CHECK(sb_stack_size(ctx) == base);

        Sb_Table t = sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);
        CHECK(sb_table_close(ctx, t));
        CHECK_FALSE(sb_set_integer(ctx, t, "late", SB_NO_POS, 1));
        CHECK(sb_stack_size(ctx) == base);

        CHECK_FALSE(sb_set_from_top(ctx, SB_NULL_TABLE, "nothing", SB_NO_POS));
    }

    SUBCASE("Getters without a source consume the top") {
        sb_push_integer(ctx, 99);
        sb_int32 v = 0;
        CHECK(sb_exists(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS));
        CHECK(sb_stack_size(ctx) == base + 1);
        CHECK(sb_get_integer(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS, nullptr, &v) == SB_ERROR_NONE);
        CHECK(v == 99);
        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Number arrays") {
        const sb_double samples[] = { 0.5, 1.5, 2.5, 3.5 };
        CHECK(sb_set_number_array(ctx, SB_NULL_TABLE, "samples", SB_NO_POS, SB_NUM_DOUBLE, samples, 4));
        CHECK(run(ctx, "assert(#samples == 4 and samples[4] == 3.5)"));

        sb_int32 ints[8] = {};
        sb_size count = 0;
        CHECK(sb_get_number_array(ctx, SB_NULL_TABLE, "samples", SB_NO_POS, SB_NUM_INT32,
                                  nullptr, ints, 8, &count) == SB_ERROR_NONE);
        CHECK(count == 4);
        CHECK(ints[0] == 0);
        CHECK(ints[3] == 3);

        sb_double capped[2] = {};
        CHECK(sb_get_number_array(ctx, SB_NULL_TABLE, "samples", SB_NO_POS, SB_NUM_DOUBLE,
                                  nullptr, capped, 2, &count) == SB_ERROR_NONE);
        CHECK(count == 2);
        CHECK(capped[1] == 1.5);

        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Number array element errors") {
        REQUIRE(run(ctx, "mixed = { 1, 'two', 3, false }"));

        Sb_Number def = sb_number_make(SB_NUM_INT64, -1);
        sb_int64 out[4] = {};
        sb_size count = 0;
        Sb_Error_Flags flags = sb_get_number_array(ctx, SB_NULL_TABLE, "mixed", SB_NO_POS, SB_NUM_INT64,
                                                   &def, out, 4, &count);
        CHECK(flags == SB_ERROR_WRONG_TYPE);
        CHECK(count == 4);
        CHECK(out[0] == 1);
        CHECK(out[1] == -1);
        CHECK(out[2] == 3);
        CHECK(out[3] == -1);

        flags = sb_get_number_array(ctx, SB_NULL_TABLE, "mixed", SB_NO_POS, SB_NUM_INT64,
                                    nullptr, out, 4, &count);
        CHECK(sb_error_flags_has(flags, SB_ERROR_FATAL));
        CHECK(count == 4);

        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("Number array from a non-table") {
        Sb_Number def = sb_number_make(SB_NUM_DOUBLE, 0);
        sb_double out[2] = {};
        sb_size count = 9;

        CHECK(sb_get_number_array(ctx, SB_NULL_TABLE, "missing", SB_NO_POS, SB_NUM_DOUBLE,
                                  &def, out, 2, &count) == SB_ERROR_NON_EXISTENT);
        CHECK(count == 0);

        CHECK(sb_get_number_array(ctx, SB_NULL_TABLE, "add", SB_NO_POS, SB_NUM_DOUBLE,
                                  nullptr, out, 2, &count) == (SB_ERROR_WRONG_TYPE | SB_ERROR_FATAL));
        CHECK(sb_stack_size(ctx) == base);
    }

    SUBCASE("String and pushed arrays") {
        const sb_str names[] = { "red", "green", "blue" };
        Sb_Table t = sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS);
        CHECK(sb_set_string_array(ctx, t, "colors", SB_NO_POS, names, 3));

        Sb_Table colors = sb_table_open(ctx, t, "colors", SB_NO_POS);
        CHECK(sb_table_array_length(ctx, colors) == 3);
        char buf[8];
        CHECK(sb_get_string(ctx, colors, nullptr, 2, nullptr, buf, sizeof(buf), nullptr) == SB_ERROR_NONE);
        CHECK(strcmp(buf, "green") == 0);
        CHECK(sb_table_close(ctx, colors));
        CHECK(sb_table_close(ctx, t));

        const sb_int32 ids[] = { 4, 8, 15 };
        sb_push_number_array(ctx, SB_NUM_INT32, ids, 3);
        CHECK(sb_stack_type(ctx, -1) == SB_TYPE_TABLE);
        sb_push_string_array(ctx, names, 3);
        CHECK(sb_stack_size(ctx) == base + 2);
        sb_pop(ctx, 2);
    }

    CHECK(sb_stack_size(ctx) == base);
    sb_destroy_ctx(ctx);
}
