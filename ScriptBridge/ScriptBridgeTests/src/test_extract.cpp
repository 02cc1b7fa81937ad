#include <doctest/doctest.h>
#include "../include/common.h"

TEST_CASE("C API: Typed Extraction") {
    Sb_Ctx ctx = sb_create_ctx();
    REQUIRE(ctx != nullptr);

    SUBCASE("Numbers convert across kinds") {
        sb_push_integer(ctx, 42);
        sb_double d = 0.0;
        CHECK(sb_extract_double(ctx, nullptr, &d) == SB_ERROR_NONE);
        CHECK(d == 42.0);

        sb_push_double(ctx, 7.9);
        sb_int32 i = 0;
        CHECK(sb_extract_integer(ctx, nullptr, &i) == SB_ERROR_NONE);
        CHECK(i == 7);

        sb_push_long(ctx, 9000000000LL);
        sb_int64 l = 0;
        CHECK(sb_extract_long(ctx, nullptr, &l) == SB_ERROR_NONE);
        CHECK(l == 9000000000LL);

        sb_push_float(ctx, 1.5f);
        sb_long_double ld = 0;
        CHECK(sb_extract_long_double(ctx, nullptr, &ld) == SB_ERROR_NONE);
        CHECK(ld == doctest::Approx(1.5));

        CHECK(sb_stack_size(ctx) == 0);
    }

    SUBCASE("Generic extraction by kind") {
        sb_push_double(ctx, 2.25);
        Sb_Number out;
        CHECK(sb_extract_number(ctx, SB_NUM_FLOAT, nullptr, &out) == SB_ERROR_NONE);
        CHECK(out.kind == SB_NUM_FLOAT);
        CHECK(out.as.f32 == doctest::Approx(2.25f));

        Sb_Number def = sb_number_make(SB_NUM_INT64, 77);
        sb_push_string(ctx, "not a number");
        CHECK(sb_extract_number(ctx, SB_NUM_INT64, &def, &out) == SB_ERROR_WRONG_TYPE);
        CHECK(out.as.i64 == 77);

        CHECK(sb_number_kind_size(SB_NUM_INT32) == sizeof(sb_int32));
        CHECK(sb_number_kind_size(SB_NUM_LONG_DOUBLE) == sizeof(sb_long_double));
        CHECK(strcmp(sb_number_kind_name(SB_NUM_DOUBLE), "double") == 0);
    }

    SUBCASE("Out of range integers are a type mismatch") {
        sb_push_long(ctx, 5000000000LL);
        sb_int32 def = -1, out = 0;
        CHECK(sb_extract_integer(ctx, &def, &out) == SB_ERROR_WRONG_TYPE);
        CHECK(out == -1);

        // 2^63 as a float is one past the largest int64
        REQUIRE(run(ctx, "big = math.maxinteger + 1.0; low = math.mininteger + 0.0"));
        sb_int64 ldef = 7, lout = 0;
        CHECK(sb_get_long(ctx, SB_NULL_TABLE, "big", SB_NO_POS, &ldef, &lout) == SB_ERROR_WRONG_TYPE);
        CHECK(lout == 7);
        sb_push_double(ctx, 2147483648.0);
        CHECK(sb_extract_integer(ctx, &def, &out) == SB_ERROR_WRONG_TYPE);
        CHECK(out == -1);

        CHECK(sb_get_long(ctx, SB_NULL_TABLE, "low", SB_NO_POS, nullptr, &lout) == SB_ERROR_NONE);
        CHECK(lout == INT64_MIN);
        CHECK(sb_stack_size(ctx) == 0);
    }

    SUBCASE("Defaults replace missing and mistyped values") {
        sb_int32 def = 5, out = 0;

        sb_push_nil(ctx);
        CHECK(sb_extract_integer(ctx, &def, &out) == SB_ERROR_NON_EXISTENT);
        CHECK(out == 5);

        sb_push_boolean(ctx, sb_true);
        out = 0;
        CHECK(sb_extract_integer(ctx, &def, &out) == SB_ERROR_WRONG_TYPE);
        CHECK(out == 5);

        sb_push_nil(ctx);
        out = 123;
        Sb_Error_Flags flags = sb_extract_integer(ctx, nullptr, &out);
        CHECK(sb_error_flags_has(flags, SB_ERROR_NON_EXISTENT));
        CHECK(sb_error_flags_has(flags, SB_ERROR_FATAL));
        CHECK_FALSE(sb_error_flags_usable(flags));
        CHECK(out == 0);

        CHECK(sb_stack_size(ctx) == 0);
    }

    SUBCASE("Strings are never coerced from numbers") {
        sb_push_integer(ctx, 10);
        char buf[16];
        Sb_Error_Flags flags = sb_extract_string(ctx, nullptr, buf, sizeof(buf), nullptr);
        CHECK(flags == (SB_ERROR_WRONG_TYPE | SB_ERROR_FATAL));
        CHECK(buf[0] == '\0');

        sb_push_string(ctx, "10");
        sb_int32 n = 0;
        sb_int32 def = 3;
        CHECK(sb_extract_integer(ctx, &def, &n) == SB_ERROR_WRONG_TYPE);
        CHECK(n == 3);
    }

    SUBCASE("Strings truncate to the buffer") {
        sb_push_string(ctx, "KeyboardWarrior");
        char buf[8];
        sb_size len = 0;
        CHECK(sb_extract_string(ctx, nullptr, buf, sizeof(buf), &len) == SB_ERROR_NONE);
        CHECK(len == 7);
        CHECK(strcmp(buf, "Keyboar") == 0);

        sb_push_nil(ctx);
        CHECK(sb_extract_string(ctx, "fallback", buf, sizeof(buf), &len) == SB_ERROR_NON_EXISTENT);
        CHECK(strcmp(buf, "fallbac") == 0);

        sb_push_lstring(ctx, "abcdef", 3);
        CHECK(sb_top_string_length(ctx) == 3);
        CHECK(sb_stack_size(ctx) == 1);
        CHECK(sb_extract_string(ctx, nullptr, buf, sizeof(buf), &len) == SB_ERROR_NONE);
        CHECK(strcmp(buf, "abc") == 0);
    }

    SUBCASE("Booleans and pointers need an exact match") {
        sb_push_boolean(ctx, sb_true);
        sb_bool b = sb_false;
        CHECK(sb_extract_boolean(ctx, nullptr, &b) == SB_ERROR_NONE);
        CHECK(b == sb_true);

        sb_push_integer(ctx, 1);
        sb_bool def = sb_false;
        b = sb_true;
        CHECK(sb_extract_boolean(ctx, &def, &b) == SB_ERROR_WRONG_TYPE);
        CHECK(b == sb_false);

        Player hero{ 1, 3.0f, "Ada" };
        sb_push_pointer(ctx, &hero);
        sb_ptr p = nullptr;
        CHECK(sb_extract_pointer(ctx, nullptr, &p) == SB_ERROR_NONE);
        CHECK(p == &hero);
        CHECK(static_cast<Player*>(p)->id == 1);

        sb_push_string(ctx, "ptr");
        p = &hero;
        CHECK(sb_extract_pointer(ctx, nullptr, &p) == (SB_ERROR_WRONG_TYPE | SB_ERROR_FATAL));
        CHECK(p == nullptr);
    }

    SUBCASE("Exactly one value is popped") {
        sb_push_integer(ctx, 1);
        sb_push_string(ctx, "x");
        sb_push_nil(ctx);

        sb_int32 def = 0, out = 0;
        sb_extract_integer(ctx, &def, &out);
        CHECK(sb_stack_size(ctx) == 2);

        sb_extract_integer(ctx, &def, &out);
        CHECK(sb_stack_size(ctx) == 1);

        sb_extract_integer(ctx, &def, &out);
        CHECK(sb_stack_size(ctx) == 0);
        CHECK(out == 1);

        CHECK(sb_extract_integer(ctx, &def, &out) == SB_ERROR_NON_EXISTENT);
        CHECK(sb_stack_size(ctx) == 0);
    }

    sb_destroy_ctx(ctx);
}
