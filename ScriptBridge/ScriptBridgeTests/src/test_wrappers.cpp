#include <doctest/doctest.h>
#include <scriptbridge.hpp>
#include "../include/common.h"

TEST_CASE("C++ API: Wrappers") {
    sb::Context ctx;
    ctx.do_file(script_path("game.lua"));

    SUBCASE("Failures throw") {
        CHECK_THROWS_AS(ctx.do_string("this is not a chunk"), sb::Error);
        try {
            ctx.do_string("error('wrapped')");
            FAIL("expected an exception");
        }
        catch (const sb::Error& e) {
            CHECK(e.status() == SB_STATUS_ERR_RUNTIME);
            CHECK(std::string(e.what()).find("wrapped") != std::string::npos);
        }
    }

    SUBCASE("Table scopes") {
        {
            sb::TableScope player(ctx.raw(), "player");
            REQUIRE(player);
            CHECK(player.get<std::string>("name").value == "Ada");
            CHECK(player.get<sb_int32>("hp").value == 120);
            CHECK(player.get<bool>("alive").value);
            CHECK(player.has("stats"));

            auto mana = player.get<sb_int32>("mana", 30);
            CHECK(mana.flags == SB_ERROR_NON_EXISTENT);
            CHECK(mana.value == 30);

            auto title = player.get<std::string>("title", std::string("none"));
            CHECK(title.usable());
            CHECK(title.value == "none");

            sb::TableScope inv(player, "inventory");
            CHECK(inv.array_length() == 3);
            CHECK(inv.get<std::string>(3).value == "potion");

            CHECK(player.set("level", 5));
            CHECK(player.set("nick", "ada"));
            CHECK(player.set("ratio", 0.75));
        }
        CHECK(ctx.stack_size() == 0);
        ctx.do_string("assert(player.level == 5 and player.nick == 'ada' and player.ratio == 0.75)");
    }

    SUBCASE("Scopes closing out of order are refused") {
        sb::TableScope outer(ctx.raw(), "player");
        sb::TableScope inner(outer, "stats");
        CHECK_FALSE(outer.close());
        CHECK(inner.close());
        CHECK(ctx.stack_size() == 1);
    }

    SUBCASE("Call scopes") {
        {
            sb::CallScope add(ctx.raw(), "add");
            REQUIRE(add);
            CHECK(add.arg(10.5).arg(20.2).call<double>() == doctest::Approx(30.7));
            CHECK(add.state() == SB_CALL_STATE_INVOKED);
            CHECK(add.arg(1).arg(2).call<sb_int32>() == 3);

            sb::CallScope boom(ctx.raw(), "boom");
            CHECK_THROWS_AS(boom.invoke(), sb::Error);
        }
        CHECK(ctx.stack_size() == 0);

        sb::CallScope missing(ctx.raw(), "nope");
        CHECK_FALSE(missing);
        CHECK_THROWS_AS(missing.arg(1), sb::Error);
    }

    SUBCASE("References") {
        sb::Reference add = sb::Reference::to_global(ctx.raw(), "add");
        CHECK(add.live());
        CHECK(sb_ref_count(ctx.raw()) == 1);

        sb::Reference moved = std::move(add);
        CHECK_FALSE(add.live());
        CHECK(moved.live());

        {
            sb::CallScope call(ctx.raw(), moved);
            CHECK(call.arg(2).arg(sb_int64(3)).call<sb_int32>() == 5);
        }

        moved.reset();
        CHECK(sb_ref_count(ctx.raw()) == 0);

        sb_push_integer(ctx.raw(), 9);
        sb::Reference top = sb::Reference::from_top(ctx.raw());
        CHECK(ctx.stack_size() == 0);
        CHECK(top.push() == SB_TYPE_NUMBER);
        CHECK(sb::extract<sb_int64>(ctx.raw()).value == 9);
    }

    SUBCASE("Extraction helper") {
        sb_push_string(ctx.raw(), "a fairly long string that goes well past any small buffer");
        auto s = sb::extract<std::string>(ctx.raw());
        CHECK(s.ok());
        CHECK(s.value.size() == 57);

        sb_push_nil(ctx.raw());
        auto f = sb::extract<float>(ctx.raw());
        CHECK_FALSE(f.usable());

        int marker = 0;
        sb_push_pointer(ctx.raw(), &marker);
        CHECK(sb::extract<sb_ptr>(ctx.raw()).value == &marker);
        CHECK(ctx.stack_size() == 0);
    }
}

TEST_CASE("C++ API: Logging") {
    Sb_Log_Level saved = sb_log_get_level();
    sb::log::set_level(sb::log::Level::L_TRACE);
    CHECK(sb_log_get_level() == SB_LOG_LVL_TRACE);
    sb::log::trace("Formatted {} with {}", "message", 2);
    sb::log::info("Answer is {}", 42);
    sb_log_set_level(saved);
}
