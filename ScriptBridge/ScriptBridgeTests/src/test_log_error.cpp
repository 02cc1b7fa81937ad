#include <doctest/doctest.h>
#include "../include/common.h"

#include <iterator>

TEST_CASE("C API: Error Flags And Status") {
    char buf[64];

    CHECK(strcmp(sb_error_flags_to_str(SB_ERROR_NONE, buf, sizeof(buf)), "none") == 0);
    CHECK(strcmp(sb_error_flags_to_str(SB_ERROR_NON_EXISTENT | SB_ERROR_FATAL, buf, sizeof(buf)),
                 "non-existent|fatal") == 0);
    CHECK(strcmp(sb_error_flags_to_str(SB_ERROR_WRONG_TYPE, buf, 6), "wrong") == 0);

    CHECK(sb_error_flags_usable(SB_ERROR_WRONG_TYPE));
    CHECK_FALSE(sb_error_flags_usable(SB_ERROR_WRONG_TYPE | SB_ERROR_FATAL));
    CHECK(sb_error_flags_has(SB_ERROR_WRONG_TYPE | SB_ERROR_FATAL, SB_ERROR_FATAL));
    CHECK_FALSE(sb_error_flags_has(SB_ERROR_WRONG_TYPE, SB_ERROR_NON_EXISTENT));
    CHECK_FALSE(sb_error_flags_has(SB_ERROR_WRONG_TYPE, SB_ERROR_NONE));

    CHECK(strcmp(sb_status_to_str(SB_STATUS_ERR_SYNTAX), "syntax error") == 0);
    CHECK(strcmp(sb_type_name(SB_TYPE_TABLE), "table") == 0);
}

TEST_CASE("C API: Last Error And Checks") {
    Sb_Ctx ctx = sb_create_ctx();
    REQUIRE(ctx != nullptr);

    SUBCASE("Syntax and runtime errors are recorded") {
        CHECK(sb_get_last_error(ctx) == SB_STATUS_OK);
        CHECK(sb_get_last_error_str(ctx) == nullptr);

        CHECK(sb_do_string(ctx, "local = 5") == SB_STATUS_ERR_SYNTAX);
        CHECK(sb_get_last_error(ctx) == SB_STATUS_ERR_SYNTAX);
        CHECK(sb_get_last_error_str(ctx) != nullptr);
        CHECK(sb_stack_size(ctx) == 0);

        CHECK(sb_do_string(ctx, "error('custom failure')") == SB_STATUS_ERR_RUNTIME);
        Sb_Error_Info info = sb_get_last_error_info(ctx);
        CHECK(info.status == SB_STATUS_ERR_RUNTIME);
        CHECK(strstr(info.message, "custom failure") != nullptr);
        CHECK(sb_stack_size(ctx) == 0);

        sb_clear_error(ctx);
        CHECK(sb_get_last_error(ctx) == SB_STATUS_OK);
    }

    SUBCASE("Loading without running") {
        CHECK(sb_load_string(ctx, "return 1") == SB_STATUS_OK);
        CHECK(sb_stack_type(ctx, -1) == SB_TYPE_FUNCTION);
        sb_pop(ctx, 1);

        CHECK(sb_load_file(ctx, script_path("broken.lua").c_str()) == SB_STATUS_ERR_SYNTAX);
        CHECK(sb_stack_size(ctx) == 0);
    }

    SUBCASE("Checks report instead of aborting when asked") {
        Sb_Status status = SB_STATUS_OK;
        sb_str msg = nullptr;

        CHECK(sb_check(ctx, SB_STATUS_OK, "noop", nullptr, nullptr));

        sb_do_string(ctx, "error('checked')");
        CHECK_FALSE(sb_check(ctx, SB_STATUS_ERR_RUNTIME, "checked call", &status, &msg));
        CHECK(status == SB_STATUS_ERR_RUNTIME);
        REQUIRE(msg != nullptr);
        CHECK(strstr(msg, "checked") != nullptr);

        sb_clear_error(ctx);
        msg = nullptr;
        CHECK_FALSE(sb_check(ctx, SB_STATUS_ERR_FILE, "no message", nullptr, &msg));
        CHECK(strcmp(msg, "file error") == 0);

        sb_do_string(ctx, "error('earlier failure')");
        msg = nullptr;
        CHECK_FALSE(sb_check(ctx, sb_do_string(ctx, nullptr), "rejected input", &status, &msg));
        CHECK(status == SB_STATUS_ERR_INVALID);
        REQUIRE(msg != nullptr);
        CHECK(strstr(msg, "earlier failure") == nullptr);
        CHECK(strcmp(msg, sb_status_to_str(SB_STATUS_ERR_INVALID)) == 0);
    }

    SUBCASE("Null contexts are rejected") {
        CHECK(sb_do_string(nullptr, "x = 1") == SB_STATUS_ERR_INVALID);
        CHECK(sb_get_last_error(nullptr) == SB_STATUS_ERR_INVALID);
        CHECK(sb_stack_size(nullptr) == 0);
        CHECK(sb_table_is_null(sb_table_open(nullptr, SB_NULL_TABLE, "x", SB_NO_POS)));
    }

    SUBCASE("Memory accounting") {
        sb_size before = sb_get_mem_used(ctx);
        CHECK(before > 0);
        REQUIRE(run(ctx, "big = {} for i = 1, 10000 do big[i] = i end"));
        CHECK(sb_get_mem_used(ctx) > before);
        REQUIRE(run(ctx, "big = nil"));
        sb_gc_collect(ctx);
        CHECK(sb_get_mem_used(ctx) < before + 1024 * 64);
    }

    sb_destroy_ctx(ctx);
}

TEST_CASE("C API: Logging") {
    Sb_Log_Level saved = sb_log_get_level();

    Sb_Log_Level parsed = SB_LOG_LVL_INFO;
    CHECK(sb_log_level_from_str("error", &parsed));
    CHECK(parsed == SB_LOG_LVL_ERROR);
    CHECK_FALSE(sb_log_level_from_str("verbose", &parsed));
    CHECK(parsed == SB_LOG_LVL_ERROR);

    sb_log_set_level(SB_LOG_LVL_DEBUG);
    CHECK(sb_log_get_level() == SB_LOG_LVL_DEBUG);

    CHECK(strcmp(sb_log_level_to_str(SB_LOG_LVL_WARN), "warn") == 0);
    CHECK(sb_log_level_from_str(sb_log_level_to_str(SB_LOG_LVL_TRACE), &parsed));
    CHECK(parsed == SB_LOG_LVL_TRACE);

    std::filesystem::path file = std::filesystem::temp_directory_path() / "scriptbridge_test.log";
    std::filesystem::path other = std::filesystem::temp_directory_path() / "scriptbridge_test_other.log";
    std::filesystem::remove(file);
    std::filesystem::remove(other);

    CHECK(sb_log_file_path() == nullptr);
    CHECK(sb_log_enable_file_sink(file.string().c_str()));
    CHECK(std::filesystem::exists(file));
    REQUIRE(sb_log_file_path() != nullptr);
    CHECK(file.string() == sb_log_file_path());
    CHECK(sb_log_enable_file_sink(file.string().c_str()));
    CHECK_FALSE(sb_log_enable_file_sink(""));

    SB_LOG_DEBUG("Logging check %d", 1);
    sb_log(SB_LOG_LVL_INFO, "Plain message");
    std::string long_message(300, 'x');
    SB_LOG_INFO("long %s end", long_message.c_str());

    // switching files closes the first one
    CHECK(sb_log_enable_file_sink(other.string().c_str()));
    CHECK(other.string() == sb_log_file_path());

    std::ifstream in(file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("Logging check 1") != std::string::npos);
    CHECK(contents.find("Plain message") != std::string::npos);
    CHECK(contents.find("long " + long_message + " end") != std::string::npos);

    sb_log_disable_file_sink();
    CHECK(sb_log_file_path() == nullptr);

    sb_log_set_level(saved);
}
