#pragma once

#include <scriptbridge.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <fstream>
#include <filesystem>

#ifndef SB_TEST_SCRIPTS_DIR
#define SB_TEST_SCRIPTS_DIR "scripts"
#endif

inline std::string script_path(const char* name) {
    return std::string(SB_TEST_SCRIPTS_DIR) + "/" + name;
}

inline std::string write_temp_script(const char* name, const std::string& code) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << code;
    return path.string();
}

/* Runs a chunk that must succeed; returns false and logs the engine message otherwise. */
inline bool run(Sb_Ctx ctx, const char* code) {
    Sb_Status status = sb_do_string(ctx, code);
    if (status != SB_STATUS_OK) {
        sb_str err = sb_get_last_error_str(ctx);
        SB_LOG_ERROR("Test chunk failed: %s", err ? err : sb_status_to_str(status));
        return false;
    }
    return true;
}

struct Player {
    int id;
    float speed;
    char name[32];
};
