#include "../../include/config/config.h"
#include "../../include/bridge/accessors.h"
#include "../../include/core/error.h"
#include "../../include/core/log.h"

#include <string.h>
#include <string>

static const char* s_default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

Sb_Config sb_config_default() {
    Sb_Config config;
    memset(&config, 0, sizeof(config));

    config.log_level = SB_LOG_LVL_INFO;
    strncpy(config.log_pattern, s_default_pattern, SB_CONFIG_STR_CAP - 1);
    config.open_libs = sb_true;
    return config;
}

// Reads table[key] into field when it is a string. The field keeps its value otherwise.
static void sb_config_read_string(Sb_Ctx ctx, Sb_Table table, sb_str key, char* field) {
    char buffer[SB_CONFIG_STR_CAP];
    Sb_Error_Flags flags = sb_get_string(ctx, table, key, SB_NO_POS, field, buffer, sizeof(buffer), NULL);
    if (sb_error_flags_has(flags, SB_ERROR_WRONG_TYPE)) {
        SB_LOG_WARN("Config field '%s' is not a string, keeping default", key);
        return;
    }
    memcpy(field, buffer, sizeof(buffer));
}

static void sb_config_read_log(Sb_Ctx ctx, Sb_Table root, Sb_Config* out) {
    Sb_Table log = sb_table_open(ctx, root, "log", SB_NO_POS);
    if (sb_table_is_null(log)) {
        if (sb_exists(ctx, root, "log", SB_NO_POS)) {
            SB_LOG_WARN("Config field 'log' is not a table, ignored");
        }
        return;
    }

    char level[32];
    Sb_Error_Flags flags = sb_get_string(ctx, log, "level", SB_NO_POS, "", level, sizeof(level), NULL);
    if (flags == SB_ERROR_NONE) {
        if (!sb_log_level_from_str(level, &out->log_level)) {
            SB_LOG_WARN("Unknown log level '%s' in config", level);
        }
    }
    else if (sb_error_flags_has(flags, SB_ERROR_WRONG_TYPE)) {
        SB_LOG_WARN("Config field 'log.level' is not a string, keeping default");
    }

    sb_config_read_string(ctx, log, "pattern", out->log_pattern);
    sb_config_read_string(ctx, log, "file", out->log_file);

    sb_table_close(ctx, log);
}

SB_API Sb_Status sb_config_load_file(Sb_Ctx ctx, sb_str path, Sb_Config* out)
{
    if (!ctx || !path || !out) return SB_STATUS_ERR_INVALID;

    *out = sb_config_default();

    Sb_Status status = sb_do_file(ctx, path);
    if (status != SB_STATUS_OK) {
        sb_str err = sb_get_last_error_str(ctx);
        SB_LOG_ERROR("Could not run config file '%s': %s", path, err ? err : sb_status_to_str(status));
        return status;
    }

    Sb_Table root = sb_table_open(ctx, SB_NULL_TABLE, "config", SB_NO_POS);
    if (sb_table_is_null(root)) {
        SB_LOG_ERROR("Config file '%s' does not define a 'config' table", path);
        return SB_STATUS_ERR_INVALID;
    }

    sb_config_read_log(ctx, root, out);
    sb_config_read_string(ctx, root, "package_path", out->package_path);

    sb_bool open_libs = out->open_libs;
    Sb_Error_Flags flags = sb_get_boolean(ctx, root, "open_libs", SB_NO_POS, &open_libs, &out->open_libs);
    if (sb_error_flags_has(flags, SB_ERROR_WRONG_TYPE)) {
        SB_LOG_WARN("Config field 'open_libs' is not a boolean, keeping default");
    }

    sb_table_close(ctx, root);

    SB_LOG_DEBUG("Loaded config from '%s'", path);
    return SB_STATUS_OK;
}

static void sb_config_prepend_package_path(Sb_Ctx ctx, sb_str path) {
    Sb_Table package = sb_table_open(ctx, SB_NULL_TABLE, "package", SB_NO_POS);
    if (sb_table_is_null(package)) {
        SB_LOG_WARN("No 'package' library loaded, package path '%s' ignored", path);
        return;
    }

    if (sb_push(ctx, package, "path", SB_NO_POS) == SB_TYPE_NONE) {
        sb_table_close(ctx, package);
        return;
    }
    std::string current(sb_top_string_length(ctx) + 1, '\0');
    sb_size len = 0;
    sb_extract_string(ctx, "", current.data(), current.size(), &len);
    current.resize(len);

    std::string updated = current.empty() ? std::string(path) : std::string(path) + ";" + current;
    sb_set_string(ctx, package, "path", SB_NO_POS, updated.c_str());

    sb_table_close(ctx, package);
}

SB_API sb_no_ret sb_config_apply(Sb_Ctx ctx, const Sb_Config* config)
{
    if (!config) return;

    sb_log_set_level(config->log_level);
    if (config->log_pattern[0]) sb_log_set_pattern(config->log_pattern);
    if (!config->log_file[0]) {
        sb_log_disable_file_sink();
    }
    else if (!sb_log_enable_file_sink(config->log_file)) {
        SB_LOG_ERROR("Could not open log file '%s'", config->log_file);
    }
    SB_LOG_DEBUG("Log level %s, file %s", sb_log_level_to_str(config->log_level),
                 config->log_file[0] ? config->log_file : "(console only)");

    if (ctx && config->package_path[0]) {
        sb_config_prepend_package_path(ctx, config->package_path);
    }
}
