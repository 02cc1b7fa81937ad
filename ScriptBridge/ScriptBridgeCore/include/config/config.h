/**
 * @file config.h
 * @brief Bridge configuration, loadable from a script file.
 *
 * A configuration file is an ordinary script that defines a global `config`
 * table:
 * @code
 * config = {
 *     log = { level = "debug", pattern = "[%l] %v", file = "bridge.log" },
 *     package_path = "./scripts/?.lua",
 *     open_libs = true,
 * }
 * @endcode
 *
 * @defgroup Config Configuration
 * @{
 */
#pragma once

#include "../core/log.h"
#include "../bridge/engine.h"

#ifdef __cplusplus
extern "C" {
#endif

#define SB_CONFIG_STR_CAP (256)

typedef struct Sb_Config {
  Sb_Log_Level log_level;
  char log_pattern[SB_CONFIG_STR_CAP];
  char log_file[SB_CONFIG_STR_CAP];      ///< Empty for console only.
  char package_path[SB_CONFIG_STR_CAP];  ///< Empty to keep the default search path.
  sb_bool open_libs;
} Sb_Config;

SB_API Sb_Config sb_config_default();

/**
 * @brief Runs a configuration file and reads its global `config` table into out.
 *
 * out is reset to the defaults first. Missing fields keep their defaults,
 * wrong-typed fields are logged and keep their defaults too.
 *
 * @return The engine status of running the file. SB_STATUS_ERR_INVALID when
 *         the file defines no `config` table.
 */
SB_API Sb_Status sb_config_load_file(Sb_Ctx ctx, sb_str path, Sb_Config* out);

/** @brief Applies log settings and the package path to a context. */
SB_API sb_no_ret sb_config_apply(Sb_Ctx ctx, const Sb_Config* config);

#ifdef __cplusplus
}
#endif
/** @} */
