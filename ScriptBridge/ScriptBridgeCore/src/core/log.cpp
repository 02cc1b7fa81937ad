#include "../../include/core/log.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#include <memory>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

static const char* s_default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

static const struct {
    Sb_Log_Level level;
    spdlog::level::level_enum spd;
    const char* name;
} s_levels[] = {
    { SB_LOG_LVL_TRACE, spdlog::level::trace, "trace" },
    { SB_LOG_LVL_DEBUG, spdlog::level::debug, "debug" },
    { SB_LOG_LVL_INFO, spdlog::level::info, "info" },
    { SB_LOG_LVL_WARN, spdlog::level::warn, "warn" },
    { SB_LOG_LVL_ERROR, spdlog::level::err, "error" },
    { SB_LOG_LVL_CRITICAL, spdlog::level::critical, "critical" },
};

static spdlog::level::level_enum sb_to_spdlog(Sb_Log_Level lvl) {
    for (const auto& entry : s_levels) {
        if (entry.level == lvl) return entry.spd;
    }
    return spdlog::level::off;
}

struct SbLogState {
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    std::string file_path;
    std::string pattern = s_default_pattern;
};

static SbLogState& sb_log_state() {
    static SbLogState state;
    if (!state.logger) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        state.logger = std::make_shared<spdlog::logger>("SBLOG", console_sink);
        state.logger->set_level(spdlog::level::info);
        state.logger->set_pattern(s_default_pattern);
    }
    return state;
}

static void sb_drop_file_sink(SbLogState& state) {
    if (!state.file_sink) return;
    auto& sinks = state.logger->sinks();
    for (auto it = sinks.begin(); it != sinks.end(); ++it) {
        if (*it == state.file_sink) {
            sinks.erase(it);
            break;
        }
    }
    state.file_sink.reset();
    state.file_path.clear();
}

int sb_log_enable_file_sink(const char* filename) {
    if (!filename || !*filename) return 0;

    SbLogState& state = sb_log_state();
    if (state.file_sink && state.file_path == filename) return 1;

    // A context reconfigured with another file moves the sink rather than stacking a second one
    sb_drop_file_sink(state);

    try {
        state.file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
    }
    catch (const spdlog::spdlog_ex& ex) {
        state.logger->error("Failed to add file sink '{}': {}", filename, ex.what());
        return 0;
    }

    state.file_sink->set_pattern(state.pattern);
    state.logger->sinks().push_back(state.file_sink);
    state.file_path = filename;
    return 1;
}

void sb_log_disable_file_sink() {
    sb_drop_file_sink(sb_log_state());
}

const char* sb_log_file_path() {
    const SbLogState& state = sb_log_state();
    return state.file_sink ? state.file_path.c_str() : NULL;
}

void sb_log_set_pattern(const char* pattern) {
    if (!pattern || !*pattern) return;
    SbLogState& state = sb_log_state();
    state.pattern = pattern;
    state.logger->set_pattern(state.pattern);
}

void sb_log_set_level(Sb_Log_Level level) {
    // sinks stay at trace, filtering happens once on the logger
    sb_log_state().logger->set_level(sb_to_spdlog(level));
}

Sb_Log_Level sb_log_get_level() {
    spdlog::level::level_enum current = sb_log_state().logger->level();
    for (const auto& entry : s_levels) {
        if (entry.spd == current) return entry.level;
    }
    return SB_LOG_LVL_CRITICAL;
}

void sb_logf(Sb_Log_Level level, const char* fmt, ...) {
    if (!fmt) return;

    auto& logger = sb_log_state().logger;
    spdlog::level::level_enum spd = sb_to_spdlog(level);
    if (!logger->should_log(spd)) return;

    va_list args;
    va_start(args, fmt);

    char small[256];
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(small, sizeof(small), fmt, args_copy);
    va_end(args_copy);

    if (size < 0) {
        va_end(args);
        return;
    }

    if ((size_t)size < sizeof(small)) {
        va_end(args);
        logger->log(spd, std::string_view(small, (size_t)size));
        return;
    }

    std::string buffer((size_t)size + 1, '\0');
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);
    buffer.pop_back();

    logger->log(spd, buffer);
}

void sb_log(Sb_Log_Level level, const char* str) {
    if (!str) return;
    sb_log_state().logger->log(sb_to_spdlog(level), std::string_view(str, strlen(str)));
}

int sb_log_level_from_str(const char* name, Sb_Log_Level* out) {
    if (!name || !out) return 0;

    for (const auto& entry : s_levels) {
        if (strcmp(entry.name, name) == 0) {
            *out = entry.level;
            return 1;
        }
    }
    return 0;
}

const char* sb_log_level_to_str(Sb_Log_Level level) {
    for (const auto& entry : s_levels) {
        if (entry.level == level) return entry.name;
    }
    return "off";
}
