#pragma once

#include "scriptbridge.h"

#include <string>
#include <format>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sb {

namespace log {

    enum class Level {
        L_TRACE,
        L_DEBUG,
        L_INFO,
        L_WARN,
        L_ERROR,
        L_CRITICAL
    };

    inline Sb_Log_Level to_c_level(Level lvl) {
        switch (lvl) {
            case Level::L_TRACE:    return SB_LOG_LVL_TRACE;
            case Level::L_DEBUG:    return SB_LOG_LVL_DEBUG;
            case Level::L_INFO:     return SB_LOG_LVL_INFO;
            case Level::L_WARN:     return SB_LOG_LVL_WARN;
            case Level::L_ERROR:    return SB_LOG_LVL_ERROR;
            case Level::L_CRITICAL: return SB_LOG_LVL_CRITICAL;
        }
        return SB_LOG_LVL_INFO;
    }

    template <class... Args>
    void log(Level lvl, std::format_string<Args...> fmt_str, Args&&... args) {
        Sb_Log_Level level = to_c_level(lvl);

        if (level < sb_log_get_level()) return;

        std::string formatted_message = std::format(fmt_str, std::forward<Args>(args)...);

        sb_log(level, formatted_message.c_str());
    }

    inline bool enable_file_sink(const std::string& filename) {
        return sb_log_enable_file_sink(filename.c_str()) != 0;
    }

    inline void set_pattern(const std::string& pattern) {
        sb_log_set_pattern(pattern.c_str());
    }

    inline void set_level(Level lvl) {
        sb_log_set_level(to_c_level(lvl));
    }

    template <class... Args>
    void trace(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    void debug(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    void info(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    void warn(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_WARN, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    void error(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    void critical(std::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::L_CRITICAL, fmt_str, std::forward<Args>(args)...);
    }

};

class Error : public std::runtime_error {
public:
    Error(Sb_Status status, const std::string& msg) : std::runtime_error(msg), m_status(status) {}

    Sb_Status status() const { return m_status; }
private:
    Sb_Status m_status;
};

/**
 * @brief Owning wrapper around a bridge context.
 * Script failures are raised as sb::Error.
 */
class Context {
    Sb_Ctx m_ctx;
public:
    Context() : m_ctx(sb_create_ctx()) {
        if (!m_ctx) throw Error(SB_STATUS_ERR_MEMORY, "Could not create a script context");
    }

    explicit Context(const Sb_Config& config) : m_ctx(sb_create_ctx_with_config(&config)) {
        if (!m_ctx) throw Error(SB_STATUS_ERR_MEMORY, "Could not create a script context");
    }

    ~Context() {
        if (m_ctx) sb_destroy_ctx(m_ctx);
    }

    Context(Context&& other) noexcept : m_ctx(std::exchange(other.m_ctx, nullptr)) {}

    Context& operator=(Context&& other) noexcept {
        if (this != &other) {
            if (m_ctx) sb_destroy_ctx(m_ctx);
            m_ctx = std::exchange(other.m_ctx, nullptr);
        }
        return *this;
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    Sb_Ctx raw() const { return m_ctx; }

    void do_string(const std::string& code) {
        check(sb_do_string(m_ctx, code.c_str()), "do_string");
    }

    void do_file(const std::string& path) {
        check(sb_do_file(m_ctx, path.c_str()), "do_file");
    }

    sb_stack_idx stack_size() const { return sb_stack_size(m_ctx); }

private:
    void check(Sb_Status status, const char* what) {
        Sb_Status out_status = SB_STATUS_OK;
        sb_str out_msg = nullptr;
        if (!sb_check(m_ctx, status, what, &out_status, &out_msg)) {
            throw Error(out_status, out_msg ? out_msg : sb_status_to_str(out_status));
        }
    }
};

template<typename T>
struct Extracted {
    T value{};
    Sb_Error_Flags flags = SB_ERROR_NONE;

    bool ok() const { return flags == SB_ERROR_NONE; }
    bool usable() const { return sb_error_flags_usable(flags); }
};

/**
 * @brief Extracts the value on top of the stack and pops it.
 *
 * Supports the host numeric kinds, bool, std::string and void*.
 */
template<typename T>
Extracted<T> extract(Sb_Ctx ctx, std::optional<T> def = std::nullopt) {
    Extracted<T> result;
    [[maybe_unused]] const T* def_ptr = def ? &*def : nullptr;

    if constexpr (std::is_same_v<T, bool>) {
        sb_bool def_b = def ? (*def ? sb_true : sb_false) : sb_false;
        sb_bool out = sb_false;
        result.flags = sb_extract_boolean(ctx, def ? &def_b : nullptr, &out);
        result.value = out != 0;
    }
    else if constexpr (std::is_same_v<T, sb_int32>) {
        result.flags = sb_extract_integer(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, sb_int64>) {
        result.flags = sb_extract_long(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, sb_float>) {
        result.flags = sb_extract_float(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, sb_double>) {
        result.flags = sb_extract_double(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, sb_long_double>) {
        result.flags = sb_extract_long_double(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, sb_ptr>) {
        result.flags = sb_extract_pointer(ctx, def_ptr, &result.value);
    }
    else if constexpr (std::is_same_v<T, std::string>) {
        sb_size len = sb_top_string_length(ctx);
        result.value.assign(len + 1, '\0');
        sb_size written = 0;
        result.flags = sb_extract_string(ctx, nullptr, result.value.data(), result.value.size(), &written);
        result.value.resize(written);
        if (result.flags != SB_ERROR_NONE && def) {
            result.value = *def;
            result.flags &= ~SB_ERROR_FATAL;
        }
    }
    else {
        static_assert(!sizeof(T), "Unsupported extraction type");
    }

    return result;
}

/** @brief Table handle closed on scope exit. */
class TableScope {
    Sb_Ctx m_ctx = nullptr;
    Sb_Table m_table = SB_NULL_TABLE;
public:
    /** @brief Opens a new empty table. */
    explicit TableScope(Sb_Ctx ctx)
        : m_ctx(ctx), m_table(sb_table_open(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS)) {}

    TableScope(Sb_Ctx ctx, const std::string& global)
        : m_ctx(ctx), m_table(sb_table_open(ctx, SB_NULL_TABLE, global.c_str(), SB_NO_POS)) {}

    TableScope(const TableScope& parent, const std::string& key)
        : m_ctx(parent.m_ctx), m_table(sb_table_open(parent.m_ctx, parent.m_table, key.c_str(), SB_NO_POS)) {}

    TableScope(const TableScope& parent, sb_int position)
        : m_ctx(parent.m_ctx), m_table(sb_table_open(parent.m_ctx, parent.m_table, nullptr, position)) {}

    ~TableScope() { close(); }

    TableScope(TableScope&& other) noexcept
        : m_ctx(other.m_ctx), m_table(std::exchange(other.m_table, SB_NULL_TABLE)) {}

    TableScope& operator=(TableScope&&) = delete;
    TableScope(const TableScope&) = delete;
    TableScope& operator=(const TableScope&) = delete;

    bool valid() const { return !sb_table_is_null(m_table); }
    explicit operator bool() const { return valid(); }

    Sb_Ctx ctx() const { return m_ctx; }
    Sb_Table raw() const { return m_table; }

    /** @brief The handle stays open when the close is refused. */
    bool close() {
        if (sb_table_is_null(m_table)) return false;
        if (!sb_table_close(m_ctx, m_table)) return false;
        m_table = SB_NULL_TABLE;
        return true;
    }

    bool has(const std::string& key) const {
        return sb_exists(m_ctx, m_table, key.c_str(), SB_NO_POS) != 0;
    }

    template<typename T>
    Extracted<T> get(const std::string& key, std::optional<T> def = std::nullopt) const {
        sb_push(m_ctx, m_table, key.c_str(), SB_NO_POS);
        return extract<T>(m_ctx, std::move(def));
    }

    template<typename T>
    Extracted<T> get(sb_int position, std::optional<T> def = std::nullopt) const {
        sb_push(m_ctx, m_table, nullptr, position);
        return extract<T>(m_ctx, std::move(def));
    }

    template<typename T>
    bool set(const std::string& key, const T& value) {
        return set_impl(key.c_str(), SB_NO_POS, value);
    }

    template<typename T>
    bool set(sb_int position, const T& value) {
        return set_impl(nullptr, position, value);
    }

    sb_size length() const { return sb_table_length(m_ctx, m_table); }
    sb_size array_length() const { return sb_table_array_length(m_ctx, m_table); }

private:
    template<typename T>
    bool set_impl(sb_str key, sb_int position, const T& value) {
        if constexpr (std::is_same_v<T, bool>)
            return sb_set_boolean(m_ctx, m_table, key, position, value ? sb_true : sb_false) != 0;
        else if constexpr (std::is_same_v<T, sb_int32>)
            return sb_set_integer(m_ctx, m_table, key, position, value) != 0;
        else if constexpr (std::is_same_v<T, sb_int64>)
            return sb_set_long(m_ctx, m_table, key, position, value) != 0;
        else if constexpr (std::is_floating_point_v<T>)
            return sb_set_double(m_ctx, m_table, key, position, static_cast<sb_double>(value)) != 0;
        else if constexpr (std::is_same_v<T, std::string>)
            return sb_set_string(m_ctx, m_table, key, position, value.c_str()) != 0;
        else if constexpr (std::is_convertible_v<T, sb_str>)
            return sb_set_string(m_ctx, m_table, key, position, value) != 0;
        else
            static_assert(!sizeof(T), "Unsupported value type");
    }
};

/** @brief Registry reference released on destruction. */
class Reference {
    Sb_Ctx m_ctx = nullptr;
    Sb_Ref m_ref = SB_NO_REF;
public:
    Reference() = default;

    Reference(Sb_Ctx ctx, Sb_Ref ref) : m_ctx(ctx), m_ref(ref) {}

    /** @brief References the value on top of the stack, popping it. */
    static Reference from_top(Sb_Ctx ctx) {
        return Reference(ctx, sb_reference_for(ctx, SB_NULL_TABLE, nullptr, SB_NO_POS));
    }

    static Reference to_global(Sb_Ctx ctx, const std::string& name) {
        return Reference(ctx, sb_reference_for(ctx, SB_NULL_TABLE, name.c_str(), SB_NO_POS));
    }

    ~Reference() { reset(); }

    Reference(Reference&& other) noexcept
        : m_ctx(other.m_ctx), m_ref(std::exchange(other.m_ref, SB_NO_REF)) {}

    Reference& operator=(Reference&& other) noexcept {
        if (this != &other) {
            reset();
            m_ctx = other.m_ctx;
            m_ref = std::exchange(other.m_ref, SB_NO_REF);
        }
        return *this;
    }

    Reference(const Reference&) = delete;
    Reference& operator=(const Reference&) = delete;

    Sb_Ref raw() const { return m_ref; }
    bool live() const { return m_ctx && sb_reference_is_live(m_ctx, m_ref); }

    Sb_Type push() const { return sb_reference_to_top(m_ctx, m_ref); }

    void reset() {
        if (m_ctx && m_ref != SB_NO_REF && m_ref != SB_REF_NIL) {
            sb_unreference(m_ctx, m_ref);
        }
        m_ref = SB_NO_REF;
    }
};

/** @brief Callable handle closed on scope exit. */
class CallScope {
    Sb_Ctx m_ctx = nullptr;
    Sb_Call m_call{};
public:
    CallScope(Sb_Ctx ctx, const std::string& global)
        : m_ctx(ctx), m_call(sb_call_open(ctx, SB_NULL_TABLE, global.c_str(), SB_NO_POS)) {}

    CallScope(const TableScope& table, const std::string& key)
        : m_ctx(table.ctx()), m_call(sb_call_open(table.ctx(), table.raw(), key.c_str(), SB_NO_POS)) {}

    CallScope(Sb_Ctx ctx, const Reference& ref)
        : m_ctx(ctx), m_call(sb_call_open_ref(ctx, ref.raw())) {}

    ~CallScope() { close(); }

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

    bool valid() const { return sb_call_state(&m_call) != SB_CALL_STATE_UNBOUND; }
    explicit operator bool() const { return valid(); }

    Sb_Call_State state() const { return sb_call_state(&m_call); }
    sb_uint64 identity() const { return sb_call_identity(&m_call); }

    template<typename T>
    CallScope& arg(const T& value) {
        bool pushed = false;
        if constexpr (std::is_same_v<T, bool>)
            pushed = sb_call_push_boolean(m_ctx, &m_call, value ? sb_true : sb_false);
        else if constexpr (std::is_same_v<T, sb_int32>)
            pushed = sb_call_push_integer(m_ctx, &m_call, value);
        else if constexpr (std::is_same_v<T, sb_int64>)
            pushed = sb_call_push_long(m_ctx, &m_call, value);
        else if constexpr (std::is_floating_point_v<T>)
            pushed = sb_call_push_double(m_ctx, &m_call, static_cast<sb_double>(value));
        else if constexpr (std::is_same_v<T, std::string>)
            pushed = sb_call_push_string(m_ctx, &m_call, value.c_str());
        else if constexpr (std::is_convertible_v<T, sb_str>)
            pushed = sb_call_push_string(m_ctx, &m_call, value);
        else
            static_assert(!sizeof(T), "Unsupported argument type");

        if (!pushed) throw Error(SB_STATUS_ERR_INVALID, "Argument pushed to an unbound callable");
        return *this;
    }

    /** @brief Invokes and returns the number of results left on the stack. */
    sb_int invoke(sb_int n_results = SB_MULTRET) {
        Sb_Error_Info info{};
        sb_int results = 0;
        if (sb_call_invoke(m_ctx, &m_call, n_results, &info, &results) != SB_ERROR_NONE) {
            throw Error(info.status, info.message ? info.message : sb_status_to_str(info.status));
        }
        return results;
    }

    /** @brief Invokes expecting one result of type T. */
    template<typename T>
    T call() {
        invoke(1);
        Extracted<T> result = extract<T>(m_ctx);
        if (!result.usable()) {
            throw Error(SB_STATUS_ERR_RUNTIME, "Call result has an unexpected type");
        }
        return result.value;
    }

    bool close() {
        if (!valid()) return false;
        return sb_call_close(m_ctx, &m_call) != 0;
    }
};

} // namespace sb
