#pragma once

#include <cstdint>
#include <format>
#include <iostream>
#include <mutex>
#include <ostream>
#include <print>
#include <string_view>

namespace stamp {

enum class Verbosity : uint8_t { QUIET, NORMAL, TRACE };

/**
 * @brief Line-oriented diagnostics sink.
 *
 * Lines are written with std::println and serialized so that rules evaluated on different
 * threads never interleave output.
 */
class Log {
public:
    explicit Log(Verbosity verbosity = Verbosity::NORMAL, std::ostream &out = std::cerr)
        : verbosity_(verbosity), out_(&out) {
    }

    Verbosity verbosity() const {
        return verbosity_;
    }
    bool tracing() const {
        return verbosity_ == Verbosity::TRACE;
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args &&...args) {
        if (verbosity_ != Verbosity::QUIET)
            emit("warning: ", std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args) {
        if (verbosity_ != Verbosity::QUIET)
            emit("", std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args &&...args) {
        if (tracing())
            emit("trace: ", std::format(fmt, std::forward<Args>(args)...));
    }

    Log(const Log &) = delete;
    Log &operator=(const Log &) = delete;

private:
    void emit(std::string_view prefix, std::string_view line) {
        std::lock_guard lock(mtx_);
        std::println(*out_, "{}{}", prefix, line);
    }

    Verbosity verbosity_;
    std::ostream *out_;
    std::mutex mtx_;
};

} // namespace stamp
