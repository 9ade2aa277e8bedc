#ifndef QPARAM_DEBUG_HPP
#define QPARAM_DEBUG_HPP

#include <ctime>
#include <iostream>
#include <utility>

#include <fmt/format.h>

namespace qparam::debug {

struct DebugImpl {
    bool _breakLineOnEnd = true;

    DebugImpl() = default;

    ~DebugImpl() {
        if (_breakLineOnEnd) {
            operator<<('\n');
        }
    }

    template<typename T>
    DebugImpl &operator<<(T &&val) {
        std::cerr << std::forward<T>(val);
        return *this;
    }

    DebugImpl(const DebugImpl & /*unused*/) {}

    DebugImpl(DebugImpl &&other) noexcept {
        other._breakLineOnEnd = false;
    }
};

// writes to std::cerr, each log() statement ends with a line break
inline auto log() {
    return DebugImpl{};
}

class Timer {
    const char   *_message;
    const int     _alignMsg;
    const int     _alignClock;
    const int     _alignTime;
    const clock_t _begin;

public:
    Timer() = delete;
    explicit Timer(const char *message, const int alignMsg = 20, const int alignClock = 10, const int alignTime = 5) noexcept
        : _message(message), _alignMsg(alignMsg), _alignClock(alignClock), _alignTime(alignTime), _begin(clock()) {}
    Timer(const Timer &other)            = delete;
    Timer(Timer &&other)                 = delete;
    Timer &operator=(const Timer &other) = delete;
    Timer &operator=(Timer &&other)      = delete;
    ~Timer() noexcept {
        const clock_t diff          = clock() - _begin;
        const double  cpu_time_used = static_cast<double>(1000 * diff) / CLOCKS_PER_SEC;
        std::cout << fmt::format("{:<{}}:{:>{}} clock cycles or {:>{}} ms\n", _message, _alignMsg, diff, _alignClock, cpu_time_used, _alignTime) << std::flush;
    }
};

} // namespace qparam::debug

#define REQUIRE_MESSAGE(cond, msg) \
    do { \
        INFO(msg); \
        REQUIRE(cond); \
    } while ((void) 0, 0)

#define REQUIRE_NOTHROW_MESSAGE(cond, msg) \
    do { \
        INFO(msg); \
        REQUIRE_NOTHROW(cond); \
    } while ((void) 0, 0)

#define REQUIRE_THROWS_AS_MESSAGE(cond, exception, msg) \
    do { \
        INFO(msg); \
        REQUIRE_THROWS_AS(cond, exception); \
    } while ((void) 0, 0)

#endif // QPARAM_DEBUG_HPP
