#pragma once
///@file

#include <exception>
#include <type_traits>
#include <utility>

/**
 * Runs `fn` when the scope ends. An exception thrown by `fn` propagates
 * unless the scope is already being unwound by another one, in which
 * case the process terminates.
 */
template<typename Fn>
class [[nodiscard("a Finally must be bound to a variable")]] Finally
{
    Fn fn;
    bool armed = true;

public:
    Finally(Fn fn)
        : fn(std::move(fn))
    {
    }

    Finally(const Finally &) = delete;

    Finally(Finally && other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : fn(std::move(other.fn))
        , armed(std::exchange(other.armed, false))
    {
    }

    ~Finally() noexcept(false)
    {
        if (!armed)
            return;
        if (std::uncaught_exceptions()) {
            try {
                fn();
            } catch (...) {
                std::terminate();
            }
        } else
            fn();
    }
};
