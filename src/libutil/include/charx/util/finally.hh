#pragma once
///@file

#include <utility>

namespace charx {

/**
 * Runs a function when the enclosing scope is left, however that
 * happens. The function may throw unless the scope is being unwound
 * by another exception.
 */
template<typename Fn>
class [[nodiscard("Finally values must be used")]] Finally
{
    Fn fun;
    bool armed = true;

public:

    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    Finally(const Finally &) = delete;

    Finally(Finally && other)
        : fun(std::move(other.fun))
    {
        other.armed = false;
    }

    ~Finally() noexcept(false)
    {
        if (armed)
            fun();
    }
};

} // namespace charx
