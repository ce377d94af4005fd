#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace SDZarr
{
/**
 * @brief Success payload wrapper, produced by SDZarr::Ok()
 */
template <typename T>
struct OkValue
{
    T value;
};

/**
 * @brief Failure payload wrapper, produced by SDZarr::Err()
 */
template <typename E>
struct ErrValue
{
    E error;
};

template <typename T>
OkValue<typename std::decay<T>::type> Ok(T&& value)
{
    return {std::forward<T>(value)};
}

template <typename E>
ErrValue<typename std::decay<E>::type> Err(E&& error)
{
    return {std::forward<E>(error)};
}

namespace detail
{
template <typename E, typename = void>
struct HasToString : std::false_type
{
};

template <typename E>
struct HasToString<E, std::void_t<decltype(std::declval<const E&>().ToString())>> : std::true_type
{
};

template <typename E>
std::string DescribeError(const E& error)
{
    if constexpr (HasToString<E>::value)
        return error.ToString();
    else if constexpr (std::is_convertible<E, std::string>::value)
        return std::string(error);
    else
        return "Result holds an error";
}
}  // namespace detail

/**
 * @brief Holds exactly one of a success value or a failure value
 *
 * Used at every component boundary for expected failure modes (missing
 * metadata, unsupported formats, unknown coordinate systems). Unwrap() is
 * the only operation that throws.
 */
template <typename T, typename E>
class Result
{
  public:
    Result(const T& value) : mState(std::in_place_index<0>, value) {}
    Result(T&& value) : mState(std::in_place_index<0>, std::move(value)) {}

    template <typename U>
    Result(OkValue<U> ok) : mState(std::in_place_index<0>, std::move(ok.value))
    {
    }

    template <typename U>
    Result(ErrValue<U> err) : mState(std::in_place_index<1>, std::move(err.error))
    {
    }

    bool IsOk() const { return mState.index() == 0; }
    bool IsErr() const { return mState.index() == 1; }
    explicit operator bool() const { return IsOk(); }

    const T& Value() const
    {
        if (!IsOk())
            throw std::logic_error("Result::Value() called on an error: " + detail::DescribeError(Error()));
        return std::get<0>(mState);
    }

    T& Value()
    {
        if (!IsOk())
            throw std::logic_error("Result::Value() called on an error: " + detail::DescribeError(Error()));
        return std::get<0>(mState);
    }

    const E& Error() const
    {
        if (!IsErr())
            throw std::logic_error("Result::Error() called on a success value");
        return std::get<1>(mState);
    }

    /**
     * @brief Move the success value out, throwing std::runtime_error on failure
     */
    T Unwrap()
    {
        if (IsErr())
            throw std::runtime_error(detail::DescribeError(std::get<1>(mState)));
        return std::move(std::get<0>(mState));
    }

    T ValueOr(T fallback) const
    {
        if (IsOk())
            return std::get<0>(mState);
        return fallback;
    }

  private:
    std::variant<T, E> mState;
};
}  // namespace SDZarr
