#pragma once

#include <querygraph/core/error.hpp>

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace querygraph {

// ---------------------------------------------------------------------------
// Result<T, E>: either a value or an error. Graph mutations, loaders and
// the CLI return Result<..., Error>; parsers of single keywords return
// Result<..., std::string> and let the caller attach context.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() on an Err result");
        return std::get<0>(state_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() on an Err result");
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an Ok result");
        return std::get<1>(state_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an Ok result");
        return std::get<1>(std::move(state_));
    }

private:
    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg&& arg) : state_(tag, std::forward<Arg>(arg)) {}

    std::variant<T, E> state_;
};

// Operations that succeed without producing a value.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an Ok result");
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an Ok result");
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace querygraph
