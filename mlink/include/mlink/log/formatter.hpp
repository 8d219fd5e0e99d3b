#pragma once

#include <magic_enum/magic_enum.hpp>
#include <reflect>

#include <concepts>
#include <format>
#include <ranges>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mlink::log::detail
{
    template<typename T>
    consteval auto qualified_type_name() -> std::string_view
    {
        return std::source_location::current().function_name();
    }

    template<typename T>
    consteval auto is_std_type() -> bool
    {
        return qualified_type_name<std::remove_cvref_t<T>>().contains("T = std::");
    }

    template<typename T>
    concept Reflectable = std::is_class_v<T> && std::is_aggregate_v<T> && !std::ranges::range<T> && !is_std_type<T>();

    template<typename T>
    concept ScopedEnum = std::is_scoped_enum_v<T> && !is_std_type<T>();
}

// "{ member: value, ... }", members without a formatter print as "-"
template<mlink::log::detail::Reflectable T>
struct std::formatter<T>
{
    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }
        return it;
    }

    template<typename Ctx>
    auto format(const T& t, Ctx& ctx) const -> Ctx::iterator
    {
        auto out{ std::format_to(ctx.out(), "{{ ") };
        [&]<size_t... Is>(std::index_sequence<Is...>) {
            ((out = formatMember<Is>(t, out)), ...);
        }(std::make_index_sequence<reflect::size<T>()>{});
        return std::format_to(out, " }}");
    }

  private:
    template<size_t I, typename Out>
    static auto formatMember(const T& t, Out out) -> Out
    {
        using Member = std::remove_cvref_t<decltype(reflect::get<I>(t))>;

        if constexpr (I > 0) {
            out = std::format_to(out, ", ");
        }
        out = std::format_to(out, "{}: ", reflect::member_name<I, T>());

        if constexpr (std::formattable<Member, char>) {
            return std::format_to(out, "{}", reflect::get<I>(t));
        }
        else {
            return std::format_to(out, "-");
        }
    }
};

template<mlink::log::detail::ScopedEnum T>
struct std::formatter<T>
{
    bool verbose{ false };

    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it == ctx.end()) {
            return it;
        }

        if (*it == 'v') {
            verbose = true;
            ++it;
        }

        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }

        return it;
    }

    template<typename Ctx>
    auto format(T t, Ctx& ctx) const -> Ctx::iterator
    {
        auto name{ magic_enum::enum_name(t) };
        if (name.empty()) {
            return std::format_to(ctx.out(), "{}", magic_enum::enum_integer(t));
        }
        if (verbose) {
            return std::format_to(ctx.out(), "{}:{}", magic_enum::enum_type_name<T>(), name);
        }
        return std::format_to(ctx.out(), "{}", name);
    }
};
