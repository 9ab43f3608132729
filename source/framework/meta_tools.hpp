#pragma once

#include <array>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace Meta {

template<typename... T>
using void_t = void;

// Evaluate to true if T is an instantiation of the given std::array-like template
template<typename T, template<typename, std::size_t> class Template>
struct is_instantiation_of2 : std::false_type {};
template<typename Arg1, std::size_t Arg2, template<typename, std::size_t> class Template>
struct is_instantiation_of2<Template<Arg1, Arg2>, Template> : std::true_type {};

template<typename T>
constexpr auto is_std_array_v = is_instantiation_of2<T, std::array>::value;

/**
 * Immediately invokes the given callable. Used to initialize const
 * variables from a block of statements:
 *
 *   const auto config = Meta::invoke([&]() { ... return value; });
 */
template<typename F, typename... Args>
decltype(auto) invoke(F&& f, Args&&... args) noexcept(noexcept(std::forward<F>(f)(std::forward<Args>(args)...))) {
    return std::forward<F>(f)(std::forward<Args>(args)...);
}

} // namespace Meta
