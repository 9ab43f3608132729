#pragma once

#include <tuple>
#include <type_traits>
#include <utility>

namespace Config {

/**
 * \page config Configuration Framework
 *
 * Each command of the frontend is configured through a set of option tags
 * passed to the \ref Options template. The tags define which entries exist,
 * their value types and their defaults, while parsing them from the command
 * line (or prompting for them interactively) is left to the frontend.
 *
 * Option tags are structures inheriting \ref Option (or one of the
 * convenience bases below) that provide:
 * - a type alias named \c type defining the data type of the entry
 * - a static member function named \c default_value returning the default
 * - a static C-string member named \c name used in diagnostics
 *
 * Since defaults are part of the tags, an Options instance is never in an
 * unconfigured state: frontends start from the defaults and only set what
 * the user overrode.
 */

/// Base option tag. All custom tags need to inherit this structure.
struct Option { Option() = delete; };

/// Boolean switch. Uses CRTP so that each switch gets a separate default_val, which must be defined by the user
template<typename CRTP>
struct BooleanOption : Option { using type = bool; static type default_val; static type default_value() { return default_val; } };

namespace detail {

// Helper type for easy lookup of a tagged element in a std::tuple
template<typename Tag, typename Data>
struct TaggedData {
    Data data;
};

} // namespace detail

/**
 * Template class defining and storing a set of options in a type-safe manner
 */
template<typename... Tags>
struct Options {
    using tags = std::tuple<Tags...>;

    using storage_type = std::tuple<detail::TaggedData<Tags, typename Tags::type>...>;
    storage_type storage { { Tags::default_value() }... };

    /// Get the value corresponding to the given option tag
    template<typename T>
    const typename T::type& get() const {
        static_assert(std::is_base_of_v<Option, T>, "Given type is not an option tag");
        return std::get<detail::TaggedData<T, typename T::type>>(storage).data;
    }

    template<typename T>
    void set(typename T::type data) {
        static_assert(std::is_base_of_v<Option, T>, "Given type is not an option tag");
        std::get<detail::TaggedData<T, typename T::type>>(storage).data = std::move(data);
    }
};

} // namespace Config
