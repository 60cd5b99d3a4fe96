#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"

namespace ObjectDecoder {

/// Compile-time options attached to struct members through Annotated<T, Opts...>
/// or Field<&T::member, "key", Opts...>.
namespace options {

namespace detail {
struct key_tag{};
struct exclude_tag{};
}

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ ObjectDecoder ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Member is left untouched by the decoder
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

using no_options = field_options<OptionsPack<>>;


template<class Field>
struct annotation_meta {
    using value_t = Field;
    using OptionsP = OptionsPack<>;
    using options  = no_options;

    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

} // namespace detail

} //namespace options

template<class Field>
using AnnotatedValue = typename options::detail::annotation_meta_getter<Field>::value_t;

} // namespace ObjectDecoder
