#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"
#include "options.hpp"

namespace ObjectDecoder {

/// Manual field description for types PFR cannot reflect (or that want
/// different keys than their member names):
///
///     template<> struct ObjectDecoder::StructMeta<User> {
///         using Fields = StructFields<
///             Field<&User::id, "id">,
///             Field<&User::name, "full_name">
///         >;
///     };
template <class T>
struct StructMeta {

};
template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = key;
    static constexpr  T C::* MemberP = MPtr;
};


template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    // Options of a reflected member come from its Annotated<> wrapper only
    template<std::size_t Index>
    using structureElementOptions = OptionsPack<>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... Field>
struct is_fields_pack<StructFields<Field...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;


template <class T>
requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        using Field = std::tuple_element_t<Index, Fields>;
        return (s.*(Field::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<std::size_t Index>
    using structureElementOptions = typename std::tuple_element_t<Index, Fields>::OptionsP;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();
};

}

template<class T>
inline constexpr bool hasStructMeta = detail::has_struct_meta_specialization<std::remove_cv_t<T>>;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;


// Field<> options first, then the member's own Annotated<> options
template<std::size_t Index, class StructT>
using structureElementOptions = options::detail::field_options<
    typename options::detail::merge_options<
        typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementOptions<Index>,
        typename options::detail::annotation_meta_getter<structureElementTypeByIndex<Index, StructT>>::OptionsP
    >::type
>;

template<std::size_t Index, class StructT>
consteval std::string_view structureElementKeyByIndex() {
    using Opts = structureElementOptions<Index, StructT>;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
        return KeyOpt::desc.toStringView();
    } else {
        return detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;
    }
}

template<std::size_t Index, class StructT>
consteval bool structureElementIsExcluded() {
    return structureElementOptions<Index, StructT>::template has_option<options::detail::exclude_tag>;
}

}
}
