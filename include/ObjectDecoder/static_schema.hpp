#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "well_known_types.hpp"

namespace ObjectDecoder {

namespace static_schema {


template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;


template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};


/* ######## Nullable targets: Null resets them instead of failing ######## */
template<class T>
concept NullableValue = is_specialization_of_v<T, std::optional>
                     || is_specialization_of_v<T, std::unique_ptr>;


template<class T>
concept IntegerValue = std::integral<T> && !std::same_as<T, bool>;

template<class T>
concept FloatValue = std::floating_point<T>;

// Types the coercion engine recognises by identity
template<class T>
concept WellKnownValue = std::same_as<T, Date> || std::same_as<T, Data>
                      || std::same_as<T, Url>  || std::same_as<T, Decimal>;

template<class T>
concept PrimitiveValue = std::same_as<T, bool> || IntegerValue<T> || FloatValue<T>
                      || std::same_as<T, std::string>;


template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
} && !std::same_as<T, std::string>;


template<class M>
concept StringKeyedMap = requires(M & m) {
    typename M::key_type;
    typename M::mapped_type;
    { m.try_emplace(std::declval<typename M::key_type>(), std::declval<typename M::mapped_type>()) };
    m.clear();
} && std::constructible_from<typename M::key_type, std::string>;


/* ######## Object type detection ######## */
template<typename T>
struct is_object_value {
    static constexpr bool value = [] {
        if constexpr (PrimitiveValue<T> || WellKnownValue<T>) {
            return false;
        } else if constexpr (std::ranges::range<T>) {
            return false;
        } else if constexpr (is_std_array<T>::value) {
            return false;
        } else if constexpr (!std::is_class_v<T>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<T>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept ObjectValue = is_object_value<C>::value;


/// Short name used in diagnostics.
template<class T>
constexpr std::string_view type_name() {
    if constexpr (std::same_as<T, bool>) return "bool";
    else if constexpr (std::same_as<T, char>) return "char";
    else if constexpr (std::same_as<T, std::int8_t>) return "int8_t";
    else if constexpr (std::same_as<T, std::uint8_t>) return "uint8_t";
    else if constexpr (std::same_as<T, std::int16_t>) return "int16_t";
    else if constexpr (std::same_as<T, std::uint16_t>) return "uint16_t";
    else if constexpr (std::same_as<T, std::int32_t>) return "int32_t";
    else if constexpr (std::same_as<T, std::uint32_t>) return "uint32_t";
    else if constexpr (std::same_as<T, std::int64_t>) return "int64_t";
    else if constexpr (std::same_as<T, std::uint64_t>) return "uint64_t";
    else if constexpr (std::same_as<T, long long>) return "long long";
    else if constexpr (std::same_as<T, unsigned long long>) return "unsigned long long";
    else if constexpr (std::same_as<T, long>) return "long";
    else if constexpr (std::same_as<T, unsigned long>) return "unsigned long";
    else if constexpr (IntegerValue<T>) return "integer";
    else if constexpr (std::same_as<T, float>) return "float";
    else if constexpr (std::same_as<T, double>) return "double";
    else if constexpr (FloatValue<T>) return "long double";
    else if constexpr (std::same_as<T, std::string>) return "string";
    else if constexpr (std::same_as<T, Date>) return "Date";
    else if constexpr (std::same_as<T, Data>) return "Data";
    else if constexpr (std::same_as<T, Url>) return "Url";
    else if constexpr (std::same_as<T, Decimal>) return "Decimal";
    else if constexpr (DynamicContainerTypeConcept<T> || is_std_array<T>::value) return "sequence";
    else if constexpr (StringKeyedMap<T> || ObjectValue<T>) return "mapping";
    else return "value";
}

} // namespace static_schema

} // namespace ObjectDecoder
