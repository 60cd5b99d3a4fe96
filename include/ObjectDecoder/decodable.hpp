#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "decoder.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "date_formats.hpp"

namespace ObjectDecoder {

/* ######## Aggregates: one keyed read per member ######## */

template<class T>
    requires (static_schema::ObjectValue<T> || introspection::hasStructMeta<T>)
struct Decodable<T> {
    static bool decode(T & out, Decoder & decoder) {
        KeyedContainer c;
        if(!decoder.keyed_container(c)) {
            return false;
        }
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (decode_field<I>(out, c) && ...);
        }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    }

private:
    template<std::size_t I>
    static bool decode_field(T & out, KeyedContainer & c) {
        if constexpr (introspection::structureElementIsExcluded<I, T>()) {
            return true;
        } else {
            using Elem = introspection::structureElementTypeByIndex<I, T>;
            constexpr std::string_view key = introspection::structureElementKeyByIndex<I, T>();

            auto & field = options::detail::annotation_meta_getter<Elem>::getRef(
                introspection::getStructElementByIndex<I>(out));
            using V = std::remove_cvref_t<decltype(field)>;

            if constexpr (static_schema::is_specialization_of_v<V, std::optional>) {
                return c.decode_if_present(key, field);
            } else if constexpr (static_schema::NullableValue<V>) {
                if(!c.contains(key)) {
                    field.reset();
                    return true;
                }
                return c.decode(key, field);
            } else {
                return c.decode(key, field);
            }
        }
    }
};


/* ######## Nullable wrappers ######## */

template<class T>
struct Decodable<std::optional<T>> {
    static bool decode(std::optional<T> & out, Decoder & decoder) {
        SingleValueContainer c = decoder.single_value_container();
        if(c.decode_nil()) {
            out.reset();
            return true;
        }
        out.emplace();
        if(!c.decode(*out)) {
            out.reset();
            return false;
        }
        return true;
    }
};

template<class T>
struct Decodable<std::unique_ptr<T>> {
    static bool decode(std::unique_ptr<T> & out, Decoder & decoder) {
        SingleValueContainer c = decoder.single_value_container();
        if(c.decode_nil()) {
            out.reset();
            return true;
        }
        auto value = std::make_unique<T>();
        if(!c.decode(*value)) {
            return false;
        }
        out = std::move(value);
        return true;
    }
};


/* ######## Sequences ######## */

template<class C>
    requires static_schema::DynamicContainerTypeConcept<C>
struct Decodable<C> {
    static bool decode(C & out, Decoder & decoder) {
        IndexedContainer c;
        if(!decoder.indexed_container(c)) {
            return false;
        }
        out.clear();
        while(!c.is_at_end()) {
            typename C::value_type element{};
            if(!c.decode(element)) {
                return false;
            }
            out.push_back(std::move(element));
        }
        return true;
    }
};

template<class T, std::size_t N>
struct Decodable<std::array<T, N>> {
    static bool decode(std::array<T, N> & out, Decoder & decoder) {
        IndexedContainer c;
        if(!decoder.indexed_container(c)) {
            return false;
        }
        for(std::size_t i = 0; i < N; i ++) {
            if(!c.decode(out[i])) {
                return false;
            }
        }
        if(!c.is_at_end()) {
            return decoder.fail_data_corrupted(
                std::format("Expected {} elements but the sequence holds {}.", N, c.count()));
        }
        return true;
    }
};


/* ######## String-keyed maps ######## */

template<class M>
    requires static_schema::StringKeyedMap<M>
struct Decodable<M> {
    static bool decode(M & out, Decoder & decoder) {
        KeyedContainer c;
        if(!decoder.keyed_container(c)) {
            return false;
        }
        out.clear();
        for(const std::string & key : c.all_keys()) {
            typename M::mapped_type value{};
            if(!c.decode(key, value)) {
                return false;
            }
            out.try_emplace(typename M::key_type(key), std::move(value));
        }
        return true;
    }
};


/* ######## Raw forms of the well-known types ######## */

// {year, month, day[, hour, minute, second, nanosecond]} in UTC
template<>
struct Decodable<Date> {
    static bool decode(Date & out, Decoder & decoder) {
        KeyedContainer c;
        if(!decoder.keyed_container(c)) {
            return false;
        }
        int year = 0;
        unsigned month = 0, day = 0;
        std::optional<int> hour, minute, second;
        std::optional<std::int64_t> nanosecond;
        if(!c.decode("year", year) || !c.decode("month", month) || !c.decode("day", day)
           || !c.decode_if_present("hour", hour) || !c.decode_if_present("minute", minute)
           || !c.decode_if_present("second", second) || !c.decode_if_present("nanosecond", nanosecond)) {
            return false;
        }
        std::optional<Date> date = date_formats::from_civil(year, month, day,
                                                            hour.value_or(0), minute.value_or(0),
                                                            second.value_or(0), nanosecond.value_or(0));
        if(!date) {
            return decoder.fail_data_corrupted("Calendar fields do not form a representable date.");
        }
        out = *date;
        return true;
    }
};

// Sequence of byte values
template<>
struct Decodable<Data> {
    static bool decode(Data & out, Decoder & decoder) {
        IndexedContainer c;
        if(!decoder.indexed_container(c)) {
            return false;
        }
        out.clear();
        out.reserve(c.count());
        while(!c.is_at_end()) {
            std::uint8_t b = 0;
            if(!c.decode(b)) {
                return false;
            }
            out.push_back(std::byte{b});
        }
        return true;
    }
};

} // namespace ObjectDecoder
