#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>
#include <initializer_list>
#include <type_traits>

namespace ObjectDecoder {
namespace path {

struct PathElement {
    static constexpr std::size_t NOT_AN_INDEX = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NOT_AN_INDEX;   // sequences
    std::string field_name;                   // mappings; owned, keys may come from transient buffers

    PathElement() = default;

    // For `{index}`
    PathElement(std::size_t index)
        : array_index(index)
    {}

    // For `{"key"}`
    PathElement(std::string_view key)
        : field_name(key)
    {}
    PathElement(const char * key)
        : field_name(key)
    {}

    bool is_index() const { return array_index != NOT_AN_INDEX; }
    bool is_field() const { return array_index == NOT_AN_INDEX; }

    friend bool operator==(const PathElement &, const PathElement &) = default;
};

/// Route from the decode root to the node currently inspected.
class CodingPath {
public:
    CodingPath() = default;

    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0)
    explicit CodingPath(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElement{std::string_view(arg)};
            } else if constexpr (std::is_integral_v<ArgT>){
                return PathElement{static_cast<std::size_t>(arg)};
            } else {
                static_assert(!sizeof(arg), "Use integers or str-compatible segments in CodingPath construction");
            }
        };
        (storage.push_back(toPathElement(args)), ...);
    }

    void push_child(PathElement el) {
        storage.push_back(std::move(el));
    }
    void pop() {
        storage.pop_back();
    }
    void truncate(std::size_t length) {
        storage.resize(length);
    }

    std::size_t length() const { return storage.size(); }
    bool empty() const { return storage.empty(); }

    const PathElement & operator[](std::size_t i) const { return storage[i]; }

    auto begin() const { return storage.begin(); }
    auto end() const { return storage.end(); }

    CodingPath appending(PathElement el) const {
        CodingPath p = *this;
        p.push_child(std::move(el));
        return p;
    }

    // JSONPath-like rendering: $.users[2].name
    std::string to_string() const {
        std::string out = "$";
        for(const PathElement & el : storage) {
            if(el.is_field()) {
                out += ".";
                out += el.field_name;
            } else {
                out += "[" + std::to_string(el.array_index) + "]";
            }
        }
        return out;
    }

    friend bool operator==(const CodingPath &, const CodingPath &) = default;

private:
    std::vector<PathElement> storage;
};

} // namespace path

using path::CodingPath;
using path::PathElement;

} // namespace ObjectDecoder
