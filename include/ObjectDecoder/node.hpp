#pragma once

#include <charconv>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <variant>
#include <type_traits>
#include <concepts>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace ObjectDecoder {

enum class NodeKind {
    Null,
    Bool,
    Number,
    Text,
    Sequence,
    Mapping
};

constexpr std::string_view kind_to_string(NodeKind k) {
    switch(k) {
    case NodeKind::Null: return "null"; break;
    case NodeKind::Bool: return "bool"; break;
    case NodeKind::Number: return "number"; break;
    case NodeKind::Text: return "text"; break;
    case NodeKind::Sequence: return "sequence"; break;
    case NodeKind::Mapping: return "mapping"; break;
    }
    return "N/A";
}


/// Numeric payload, stored in the representation the boundary adapter saw.
class Number {
public:
    enum class Repr : std::uint8_t {
        Signed,
        Unsigned,
        Real
    };

    constexpr Number() = default;

    template<class T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_signed_v<T>)
    constexpr Number(T v): m_repr(Repr::Signed), m_signed(static_cast<std::int64_t>(v)) {}

    template<class T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_unsigned_v<T>)
    constexpr Number(T v): m_repr(Repr::Unsigned), m_unsigned(static_cast<std::uint64_t>(v)) {}

    template<class T>
        requires std::is_floating_point_v<T>
    constexpr Number(T v): m_repr(Repr::Real), m_real(static_cast<double>(v)) {}

    constexpr Repr repr() const { return m_repr; }
    constexpr bool is_integer() const { return m_repr != Repr::Real; }

    constexpr std::int64_t  signed_value() const   { return m_signed; }
    constexpr std::uint64_t unsigned_value() const { return m_unsigned; }
    constexpr double        real_value() const     { return m_real; }

    // Nearest double; integers above 2^53 lose precision.
    constexpr double as_double() const {
        switch(m_repr) {
        case Repr::Signed:   return static_cast<double>(m_signed);
        case Repr::Unsigned: return static_cast<double>(m_unsigned);
        case Repr::Real:     return m_real;
        }
        return m_real;
    }

    std::string to_string() const;

    friend constexpr bool operator==(const Number & a, const Number & b) {
        if(a.m_repr == b.m_repr) {
            switch(a.m_repr) {
            case Repr::Signed:   return a.m_signed == b.m_signed;
            case Repr::Unsigned: return a.m_unsigned == b.m_unsigned;
            case Repr::Real:     return a.m_real == b.m_real;
            }
        }
        if(a.is_integer() && b.is_integer()) {
            const Number & s = a.m_repr == Repr::Signed ? a : b;
            const Number & u = a.m_repr == Repr::Signed ? b : a;
            return s.m_signed >= 0 && static_cast<std::uint64_t>(s.m_signed) == u.m_unsigned;
        }
        return a.as_double() == b.as_double();
    }

private:
    Repr m_repr = Repr::Signed;
    union {
        std::int64_t  m_signed = 0;
        std::uint64_t m_unsigned;
        double        m_real;
    };
};

inline std::string Number::to_string() const {
    switch(m_repr) {
    case Repr::Signed:   return std::to_string(m_signed);
    case Repr::Unsigned: return std::to_string(m_unsigned);
    case Repr::Real: {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), m_real);
        if(ec != std::errc{}) return {};
        return std::string(buf, ptr);
    }
    }
    return {};
}


/// One value of the untyped input tree.
class Node {
public:
    using Sequence = std::vector<Node>;
    using Mapping  = std::map<std::string, Node, std::less<>>;

    Node() = default;
    Node(std::nullptr_t) {}

    // bool gets its own tag: never let it decay into a Number
    template<class T>
        requires std::same_as<T, bool>
    Node(T b): m_value(b) {}

    template<class T>
        requires ((std::is_integral_v<T> && !std::same_as<T, bool>) || std::is_floating_point_v<T>)
    Node(T n): m_value(Number(n)) {}

    Node(Number n): m_value(n) {}
    Node(const char * s): m_value(std::string(s)) {}
    Node(std::string_view s): m_value(std::string(s)) {}
    Node(std::string s): m_value(std::move(s)) {}
    Node(Sequence s): m_value(std::move(s)) {}
    Node(Mapping m): m_value(std::move(m)) {}

    static Node sequence(std::initializer_list<Node> items) {
        return Node(Sequence(items));
    }
    static Node mapping(std::initializer_list<std::pair<const std::string, Node>> entries) {
        return Node(Mapping(entries));
    }

    NodeKind kind() const {
        return static_cast<NodeKind>(m_value.index());
    }

    bool is_null() const     { return kind() == NodeKind::Null; }
    bool is_bool() const     { return kind() == NodeKind::Bool; }
    bool is_number() const   { return kind() == NodeKind::Number; }
    bool is_text() const     { return kind() == NodeKind::Text; }
    bool is_sequence() const { return kind() == NodeKind::Sequence; }
    bool is_mapping() const  { return kind() == NodeKind::Mapping; }

    // Accessors return nullptr when the tag does not match.
    const bool *        as_bool() const     { return std::get_if<bool>(&m_value); }
    const Number *      as_number() const   { return std::get_if<Number>(&m_value); }
    const std::string * as_text() const     { return std::get_if<std::string>(&m_value); }
    const Sequence *    as_sequence() const { return std::get_if<Sequence>(&m_value); }
    const Mapping *     as_mapping() const  { return std::get_if<Mapping>(&m_value); }

    Sequence * as_sequence() { return std::get_if<Sequence>(&m_value); }
    Mapping *  as_mapping()  { return std::get_if<Mapping>(&m_value); }

    // Mapping lookup; nullptr when not a mapping or key is absent.
    const Node * find(std::string_view key) const {
        if(const Mapping * m = as_mapping()) {
            auto it = m->find(key);
            if(it != m->end()) return &it->second;
        }
        return nullptr;
    }

    friend bool operator==(const Node & a, const Node & b) {
        return a.m_value == b.m_value;
    }

private:
    // Alternative order must match NodeKind.
    std::variant<std::monostate, bool, Number, std::string, Sequence, Mapping> m_value;
};

static_assert(static_cast<std::size_t>(NodeKind::Mapping) == 5);

} // namespace ObjectDecoder
