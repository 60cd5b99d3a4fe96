#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "node.hpp"
#include "path.hpp"
#include "errors.hpp"
#include "decode_result.hpp"
#include "strategies.hpp"
#include "well_known_types.hpp"
#include "static_schema.hpp"
#include "base64.hpp"
#include "date_formats.hpp"
#include "url.hpp"

namespace ObjectDecoder {

class Decoder;
class KeyedContainer;
class IndexedContainer;
class SingleValueContainer;


/// Build capability of a target type. Specialize it to make a type decodable:
///
///     template<> struct ObjectDecoder::Decodable<Point> {
///         static bool decode(Point & out, Decoder & decoder) {
///             KeyedContainer c;
///             return decoder.keyed_container(c)
///                 && c.decode("x", out.x)
///                 && c.decode("y", out.y);
///         }
///     };
///
/// Return false after the failing read; a read that fails has already
/// recorded its error.
template<class T>
struct Decodable {};

template<class T>
concept DecodableValue = requires(T & out, Decoder & decoder) {
    { Decodable<T>::decode(out, decoder) } -> std::same_as<bool>;
};


namespace detail {

struct ErrorState {
    ErrorInfo   info;
    std::size_t failures = 0;
};

// Stand-in for absent children handed to super decoders
inline const Node null_node{};

}


/// View over a Mapping node. Reads resolve keys against the mapping and extend
/// the path with the key for the duration of the read.
///
/// A default-constructed container is empty: `contains` is false and
/// `all_keys` is empty. Reads need a container filled by a successful
/// `keyed_container` / `nested_keyed_container` call. The container points at
/// the decoder it came from, which must outlive it.
class KeyedContainer {
public:
    KeyedContainer() = default;

    const CodingPath & coding_path() const { return m_path; }

    bool contains(std::string_view key) const;
    std::vector<std::string> all_keys() const;

    bool decode_nil(std::string_view key, bool & isNil);

    template<class T>
    bool decode(std::string_view key, T & out);

    // Absent key and Null both give nullopt
    template<class T>
    bool decode_if_present(std::string_view key, std::optional<T> & out);

    bool nested_keyed_container(std::string_view key, KeyedContainer & out);
    bool nested_indexed_container(std::string_view key, IndexedContainer & out);

    // Child decoder for the value under "super". Keep it in a named local:
    // containers acquired from it point at it.
    Decoder super_decoder();
    // Child decoder for the value under key, Null when absent
    Decoder super_decoder(std::string_view key);

private:
    friend class Decoder;

    KeyedContainer(Decoder & decoder, const Node::Mapping & mapping, CodingPath path)
        : m_decoder(&decoder), m_mapping(&mapping), m_path(std::move(path)) {}

    const Node * lookup(std::string_view key) const;

    Decoder *             m_decoder = nullptr;
    const Node::Mapping * m_mapping = nullptr;
    CodingPath            m_path;
};


/// View over a Sequence node with a forward-only cursor. Only successful reads
/// advance the cursor.
///
/// A default-constructed container has count() 0 and is at end. Reads need a
/// container filled by a successful acquisition; the container points at the
/// decoder it came from, which must outlive it.
class IndexedContainer {
public:
    IndexedContainer() = default;

    const CodingPath & coding_path() const { return m_path; }

    std::size_t count() const { return m_sequence ? m_sequence->size() : 0; }
    bool is_at_end() const { return m_index >= count(); }
    std::size_t current_index() const { return m_index; }

    // Consumes the element only when it is Null
    bool decode_nil(bool & isNil);

    template<class T>
    bool decode(T & out);

    // At end or on Null gives nullopt; a Null element is consumed
    template<class T>
    bool decode_if_present(std::optional<T> & out);

    bool nested_keyed_container(KeyedContainer & out);
    bool nested_indexed_container(IndexedContainer & out);

    // nullopt (error recorded) when the container is at end. Containers
    // acquired from the returned decoder point at it; keep it alive.
    std::optional<Decoder> super_decoder();

private:
    friend class Decoder;

    IndexedContainer(Decoder & decoder, const Node::Sequence & sequence, CodingPath path)
        : m_decoder(&decoder), m_sequence(&sequence), m_path(std::move(path)) {}

    bool at_end_error(std::string_view what);

    Decoder *              m_decoder = nullptr;
    const Node::Sequence * m_sequence = nullptr;
    CodingPath             m_path;
    std::size_t            m_index = 0;
};


/// The decoder's current node, decoded as one value.
class SingleValueContainer {
public:
    explicit SingleValueContainer(Decoder & decoder): m_decoder(&decoder) {}

    const CodingPath & coding_path() const;

    bool decode_nil() const;

    template<class T>
    bool decode(T & out);

private:
    Decoder * m_decoder;
};


/// Decode context: node stack, coding path, options and the error sink shared
/// with every child decoder of the same call.
class Decoder {
public:
    Decoder(const Node & root, const Options & options)
        : m_options(&options)
        , m_errors(std::make_shared<detail::ErrorState>())
    {
        m_stack.push_back(&root);
    }

    const CodingPath & coding_path() const { return m_path; }
    const Options & options() const { return *m_options; }
    const UserInfo & user_info() const { return m_options->user_info; }
    const Node & current_node() const { return *m_stack.back(); }

    bool keyed_container(KeyedContainer & out) {
        return acquire_keyed(current_node(), out);
    }
    bool indexed_container(IndexedContainer & out) {
        return acquire_indexed(current_node(), out);
    }
    SingleValueContainer single_value_container() {
        return SingleValueContainer(*this);
    }

    // For build capabilities rejecting well-formed but invalid content
    bool fail_data_corrupted(std::string message) {
        return fail(DecodeError::DATA_CORRUPTED, std::move(message));
    }

    // Most recent failure recorded by this decoder or any of its children
    const ErrorInfo & last_error() const { return m_errors->info; }

private:
    friend class KeyedContainer;
    friend class IndexedContainer;
    friend class SingleValueContainer;

    Decoder(const Node & node, const Options * options, CodingPath path,
            std::shared_ptr<detail::ErrorState> errors, std::size_t base_depth)
        : m_options(options)
        , m_path(std::move(path))
        , m_errors(std::move(errors))
        , m_base_depth(base_depth)
    {
        m_stack.push_back(&node);
    }

    // Points the path at base + el until the end of the scope
    class PathScope {
        Decoder &  m_decoder;
        CodingPath m_saved;
    public:
        PathScope(Decoder & decoder, const CodingPath & base, PathElement el)
            : m_decoder(decoder), m_saved(std::move(decoder.m_path))
        {
            m_decoder.m_path = base.appending(std::move(el));
        }
        ~PathScope() {
            m_decoder.m_path = std::move(m_saved);
        }
        PathScope(const PathScope &) = delete;
        PathScope & operator=(const PathScope &) = delete;
    };

    // Makes a node current until the end of the scope
    class FrameGuard {
        Decoder & m_decoder;
        bool      m_pushed;
    public:
        FrameGuard(Decoder & decoder, const Node & node)
            : m_decoder(decoder), m_pushed(decoder.push_frame(node)) {}
        ~FrameGuard() {
            if(m_pushed) m_decoder.m_stack.pop_back();
        }
        explicit operator bool() const { return m_pushed; }
        FrameGuard(const FrameGuard &) = delete;
        FrameGuard & operator=(const FrameGuard &) = delete;
    };

    std::size_t depth() const { return m_base_depth + m_stack.size(); }

    bool push_frame(const Node & node) {
        if(depth() >= m_options->max_depth) {
            return fail(DecodeError::DEPTH_LIMIT_EXCEEDED,
                        std::format("Nesting depth exceeds the limit of {}.", m_options->max_depth));
        }
        m_stack.push_back(&node);
        return true;
    }

    bool fail(DecodeError e, std::string message,
              std::optional<NodeKind> expected = std::nullopt,
              std::optional<NodeKind> actual = std::nullopt) {
        m_errors->info = ErrorInfo{e, m_path, std::move(message), expected, actual};
        m_errors->failures ++;
        return false;
    }

    template<class T>
    bool type_mismatch(NodeKind expected, const Node & node) {
        return fail(DecodeError::TYPE_MISMATCH,
                    std::format("Expected to decode {} but found {} instead.",
                                static_schema::type_name<T>(), kind_to_string(node.kind())),
                    expected, node.kind());
    }

    bool acquire_keyed(const Node & node, KeyedContainer & out) {
        if(node.is_null()) {
            return fail(DecodeError::VALUE_NOT_FOUND, "Cannot get keyed decoding container -- found null value instead.");
        }
        const Node::Mapping * mapping = node.as_mapping();
        if(!mapping) {
            return fail(DecodeError::TYPE_MISMATCH,
                        std::format("Expected to decode mapping but found {} instead.", kind_to_string(node.kind())),
                        NodeKind::Mapping, node.kind());
        }
        out = KeyedContainer(*this, *mapping, m_path);
        return true;
    }

    bool acquire_indexed(const Node & node, IndexedContainer & out) {
        if(node.is_null()) {
            return fail(DecodeError::VALUE_NOT_FOUND, "Cannot get indexed decoding container -- found null value instead.");
        }
        const Node::Sequence * sequence = node.as_sequence();
        if(!sequence) {
            return fail(DecodeError::TYPE_MISMATCH,
                        std::format("Expected to decode sequence but found {} instead.", kind_to_string(node.kind())),
                        NodeKind::Sequence, node.kind());
        }
        out = IndexedContainer(*this, *sequence, m_path);
        return true;
    }

    Decoder child(const Node & node, CodingPath path) {
        return Decoder(node, m_options, std::move(path), m_errors, depth());
    }

    // Null policy, then coercion
    template<class T>
    bool decode_node(const Node & node, T & out) {
        if constexpr (!static_schema::NullableValue<T>) {
            if(node.is_null()) {
                return fail(DecodeError::VALUE_NOT_FOUND,
                            std::format("Expected {} value but found null instead.", static_schema::type_name<T>()));
            }
        }
        return unbox(node, out);
    }

    template<class T>
    bool unbox(const Node & node, T & out);

    template<class T>
    bool unbox_integer(const Node & node, T & out);

    template<class T>
    bool unbox_float(const Node & node, T & out);

    template<class T>
    bool unbox_float_text(const std::string & text, T & out);

    template<class T>
    bool unbox_date(const Node & node, T & out);

    template<class T>
    bool unbox_data(const Node & node, T & out);

    template<class T>
    bool run_decodable(const Node & node, T & out) {
        FrameGuard frame(*this, node);
        if(!frame) return false;
        return run_capability([&] { return Decodable<T>::decode(out, *this); });
    }

    // A capability reporting failure without recording why is DATA_CORRUPTED
    template<class F>
    bool run_capability(F && f) {
        const std::size_t before = m_errors->failures;
        if(f()) {
            return true;
        }
        if(m_errors->failures == before) {
            return fail(DecodeError::DATA_CORRUPTED, "Build capability failed without reporting an error.");
        }
        return false;
    }

    const Options *                     m_options;
    std::vector<const Node *>           m_stack;
    CodingPath                          m_path;
    std::shared_ptr<detail::ErrorState> m_errors;
    std::size_t                         m_base_depth = 0;
};


/* ######## Coercion engine ######## */

template<class T>
bool Decoder::unbox(const Node & node, T & out) {
    using namespace static_schema;
    if constexpr (std::same_as<T, bool>) {
        if(const bool * b = node.as_bool()) {
            out = *b;
            return true;
        }
        return type_mismatch<T>(NodeKind::Bool, node);
    } else if constexpr (IntegerValue<T>) {
        return unbox_integer(node, out);
    } else if constexpr (FloatValue<T>) {
        return unbox_float(node, out);
    } else if constexpr (std::same_as<T, std::string>) {
        if(const std::string * s = node.as_text()) {
            out = *s;
            return true;
        }
        return type_mismatch<T>(NodeKind::Text, node);
    } else if constexpr (std::same_as<T, Date>) {
        return unbox_date(node, out);
    } else if constexpr (std::same_as<T, Data>) {
        return unbox_data(node, out);
    } else if constexpr (std::same_as<T, Url>) {
        std::string text;
        if(!unbox(node, text)) {
            return false;
        }
        std::optional<Url> url = Url::from_string(text);
        if(!url) {
            return fail(DecodeError::DATA_CORRUPTED, "Invalid URL string.");
        }
        out = std::move(*url);
        return true;
    } else if constexpr (std::same_as<T, Decimal>) {
        double d = 0;
        if(!unbox_float(node, d)) {
            return false;
        }
        out = Decimal(d);
        return true;
    } else {
        static_assert(DecodableValue<T>, "[[[ ObjectDecoder ]]] Target type has no Decodable<T> specialization");
        return run_decodable(node, out);
    }
}

template<class T>
bool Decoder::unbox_integer(const Node & node, T & out) {
    using Checked = std::conditional_t<std::is_signed_v<T>, std::make_signed_t<T>, std::make_unsigned_t<T>>;

    const Number * num = node.as_number();
    if(!num) {
        return type_mismatch<T>(NodeKind::Number, node);
    }
    bool fits = false;
    switch(num->repr()) {
    case Number::Repr::Signed:
        if(std::in_range<Checked>(num->signed_value())) {
            out = static_cast<T>(num->signed_value());
            fits = true;
        }
        break;
    case Number::Repr::Unsigned:
        if(std::in_range<Checked>(num->unsigned_value())) {
            out = static_cast<T>(num->unsigned_value());
            fits = true;
        }
        break;
    case Number::Repr::Real: {
        const double d = num->real_value();
        // [lower, upper) is exactly representable for every integer width
        const double upper = std::ldexp(1.0, std::numeric_limits<Checked>::digits);
        const double lower = std::is_signed_v<Checked> ? -upper : 0.0;
        if(std::isfinite(d) && std::trunc(d) == d && d >= lower && d < upper) {
            out = static_cast<T>(static_cast<Checked>(d));
            fits = true;
        }
        break;
    }
    }
    if(!fits) {
        return fail(DecodeError::DATA_CORRUPTED,
                    std::format("Parsed number <{}> does not fit in {}.", num->to_string(), static_schema::type_name<T>()));
    }
    return true;
}

template<class T>
bool Decoder::unbox_float(const Node & node, T & out) {
    if(const Number * num = node.as_number()) {
        const double d = num->as_double();
        if constexpr (std::same_as<T, float>) {
            if(!(std::abs(d) <= static_cast<double>(std::numeric_limits<float>::max()))) {
                return fail(DecodeError::DATA_CORRUPTED,
                            std::format("Parsed number <{}> does not fit in float.", num->to_string()));
            }
        }
        out = static_cast<T>(d);
        return true;
    }
    if(const std::string * text = node.as_text()) {
        return unbox_float_text(*text, out);
    }
    return type_mismatch<T>(NodeKind::Number, node);
}

template<class T>
bool Decoder::unbox_float_text(const std::string & text, T & out) {
    using S = NonConformingFloatStrategy;
    const S::Kind & strategy = m_options->non_conforming_float_strategy.kind;

    if(const auto * conv = std::get_if<S::ConvertFromString>(&strategy)) {
        if(!conv->positive_infinity.empty() && text == conv->positive_infinity) {
            out = std::numeric_limits<T>::infinity();
            return true;
        }
        if(!conv->negative_infinity.empty() && text == conv->negative_infinity) {
            out = -std::numeric_limits<T>::infinity();
            return true;
        }
        if(!conv->nan.empty() && text == conv->nan) {
            out = std::numeric_limits<T>::quiet_NaN();
            return true;
        }
    }

    double d = 0;
    const char * first = text.data();
    const char * last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, d);
    if(ec != std::errc{} || ptr != last) {
        return fail(DecodeError::DATA_CORRUPTED, std::format("Parsed string <{}> is not a valid number.", text));
    }
    // non-finite values only come in through the sentinels above
    if(!std::isfinite(d)) {
        return fail(DecodeError::DATA_CORRUPTED,
                    std::format("Parsed string <{}> is a non-conforming float value.", text));
    }
    if constexpr (std::same_as<T, float>) {
        if(std::abs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
            return fail(DecodeError::DATA_CORRUPTED, std::format("Parsed string <{}> does not fit in float.", text));
        }
    }
    out = static_cast<T>(d);
    return true;
}

template<class T>
bool Decoder::unbox_date(const Node & node, T & out) {
    using S = DateStrategy;
    return std::visit([&](const auto & strategy) -> bool {
        using K = std::decay_t<decltype(strategy)>;
        if constexpr (std::same_as<K, S::DeferredToDate>) {
            return run_decodable(node, out);
        } else if constexpr (std::same_as<K, S::SecondsSince1970> || std::same_as<K, S::MillisecondsSince1970>) {
            double seconds = 0;
            if(!unbox_float(node, seconds)) {
                return false;
            }
            if constexpr (std::same_as<K, S::MillisecondsSince1970>) {
                seconds /= 1000.0;
            }
            std::optional<Date> date = date_formats::from_seconds_since_1970(seconds);
            if(!date) {
                return fail(DecodeError::DATA_CORRUPTED,
                            std::format("Date <{}> seconds since 1970 is out of range.", seconds));
            }
            out = *date;
            return true;
        } else if constexpr (std::same_as<K, S::ISO8601>) {
            std::string text;
            if(!unbox(node, text)) {
                return false;
            }
            std::optional<Date> date = date_formats::parse_iso8601(text);
            if(!date) {
                return fail(DecodeError::DATA_CORRUPTED, "Expected date string to be ISO8601-formatted.");
            }
            out = *date;
            return true;
        } else if constexpr (std::same_as<K, S::Formatted>) {
            std::string text;
            if(!unbox(node, text)) {
                return false;
            }
            std::optional<Date> date = date_formats::parse_formatted(text, strategy.formatter);
            if(!date) {
                return fail(DecodeError::DATA_CORRUPTED, "Date string does not match format expected by formatter.");
            }
            out = *date;
            return true;
        } else {
            if(!strategy.fn) {
                return fail(DecodeError::DATA_CORRUPTED, "Custom date strategy has no callback.");
            }
            FrameGuard frame(*this, node);
            if(!frame) return false;
            return run_capability([&] { return strategy.fn(out, *this); });
        }
    }, m_options->date_strategy.kind);
}

template<class T>
bool Decoder::unbox_data(const Node & node, T & out) {
    using S = DataStrategy;
    return std::visit([&](const auto & strategy) -> bool {
        using K = std::decay_t<decltype(strategy)>;
        if constexpr (std::same_as<K, S::DeferredToData>) {
            return run_decodable(node, out);
        } else if constexpr (std::same_as<K, S::Base64>) {
            const std::string * text = node.as_text();
            if(!text) {
                return type_mismatch<T>(NodeKind::Text, node);
            }
            std::optional<Data> bytes = base64_decode(*text);
            if(!bytes) {
                return fail(DecodeError::DATA_CORRUPTED, "Encountered Data is not valid Base64.");
            }
            out = std::move(*bytes);
            return true;
        } else {
            if(!strategy.fn) {
                return fail(DecodeError::DATA_CORRUPTED, "Custom data strategy has no callback.");
            }
            FrameGuard frame(*this, node);
            if(!frame) return false;
            return run_capability([&] { return strategy.fn(out, *this); });
        }
    }, m_options->data_strategy.kind);
}


/* ######## KeyedContainer ######## */

inline const Node * KeyedContainer::lookup(std::string_view key) const {
    if(!m_mapping) {
        return nullptr;
    }
    auto it = m_mapping->find(key);
    return it == m_mapping->end() ? nullptr : &it->second;
}

inline bool KeyedContainer::contains(std::string_view key) const {
    return lookup(key) != nullptr;
}

inline std::vector<std::string> KeyedContainer::all_keys() const {
    std::vector<std::string> keys;
    if(!m_mapping) {
        return keys;
    }
    keys.reserve(m_mapping->size());
    for(const auto & [k, v] : *m_mapping) {
        keys.push_back(k);
    }
    return keys;
}

inline bool KeyedContainer::decode_nil(std::string_view key, bool & isNil) {
    const Node * child = lookup(key);
    if(!child) {
        Decoder::PathScope scope(*m_decoder, m_path, PathElement(key));
        return m_decoder->fail(DecodeError::KEY_NOT_FOUND, std::format("No value associated with key \"{}\".", key));
    }
    isNil = child->is_null();
    return true;
}

template<class T>
bool KeyedContainer::decode(std::string_view key, T & out) {
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(key));
    const Node * child = lookup(key);
    if(!child) {
        return m_decoder->fail(DecodeError::KEY_NOT_FOUND, std::format("No value associated with key \"{}\".", key));
    }
    return m_decoder->decode_node(*child, out);
}

template<class T>
bool KeyedContainer::decode_if_present(std::string_view key, std::optional<T> & out) {
    const Node * child = lookup(key);
    if(!child || child->is_null()) {
        out.reset();
        return true;
    }
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(key));
    out.emplace();
    if(!m_decoder->decode_node(*child, *out)) {
        out.reset();
        return false;
    }
    return true;
}

inline bool KeyedContainer::nested_keyed_container(std::string_view key, KeyedContainer & out) {
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(key));
    const Node * child = lookup(key);
    if(!child) {
        return m_decoder->fail(DecodeError::KEY_NOT_FOUND,
                               std::format("Cannot get nested keyed container -- no value found for key \"{}\".", key));
    }
    return m_decoder->acquire_keyed(*child, out);
}

inline bool KeyedContainer::nested_indexed_container(std::string_view key, IndexedContainer & out) {
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(key));
    const Node * child = lookup(key);
    if(!child) {
        return m_decoder->fail(DecodeError::KEY_NOT_FOUND,
                               std::format("Cannot get nested indexed container -- no value found for key \"{}\".", key));
    }
    return m_decoder->acquire_indexed(*child, out);
}

inline Decoder KeyedContainer::super_decoder() {
    return super_decoder("super");
}

inline Decoder KeyedContainer::super_decoder(std::string_view key) {
    const Node * child = lookup(key);
    return m_decoder->child(child ? *child : detail::null_node, m_path.appending(PathElement(key)));
}


/* ######## IndexedContainer ######## */

inline bool IndexedContainer::at_end_error(std::string_view what) {
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(m_index));
    return m_decoder->fail(DecodeError::VALUE_NOT_FOUND,
                           std::format("Cannot decode {} -- indexed container is at end.", what));
}

inline bool IndexedContainer::decode_nil(bool & isNil) {
    if(is_at_end()) {
        return at_end_error("nil");
    }
    isNil = (*m_sequence)[m_index].is_null();
    if(isNil) {
        m_index ++;
    }
    return true;
}

template<class T>
bool IndexedContainer::decode(T & out) {
    if(is_at_end()) {
        return at_end_error(static_schema::type_name<T>());
    }
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(m_index));
    if(!m_decoder->decode_node((*m_sequence)[m_index], out)) {
        return false;
    }
    m_index ++;
    return true;
}

template<class T>
bool IndexedContainer::decode_if_present(std::optional<T> & out) {
    if(is_at_end()) {
        out.reset();
        return true;
    }
    const Node & element = (*m_sequence)[m_index];
    if(element.is_null()) {
        m_index ++;
        out.reset();
        return true;
    }
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(m_index));
    out.emplace();
    if(!m_decoder->decode_node(element, *out)) {
        out.reset();
        return false;
    }
    m_index ++;
    return true;
}

inline bool IndexedContainer::nested_keyed_container(KeyedContainer & out) {
    if(is_at_end()) {
        return at_end_error("nested keyed container");
    }
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(m_index));
    if(!m_decoder->acquire_keyed((*m_sequence)[m_index], out)) {
        return false;
    }
    m_index ++;
    return true;
}

inline bool IndexedContainer::nested_indexed_container(IndexedContainer & out) {
    if(is_at_end()) {
        return at_end_error("nested indexed container");
    }
    Decoder::PathScope scope(*m_decoder, m_path, PathElement(m_index));
    if(!m_decoder->acquire_indexed((*m_sequence)[m_index], out)) {
        return false;
    }
    m_index ++;
    return true;
}

inline std::optional<Decoder> IndexedContainer::super_decoder() {
    if(is_at_end()) {
        at_end_error("super decoder");
        return std::nullopt;
    }
    const Node & element = (*m_sequence)[m_index];
    Decoder d = m_decoder->child(element, m_path.appending(PathElement(m_index)));
    m_index ++;
    return d;
}


/* ######## SingleValueContainer ######## */

inline const CodingPath & SingleValueContainer::coding_path() const {
    return m_decoder->coding_path();
}

inline bool SingleValueContainer::decode_nil() const {
    return m_decoder->current_node().is_null();
}

template<class T>
bool SingleValueContainer::decode(T & out) {
    return m_decoder->decode_node(m_decoder->current_node(), out);
}

} // namespace ObjectDecoder
