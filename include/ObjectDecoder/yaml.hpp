#pragma once
#include <rapidyaml.hpp>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "node.hpp"

namespace ObjectDecoder {

namespace yaml_detail {

template<class N>
bool parse_full(std::string_view s, N & out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// JSON-like scalar typing; yes/no/on/off stay text
inline Node scalar_to_node(c4::csubstr val, bool quoted) {
    std::string_view s(val.str, val.len);
    if(quoted) {
        return Node(std::string(s));
    }
    if(s.empty() || s == "null" || s == "~") {
        return Node{};
    }
    if(s == "true") {
        return Node(true);
    }
    if(s == "false") {
        return Node(false);
    }

    char first = s[0];
    if((first >= '0' && first <= '9') || first == '-' || first == '+' || first == '.') {
        std::string_view digits = s;
        if(first == '+') {
            // "+5" and "+.5" only; "+-5" stays text
            if(s.size() < 2 || !((s[1] >= '0' && s[1] <= '9') || s[1] == '.')) {
                return Node(std::string(s));
            }
            digits = s.substr(1);
        }
        std::int64_t i = 0;
        if(parse_full(digits, i)) {
            return Node(Number(i));
        }
        std::uint64_t u = 0;
        if(parse_full(digits, u)) {
            return Node(Number(u));
        }
        double d = 0;
        if(parse_full(digits, d) && std::isfinite(d)) {
            return Node(Number(d));
        }
    }
    return Node(std::string(s));
}

}

/// Copies a rapidyaml tree node into a Node. A stream holding one document
/// yields that document; several documents yield a Sequence of them.
inline Node NodeFromYaml(ryml::ConstNodeRef node) {
    if(!node.readable()) {
        return Node{};
    }
    if(node.is_stream()) {
        if(node.num_children() == 1) {
            return NodeFromYaml(node.first_child());
        }
        Node::Sequence docs;
        for(ryml::ConstNodeRef doc : node.children()) {
            docs.push_back(NodeFromYaml(doc));
        }
        return Node(std::move(docs));
    }
    if(node.is_map()) {
        Node::Mapping mapping;
        for(ryml::ConstNodeRef child : node.children()) {
            c4::csubstr key = child.key();
            mapping.insert_or_assign(std::string(key.str, key.len), NodeFromYaml(child));
        }
        return Node(std::move(mapping));
    }
    if(node.is_seq()) {
        Node::Sequence seq;
        seq.reserve(node.num_children());
        for(ryml::ConstNodeRef child : node.children()) {
            seq.push_back(NodeFromYaml(child));
        }
        return Node(std::move(seq));
    }
    if(!node.has_val()) {
        return Node{};
    }
    return yaml_detail::scalar_to_node(node.val(), node.is_val_quoted());
}

} // namespace ObjectDecoder
