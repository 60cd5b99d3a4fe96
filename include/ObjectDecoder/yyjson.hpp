#pragma once
#include <yyjson.h>
#include <string>
#include <utility>

#include "node.hpp"

namespace ObjectDecoder {

/// Copies a yyjson DOM value into a Node. yyjson keeps bool, signed, unsigned
/// and real apart, so the mapping is direct. Raw values (YYJSON_READ_NUMBER_AS_RAW)
/// become Text and reach floats through the text fallback.
inline Node NodeFromYyjson(yyjson_val * val) {
    if(!val) {
        return Node{};
    }
    switch(yyjson_get_type(val)) {
    case YYJSON_TYPE_BOOL:
        return Node(yyjson_get_bool(val));
    case YYJSON_TYPE_NUM:
        if(yyjson_is_sint(val)) {
            return Node(Number(yyjson_get_sint(val)));
        }
        if(yyjson_is_uint(val)) {
            return Node(Number(yyjson_get_uint(val)));
        }
        return Node(Number(yyjson_get_real(val)));
    case YYJSON_TYPE_STR:
        return Node(std::string(yyjson_get_str(val), yyjson_get_len(val)));
    case YYJSON_TYPE_RAW:
        return Node(std::string(yyjson_get_raw(val), yyjson_get_len(val)));
    case YYJSON_TYPE_ARR: {
        Node::Sequence seq;
        seq.reserve(yyjson_arr_size(val));
        yyjson_arr_iter it;
        yyjson_arr_iter_init(val, &it);
        while(yyjson_val * el = yyjson_arr_iter_next(&it)) {
            seq.push_back(NodeFromYyjson(el));
        }
        return Node(std::move(seq));
    }
    case YYJSON_TYPE_OBJ: {
        Node::Mapping mapping;
        yyjson_obj_iter it;
        yyjson_obj_iter_init(val, &it);
        while(yyjson_val * key = yyjson_obj_iter_next(&it)) {
            // duplicate keys: the last one wins
            mapping.insert_or_assign(std::string(yyjson_get_str(key), yyjson_get_len(key)),
                                     NodeFromYyjson(yyjson_obj_iter_get_val(key)));
        }
        return Node(std::move(mapping));
    }
    default:
        return Node{};
    }
}

/// Convenience for a whole document.
inline Node NodeFromYyjson(yyjson_doc * doc) {
    return NodeFromYyjson(yyjson_doc_get_root(doc));
}

} // namespace ObjectDecoder
