#include "../test_helpers.hpp"
#include <optional>
#include <string>
#include <vector>

using namespace ObjectDecoder;
using namespace TestHelpers;

struct Inner {
    int b;
};

struct Outer {
    std::vector<Inner> a;
};

struct Nest {
    std::vector<Nest> items;
};

struct Settings {
    std::string name;
    int retries = 3;
};

// Tolerates a malformed "retries" and keeps the default
template<>
struct ObjectDecoder::Decodable<Settings> {
    static bool decode(Settings & out, Decoder & decoder) {
        KeyedContainer c;
        if(!decoder.keyed_container(c) || !c.decode("name", out.name)) {
            return false;
        }
        int retries = 0;
        if(c.contains("retries") && c.decode("retries", retries)) {
            out.retries = retries;
        }
        return true;
    }
};

namespace {

Node nested(std::size_t levels) {
    Node leaf = Node::mapping({{"items", Node::sequence({})}});
    for(std::size_t i = 0; i < levels; i ++) {
        leaf = Node::mapping({{"items", Node::sequence({leaf})}});
    }
    return leaf;
}

}

int main() {
    std::cout << "=== Error Reporting Tests ===\n\n";

    // Test 1: path of a failure deep in the tree
    {
        std::cout << "Test 1: Error path... ";
        Node n = Node::mapping({{"a", Node::sequence({Node::mapping({{"b", 1}}), Node::mapping({{"b", "x"}})})}});
        Outer o;
        auto res = Decode(o, n);
        assert(!res);
        assert(res.error() == DecodeError::TYPE_MISMATCH);
        assert(res.errorPath() == CodingPath("a", 1, "b"));
        assert(res.errorPath().to_string() == "$.a[1].b");
        assert(res.expectedKind() == NodeKind::Number);
        assert(res.actualKind() == NodeKind::Text);
        std::cout << "PASSED\n";
    }

    // Test 2: one-line rendering
    {
        std::cout << "Test 2: DecodeResultToString... ";
        Node n = Node::mapping({{"a", Node::sequence({Node::mapping({{"b", 1}}), Node::mapping({{"b", "x"}})})}});
        Outer o;
        std::string s = DecodeResultToString(Decode(o, n));
        assert(s == "When decoding $.a[1].b, error 'TYPE_MISMATCH': "
                    "Expected to decode int32_t but found text instead. (expected number, found text)");

        Node narrow = Node::mapping({{"a", Node::sequence({Node::mapping({{"b", 3.5}})})}});
        s = DecodeResultToString(Decode(o, narrow));
        assert(s == "When decoding $.a[0].b, error 'DATA_CORRUPTED': Parsed number <3.5> does not fit in int32_t.");

        assert(DecodeResultToString(Decode(o, Node::mapping({{"a", Node::sequence({})}}))) == "No error");
        std::cout << "PASSED\n";
    }

    // Test 3: the four failure kinds
    {
        std::cout << "Test 3: Error kinds... ";
        Outer o;
        assert(DecodeFailsAt(o, Node::mapping({}), DecodeError::KEY_NOT_FOUND, CodingPath("a")));
        assert(DecodeFailsAt(o, Node::mapping({{"a", nullptr}}), DecodeError::VALUE_NOT_FOUND, CodingPath("a")));
        assert(DecodeFailsAt(o, Node::mapping({{"a", 5}}), DecodeError::TYPE_MISMATCH, CodingPath("a")));
        assert(DecodeFailsAt(o, Node::mapping({{"a", Node::sequence({Node::mapping({{"b", 1e10}})})}}),
                             DecodeError::DATA_CORRUPTED, CodingPath("a", 0, "b")));
        assert(DecodeFailsAt(o, Node(), DecodeError::VALUE_NOT_FOUND, CodingPath()));
        std::cout << "PASSED\n";
    }

    // Test 4: nesting depth is bounded
    {
        std::cout << "Test 4: Depth limit... ";
        Nest shallow;
        assert(DecodeSucceeds(shallow, nested(10)));

        Options tight;
        tight.max_depth = 8;
        Nest deep;
        auto res = Decode(deep, nested(10), tight);
        assert(!res && res.error() == DecodeError::DEPTH_LIMIT_EXCEEDED);
        assert(res.message() == "Nesting depth exceeds the limit of 8.");
        assert(res.errorPath().length() > 0 && res.errorPath().length() < 8);

        // far beyond the default limit: fails cleanly
        Nest huge;
        auto resHuge = Decode(huge, nested(1000));
        assert(!resHuge && resHuge.error() == DecodeError::DEPTH_LIMIT_EXCEEDED);
        std::cout << "PASSED\n";
    }

    // Test 5: a capability may recover from a failed read
    {
        std::cout << "Test 5: Tolerated failures... ";
        Settings s;
        assert(DecodeSucceeds(s, Node::mapping({{"name", "svc"}, {"retries", "many"}})));
        assert(s.name == "svc" && s.retries == 3);

        Settings t;
        assert(DecodeSucceeds(t, Node::mapping({{"name", "svc"}, {"retries", 5}})));
        assert(t.retries == 5);

        std::vector<Settings> list;
        assert(DecodeSucceeds(list, Node::sequence({Node::mapping({{"name", "a"}, {"retries", nullptr}}),
                                                    Node::mapping({{"name", "b"}})})));
        assert(list.size() == 2 && list[0].retries == 3 && list[1].name == "b");

        Settings u;
        assert(DecodeFailsAt(u, Node::mapping({{"retries", 1}}), DecodeError::KEY_NOT_FOUND, CodingPath("name")));
        std::cout << "PASSED\n";
    }

    // Test 6: failures in one decode do not leak into the next
    {
        std::cout << "Test 6: Independent calls... ";
        Outer o;
        assert(!Decode(o, Node(1)));
        auto ok = Decode(o, Node::mapping({{"a", Node::sequence({Node::mapping({{"b", 2}})})}}));
        assert(ok && ok.error() == DecodeError::NO_ERROR);
        assert(ok.errorPath().empty() && ok.message().empty());
        assert(!ok.expectedKind() && !ok.actualKind());
        assert(o.a.size() == 1 && o.a[0].b == 2);
        std::cout << "PASSED\n";
    }

    // Test 7: error names
    {
        std::cout << "Test 7: error_to_string... ";
        assert(error_to_string(DecodeError::KEY_NOT_FOUND) == "KEY_NOT_FOUND");
        assert(error_to_string(DecodeError::VALUE_NOT_FOUND) == "VALUE_NOT_FOUND");
        assert(error_to_string(DecodeError::TYPE_MISMATCH) == "TYPE_MISMATCH");
        assert(error_to_string(DecodeError::DATA_CORRUPTED) == "DATA_CORRUPTED");
        assert(error_to_string(DecodeError::DEPTH_LIMIT_EXCEEDED) == "DEPTH_LIMIT_EXCEEDED");
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All error reporting tests passed ===\n";
    return 0;
}
