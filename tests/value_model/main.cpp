#include "../test_helpers.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace ObjectDecoder;

int main() {
    std::cout << "=== Value Model Tests ===\n\n";

    // Test 1: bool never becomes a number
    {
        std::cout << "Test 1: Bool and Number are distinct tags... ";
        Node t = true;
        Node one = 1;
        assert(t.kind() == NodeKind::Bool);
        assert(one.kind() == NodeKind::Number);
        assert(t != one);
        assert(t.as_number() == nullptr);
        assert(one.as_bool() == nullptr);
        std::cout << "PASSED\n";
    }

    // Test 2: every constructor lands on the expected kind
    {
        std::cout << "Test 2: Node kinds... ";
        assert(Node().is_null());
        assert(Node(nullptr).is_null());
        assert(Node(3.5).is_number());
        assert(Node(std::uint64_t(7)).is_number());
        assert(Node("text").is_text());
        assert(Node(std::string("text")).is_text());
        assert(Node(std::string_view("text")).is_text());
        assert(Node::sequence({1, "two", nullptr}).is_sequence());
        assert(Node::mapping({{"a", 1}}).is_mapping());
        assert(kind_to_string(NodeKind::Mapping) == "mapping");
        std::cout << "PASSED\n";
    }

    // Test 3: Number keeps the representation it was built from
    {
        std::cout << "Test 3: Number representations... ";
        Number s(std::int64_t(-5));
        Number u(std::numeric_limits<std::uint64_t>::max());
        Number r(2.5);
        assert(s.repr() == Number::Repr::Signed && s.signed_value() == -5);
        assert(u.repr() == Number::Repr::Unsigned && u.unsigned_value() == std::numeric_limits<std::uint64_t>::max());
        assert(r.repr() == Number::Repr::Real && r.real_value() == 2.5);
        assert(s.is_integer() && u.is_integer() && !r.is_integer());
        assert(r.as_double() == 2.5);
        std::cout << "PASSED\n";
    }

    // Test 4: equality across representations
    {
        std::cout << "Test 4: Number equality... ";
        assert(Number(3) == Number(3u));
        assert(!(Number(-1) == Number(std::numeric_limits<std::uint64_t>::max())));
        assert(Number(3) == Number(3.0));
        assert(!(Number(3) == Number(3.5)));
        std::cout << "PASSED\n";
    }

    // Test 5: rendering used in diagnostics
    {
        std::cout << "Test 5: Number rendering... ";
        assert(Number(-42).to_string() == "-42");
        assert(Number(3.5).to_string() == "3.5");
        assert(Number(300.0).to_string() == "300");
        assert(Number(1e20).to_string() == "1e+20");
        std::cout << "PASSED\n";
    }

    // Test 6: mapping lookup
    {
        std::cout << "Test 6: Mapping lookup... ";
        Node m = Node::mapping({{"id", 1}, {"name", "Lucas"}, {"gone", nullptr}});
        assert(m.find("id") != nullptr && m.find("id")->is_number());
        assert(m.find("gone") != nullptr && m.find("gone")->is_null());
        assert(m.find("missing") == nullptr);
        assert(Node(1).find("id") == nullptr);
        assert(m.as_mapping()->size() == 3);
        std::cout << "PASSED\n";
    }

    // Test 7: deep equality of trees
    {
        std::cout << "Test 7: Tree equality... ";
        Node a = Node::mapping({{"xs", Node::sequence({1, 2, 3})}, {"ok", true}});
        Node b = Node::mapping({{"ok", true}, {"xs", Node::sequence({1, 2, 3})}});
        Node c = Node::mapping({{"ok", true}, {"xs", Node::sequence({1, 2})}});
        assert(a == b);
        assert(a != c);
        std::cout << "PASSED\n";
    }

    // Test 8: coding path rendering
    {
        std::cout << "Test 8: CodingPath... ";
        CodingPath p;
        assert(p.to_string() == "$");
        p.push_child(PathElement("users"));
        p.push_child(PathElement(std::size_t(2)));
        p.push_child(PathElement("id"));
        assert(p.to_string() == "$.users[2].id");
        assert(p == CodingPath("users", 2, "id"));
        assert(p.length() == 3 && p[1].is_index() && p[2].is_field());
        p.pop();
        assert(p.to_string() == "$.users[2]");
        p.truncate(0);
        assert(p.empty());
        CodingPath q = CodingPath("a").appending(PathElement(std::size_t(0)));
        assert(q.to_string() == "$.a[0]");
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All value model tests passed ===\n";
    return 0;
}
