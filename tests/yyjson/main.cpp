#include <yyjson.h>
#include <ObjectDecoder/yyjson.hpp>
#include "../test_helpers.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ObjectDecoder;
using namespace TestHelpers;

struct User {
    std::optional<int> id;
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
};

struct Sensor {
    std::string name;
    std::uint8_t channel;
    double reading;
    std::vector<std::int16_t> samples;
    std::map<std::string, bool> flags;
};

namespace {

using DocPtr = std::unique_ptr<yyjson_doc, decltype(&yyjson_doc_free)>;

DocPtr read_json(const std::string & json, yyjson_read_flag flags = 0) {
    return DocPtr(yyjson_read(json.data(), json.size(), flags), &yyjson_doc_free);
}

}

int main() {
    std::cout << "=== yyjson Adapter Tests ===\n\n";

    // Test 1: scalar tags survive the conversion
    {
        std::cout << "Test 1: Scalar kinds... ";
        DocPtr doc = read_json(R"([null, true, -5, 18446744073709551615, 2.5, "s"])");
        assert(doc);
        Node n = NodeFromYyjson(doc.get());
        const Node::Sequence & seq = *n.as_sequence();
        assert(seq.size() == 6);
        assert(seq[0].is_null());
        assert(seq[1].is_bool() && *seq[1].as_bool());
        assert(seq[2].as_number()->repr() == Number::Repr::Signed);
        assert(seq[3].as_number()->repr() == Number::Repr::Unsigned);
        assert(seq[3].as_number()->unsigned_value() == std::numeric_limits<std::uint64_t>::max());
        assert(seq[4].as_number()->repr() == Number::Repr::Real);
        assert(seq[5].is_text());
        std::cout << "PASSED\n";
    }

    // Test 2: object decoding end to end
    {
        std::cout << "Test 2: User from JSON... ";
        DocPtr doc = read_json(R"({"id": 1, "firstName": "Lucas", "lastName": "Best"})");
        assert(doc);
        User u;
        assert(DecodeSucceeds(u, NodeFromYyjson(doc.get())));
        assert(u.id == 1 && u.firstName == "Lucas" && u.lastName == "Best");
        std::cout << "PASSED\n";
    }

    // Test 3: nested content and failure paths
    {
        std::cout << "Test 3: Sensor from JSON... ";
        DocPtr ok = read_json(R"({"name": "t1", "channel": 3, "reading": 21,
                                  "samples": [1, -2, 300], "flags": {"calibrated": true}})");
        assert(ok);
        Sensor s;
        assert(DecodeSucceeds(s, NodeFromYyjson(ok.get())));
        assert(s.channel == 3 && s.reading == 21.0);
        assert((s.samples == std::vector<std::int16_t>{1, -2, 300}));
        assert(s.flags.at("calibrated"));

        DocPtr bad = read_json(R"({"name": "t1", "channel": 3, "reading": 21,
                                   "samples": [1, 40000], "flags": {}})");
        assert(bad);
        Sensor t;
        assert(DecodeFailsAt(t, NodeFromYyjson(bad.get()), DecodeError::DATA_CORRUPTED, CodingPath("samples", 1)));

        DocPtr wrong = read_json(R"({"name": "t1", "channel": "3", "reading": 21, "samples": [], "flags": {}})");
        assert(wrong);
        assert(DecodeFailsAt(t, NodeFromYyjson(wrong.get()), DecodeError::TYPE_MISMATCH, CodingPath("channel")));
        std::cout << "PASSED\n";
    }

    // Test 4: duplicate keys keep the last value
    {
        std::cout << "Test 4: Duplicate keys... ";
        DocPtr doc = read_json(R"({"id": 1, "id": 2})");
        assert(doc);
        User u;
        assert(DecodeSucceeds(u, NodeFromYyjson(doc.get())));
        assert(u.id == 2);
        std::cout << "PASSED\n";
    }

    // Test 5: raw numbers become text and reach floats through the fallback
    {
        std::cout << "Test 5: Raw numbers... ";
        DocPtr doc = read_json(R"({"reading": 1.5e3})", YYJSON_READ_NUMBER_AS_RAW);
        assert(doc);
        Node n = NodeFromYyjson(doc.get());
        assert(n.find("reading")->is_text());
        std::map<std::string, double> m;
        assert(DecodeSucceeds(m, n));
        assert(m.at("reading") == 1500.0);
        std::map<std::string, int> ints;
        assert(DecodeFailsWith(ints, n, DecodeError::TYPE_MISMATCH));
        std::cout << "PASSED\n";
    }

    // Test 6: missing document
    {
        std::cout << "Test 6: Null root... ";
        assert(NodeFromYyjson(static_cast<yyjson_val *>(nullptr)).is_null());
        assert(NodeFromYyjson(static_cast<yyjson_doc *>(nullptr)).is_null());
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All yyjson adapter tests passed ===\n";
    return 0;
}
