#include <ObjectDecoder/object_decoder.hpp>
#include <array>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace ObjectDecoder;
using namespace ObjectDecoder::options;
using namespace ObjectDecoder::static_schema;


/* ######## Nullable detection ######## */
static_assert(NullableValue<std::optional<int>>);
static_assert(NullableValue<std::unique_ptr<std::string>>);
static_assert(!NullableValue<int>);
static_assert(!NullableValue<std::string>);
static_assert(!NullableValue<int *>);


/* ######## Primitive and well-known classification ######## */
static_assert(IntegerValue<std::int8_t> && IntegerValue<std::uint64_t> && IntegerValue<char>);
static_assert(!IntegerValue<bool>);
static_assert(FloatValue<float> && FloatValue<double>);
static_assert(PrimitiveValue<std::string> && PrimitiveValue<bool>);
static_assert(WellKnownValue<Date> && WellKnownValue<Data> && WellKnownValue<Url> && WellKnownValue<Decimal>);
static_assert(!WellKnownValue<std::vector<std::uint8_t>>);


/* ######## Containers ######## */
static_assert(DynamicContainerTypeConcept<std::vector<int>>);
static_assert(DynamicContainerTypeConcept<std::list<std::string>>);
static_assert(!DynamicContainerTypeConcept<std::string>);
static_assert(!DynamicContainerTypeConcept<std::map<std::string, int>>);
static_assert(StringKeyedMap<std::map<std::string, int>>);
static_assert(StringKeyedMap<std::unordered_map<std::string, double>>);
static_assert(!StringKeyedMap<std::map<int, int>>);
static_assert(is_std_array<std::array<int, 3>>::value);


/* ######## Structural detection ######## */
struct Plain {
    int a;
    std::string b;
};

struct WithCtor {
    explicit WithCtor(int) {}
};

static_assert(ObjectValue<Plain>);
static_assert(!ObjectValue<WithCtor>);
static_assert(!ObjectValue<std::array<int, 2>>);
static_assert(!ObjectValue<std::vector<Plain>>);
static_assert(!ObjectValue<Url>);


/* ######## Decodability ######## */
static_assert(DecodableValue<Plain>);
static_assert(DecodableValue<std::optional<Plain>>);
static_assert(DecodableValue<std::unique_ptr<Plain>>);
static_assert(DecodableValue<std::vector<Plain>>);
static_assert(DecodableValue<std::array<double, 4>>);
static_assert(DecodableValue<std::map<std::string, std::vector<int>>>);
static_assert(DecodableValue<Date>);
static_assert(DecodableValue<Data>);
static_assert(!DecodableValue<WithCtor>);


/* ######## Member keys ######## */
struct Keyed {
    Annotated<int, key<"user_id">> id;
    Annotated<std::string, exclude> scratch;
    double score;
};

static_assert(introspection::structureElementsCount<Keyed> == 3);
static_assert(introspection::structureElementKeyByIndex<0, Keyed>() == "user_id");
static_assert(!introspection::structureElementIsExcluded<0, Keyed>());
static_assert(introspection::structureElementIsExcluded<1, Keyed>());
static_assert(introspection::structureElementKeyByIndex<2, Keyed>() == "score");
static_assert(std::is_same_v<
    options::detail::annotation_meta_getter<Annotated<int, key<"user_id">>>::OptionsP,
    OptionsPack<key<"user_id">>
>);


struct Described {
    int a;
    Annotated<int, exclude> b;
};

template<>
struct ObjectDecoder::StructMeta<Described> {
    using Fields = StructFields<
        Field<&Described::a, "first">,
        Field<&Described::b, "second">
    >;
};

static_assert(introspection::hasStructMeta<Described>);
static_assert(!introspection::hasStructMeta<Keyed>);
static_assert(introspection::structureElementKeyByIndex<0, Described>() == "first");
// exclusion carried by the member type still applies
static_assert(introspection::structureElementIsExcluded<1, Described>());


/* ######## Diagnostic names ######## */
static_assert(type_name<std::int32_t>() == "int32_t");
static_assert(type_name<std::uint8_t>() == "uint8_t");
static_assert(type_name<std::string>() == "string");
static_assert(type_name<Date>() == "Date");
static_assert(type_name<std::vector<int>>() == "sequence");
static_assert(type_name<Plain>() == "mapping");


/* ######## Value model ######## */
static_assert(kind_to_string(NodeKind::Null) == "null");
static_assert(kind_to_string(NodeKind::Bool) == "bool");
static_assert(Number(3) == Number(3u));
static_assert(Number(std::int64_t(-1)).repr() == Number::Repr::Signed);
static_assert(error_to_string(DecodeError::TYPE_MISMATCH) == "TYPE_MISMATCH");


int main() {
    std::cout << "=== Concept Tests ===\n";
    std::cout << "All checks are compile-time; reaching main means they passed.\n";
    return 0;
}
