#include "../test_helpers.hpp"
#include "../test_keys.hpp"
#include <optional>
#include <string>
using namespace TestHelpers;
using namespace EnumFusion;
using namespace test_keys;

// ============================================================================
// Byte-exact: canonical JSON survives parse + serialize unchanged
// ============================================================================

static_assert(TestRoundTrip<EnumMap<Example, int>>(R"({"A":5,"B":10,"C":0})"));
static_assert(TestRoundTrip<EnumMap<bool, std::optional<bool>>>(R"({"false":null,"true":true})"));
static_assert(TestRoundTrip<EnumMap<Color, std::string>>(R"({"Red":"r\"ed","Green":"","Blue":"\u001f"})"));
static_assert(TestRoundTrip<EnumMap<std::optional<Example>, Shape>>(
    R"({"None":"Dot","Some(A)":"Circle(true)","Some(B)":"2(Green)","Some(C)":"Circle(false)"})"));
static_assert(TestRoundTrip<EnumMap<Point, std::int8_t>>(
    R"({"(false,Red)":-128,"(true,Red)":127,"(false,Green)":0,"(true,Green)":1,"(false,Blue)":-1,"(true,Blue)":2})"));
static_assert(TestRoundTrip<EnumMap<bool, EnumMap<Example, bool>>>(
    R"({"false":{"A":true,"B":false,"C":true},"true":{"A":false,"B":false,"C":false}})"));

// ============================================================================
// Semantic: any member order and spacing
// ============================================================================

static_assert(TestRoundTripSemantic<EnumMap<Example, int>>(R"( { "C" : 3 , "B" : 2 , "A" : 1 } )"));
static_assert(TestRoundTripSemantic<EnumMap<Described, unsigned>>(
    R"({"(true,Blue)": 6, "(false,Red)": 1, "(true,Red)": 2, "(false,Green)": 3, "(true,Green)": 4, "(false,Blue)": 5})"));

// ============================================================================
// Object -> JSON -> object
// ============================================================================

static_assert([]() constexpr {
    const auto original = EnumMap<Letter, int>::from_fn([](Letter l) { return static_cast<int>(encode(l)) * 3 - 70; });
    std::string json;
    if (!Serialize(original, json)) return false;
    EnumMap<Letter, int> restored;
    return ParseSucceeds(restored, json) && restored == original;
}(), "52 keys");

static_assert([]() constexpr {
    const auto original = EnumMap<std::uint8_t, std::uint8_t>::from_fn([](std::uint8_t b) {
        return static_cast<std::uint8_t>(255 - b);
    });
    std::string json;
    if (!Serialize(original, json)) return false;
    EnumMap<std::uint8_t, std::uint8_t> restored;
    return ParseSucceeds(restored, json) && restored == original;
}(), "byte keys");

int main() {
    return 0;
}
