#include "../test_helpers.hpp"
#include "../test_keys.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
using namespace TestHelpers;
using namespace EnumFusion;
using namespace test_keys;

// ============================================================================
// Members in ascending index order, named by the key text
// ============================================================================

static_assert(TestSerialize(enum_map<Example, int>(entry(Example::A, 5), entry(Example::B, 10), otherwise(-1)),
                            R"({"A":5,"B":10,"C":-1})"));

static_assert(TestSerialize(enum_map<Shuffled, int>(entry(Shuffled::C, 3), otherwise(0)),
                            R"({"A":0,"B":0,"C":3})"));

static_assert(TestSerialize(EnumMap<bool, bool>::from_fn([](bool b) { return !b; }),
                            R"({"false":true,"true":false})"));

static_assert(TestSerialize(EnumMap<Nothing, int>{}, "{}"));

static_assert(TestSerialize(EnumMap<std::optional<bool>, int>::from_fn([](std::optional<bool> k) {
                                return static_cast<int>(encode(k));
                            }),
                            R"({"None":0,"Some(false)":1,"Some(true)":2})"));

static_assert(TestSerialize(EnumMap<Shape, int>{},
                            R"({"Dot":0,"Circle(false)":0,"Circle(true)":0,"2(Red)":0,"2(Green)":0,"2(Blue)":0})"));

// ============================================================================
// Value kinds
// ============================================================================

static_assert(TestSerialize(enum_map<bool, std::optional<int>>(entry(true, 4), otherwise(std::nullopt)),
                            R"({"false":null,"true":4})"));

static_assert(TestSerialize(enum_map<bool, std::string>(entry(false, "tab\there"), entry(true, "quote\"back\\slash\x01")),
                            R"({"false":"tab\there","true":"quote\"back\\slash\u0001"})"));

static_assert(TestSerialize(enum_map<bool, std::int64_t>(entry(false, INT64_MIN), entry(true, INT64_MAX)),
                            R"({"false":-9223372036854775808,"true":9223372036854775807})"));

static_assert(TestSerialize(EnumMap<bool, std::uint8_t>::from_fn([](bool b) { return std::uint8_t(b ? 255 : 0); }),
                            R"({"false":0,"true":255})"));

static_assert(TestSerialize(enum_map<Example, Point>(entry(Example::A, Point{true, Color::Red}), otherwise(Point{false, Color::Blue})),
                            R"({"A":"(true,Red)","B":"(false,Blue)","C":"(false,Blue)"})"));

static_assert(TestSerialize(EnumMap<bool, EnumMap<Color, int>>::from_fn([](bool b) {
                                return EnumMap<Color, int>::from_fn([&](Color c) { return static_cast<int>(encode(c)) + (b ? 10 : 0); });
                            }),
                            R"({"false":{"Red":0,"Green":1,"Blue":2},"true":{"Red":10,"Green":11,"Blue":12}})"));

// ============================================================================
// Pretty printing
// ============================================================================

static_assert(TestSerializePretty(enum_map<Example, int>(entry(Example::A, 5), entry(Example::B, 10), otherwise(15)),
R"({
  "A": 5,
  "B": 10,
  "C": 15
})"));

static_assert(TestSerializePretty(EnumMap<bool, EnumMap<bool, int>>{},
R"({
  "false": {
    "false": 0,
    "true": 0
  },
  "true": {
    "false": 0,
    "true": 0
  }
})"));

static_assert(TestSerializePretty(EnumMap<bool, EnumMap<Nothing, int>>{},
R"({
  "false": {},
  "true": {}
})"));

// ============================================================================
// Bounded output
// ============================================================================

static_assert([]() constexpr {
    std::array<char, 8> buf{};
    auto it = buf.begin();
    auto result = Serialize(EnumMap<bool, int>{}, it, buf.end());
    return !result
        && result.error() == SerializeError::WRITER_ERROR
        && result.writerError() == JsonIteratorWriterError::OUTPUT_OVERFLOW
        && it == buf.end();
}(), "output buffer too small");

static_assert([]() constexpr {
    std::array<char, 24> buf{};
    char * it = buf.data();
    auto result = Serialize(EnumMap<bool, int>{}, it, buf.data() + buf.size());
    return result
        && std::string_view(buf.data(), static_cast<std::size_t>(it - buf.data())) == R"({"false":0,"true":0})";
}(), "output fits");

int main() {
    return 0;
}
