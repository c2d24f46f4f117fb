#include "../test_helpers.hpp"
#include "../test_keys.hpp"
#include <optional>
#include <string>
using namespace TestHelpers;
using namespace EnumFusion;
using namespace test_keys;

using ExampleInts = EnumMap<Example, int>;

// ============================================================================
// Completeness
// ============================================================================

static_assert(TestParseError<ExampleInts>(R"({"A": 1, "B": 2})", ParseError::KEY_NOT_SPECIFIED));
static_assert(TestParseError<ExampleInts>(R"({})", ParseError::KEY_NOT_SPECIFIED));
static_assert(TestParseError<ExampleInts>(R"({"A": 1, "A": 2, "B": 3})", ParseError::KEY_NOT_SPECIFIED));
static_assert(error_to_string(ParseError::KEY_NOT_SPECIFIED) == "key not specified");

// Nested maps must be complete as well
static_assert(TestParseError<EnumMap<bool, EnumMap<bool, int>>>(
    R"({"false": {"false": 1, "true": 2}, "true": {"true": 3}})", ParseError::KEY_NOT_SPECIFIED));

// ============================================================================
// Keys outside the domain
// ============================================================================

static_assert(TestParseError<ExampleInts>(R"({"A": 1, "B": 2, "C": 3, "D": 4})", ParseError::UNKNOWN_KEY));
static_assert(TestParseError<ExampleInts>(R"({"a": 1, "B": 2, "C": 3})", ParseError::UNKNOWN_KEY));
static_assert(TestParseError<ExampleInts>(R"({"0": 1, "1": 2, "2": 3})", ParseError::UNKNOWN_KEY));
static_assert(TestParseError<EnumMap<bool, int>>(R"({"false": 1, "true ": 2})", ParseError::UNKNOWN_KEY));
static_assert(TestParseError<EnumMap<std::optional<bool>, int>>(R"({"Some(maybe)": 1})", ParseError::UNKNOWN_KEY));

static_assert([]() constexpr {
    ExampleInts m;
    // 0123
    // {"D": 1}   error reported right after the member name
    return ParseFailsAt(m, std::string_view(R"({"D": 1})"), ParseError::UNKNOWN_KEY, 4);
}());

// ============================================================================
// Value kinds
// ============================================================================

static_assert(TestParseError<ExampleInts>(R"({"A": "1", "B": 2, "C": 3})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<ExampleInts>(R"({"A": 1.5, "B": 2, "C": 3})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<ExampleInts>(R"({"A": 1e3, "B": 2, "C": 3})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<ExampleInts>(R"({"A": true, "B": 2, "C": 3})", ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<ExampleInts>(R"({"A": null, "B": 2, "C": 3})", ParseError::NULL_IN_NON_OPTIONAL));
static_assert(TestParseError<EnumMap<bool, bool>>(R"({"false": 0, "true": 1})", ParseError::NON_BOOL_IN_BOOL_VALUE));
static_assert(TestParseError<EnumMap<bool, std::string>>(R"({"false": 5, "true": "x"})", ParseError::NON_STRING_IN_STRING_STORAGE));
static_assert(TestParseError<EnumMap<bool, Example>>(R"({"false": 1, "true": "A"})", ParseError::NON_STRING_IN_STRING_STORAGE));
static_assert(TestParseError<EnumMap<bool, Example>>(R"({"false": "D", "true": "A"})", ParseError::ILLFORMED_KEY_VALUE));
static_assert(TestParseError<EnumMap<bool, EnumMap<bool, int>>>(R"({"false": [], "true": {}})", ParseError::NON_MAP_IN_ENUM_MAP));

// ============================================================================
// Not an object
// ============================================================================

static_assert(TestParseError<ExampleInts>(R"([1, 2, 3])", ParseError::NON_MAP_IN_ENUM_MAP));
static_assert(TestParseError<ExampleInts>(R"("A")", ParseError::NON_MAP_IN_ENUM_MAP));
static_assert(TestParseError<ExampleInts>(R"(42)", ParseError::NON_MAP_IN_ENUM_MAP));

// ============================================================================
// Malformed JSON
// ============================================================================

static_assert(TestParseError<ExampleInts>("", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(TestParseError<ExampleInts>(R"({"A": 1, "B": 2, "C": 3)", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(TestParseError<ExampleInts>(R"({"A": 1, "B": 2, "C": 3,})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(TestParseError<ExampleInts>(R"({"A": 1 "B": 2, "C": 3})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(TestParseError<ExampleInts>(R"({"A" 1, "B": 2, "C": 3})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(TestParseError<ExampleInts>(R"({A: 1})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(TestParseError<ExampleInts>(R"({"A": 1, "B": 2, "C": 3} {})", JsonIteratorReaderError::EXCESS_CHARACTERS));
static_assert(TestParseError<ExampleInts>(R"({"A": 01, "B": 2, "C": 3})", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(TestParseError<ExampleInts>(R"({"A": -, "B": 2, "C": 3})", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(TestParseError<ExampleInts>(R"({"A": 2147483648, "B": 2, "C": 3})",
                                          JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<EnumMap<bool, std::uint8_t>>(R"({"false": 256, "true": 0})",
                                                          JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<EnumMap<bool, bool>>(R"({"false": tru, "true": false})", JsonIteratorReaderError::ILLFORMED_BOOL));
static_assert(TestParseError<EnumMap<bool, std::optional<int>>>(R"({"false": nul, "true": 1})", JsonIteratorReaderError::ILLFORMED_NULL));
static_assert(TestParseError<EnumMap<bool, std::string>>(R"({"false": "a
b", "true": ""})", JsonIteratorReaderError::ILLFORMED_STRING));
static_assert(TestParseError<EnumMap<bool, std::string>>(R"({"false": "\x", "true": ""})", JsonIteratorReaderError::ILLFORMED_STRING));

// ============================================================================
// A failed parse leaves the target as it was
// ============================================================================

static_assert([]() constexpr {
    auto m = enum_map<Example, int>(otherwise(7));
    const auto before = m;
    return ParseFailsWith(m, std::string_view(R"({"A": 1, "B": 2})"), ParseError::KEY_NOT_SPECIFIED)
        && m == before;
}(), "missing key");

static_assert([]() constexpr {
    auto m = enum_map<Example, int>(otherwise(7));
    const auto before = m;
    return ParseFails(m, std::string_view(R"({"A": 1, "B": 2, "C": 3} trailing)"))
        && m == before;
}(), "excess characters after a complete object");

static_assert([]() constexpr {
    auto m = enum_map<Example, int>(otherwise(7));
    const auto before = m;
    return ParseFails(m, std::string_view(R"({"A": 1, "B": "two", "C": 3})"))
        && m == before;
}(), "type mismatch in the middle");

int main() {
    return 0;
}
