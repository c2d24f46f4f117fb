#include "../test_helpers.hpp"
#include "../test_keys.hpp"
#include <array>
#include <utility>
using namespace TestHelpers;
using namespace EnumFusion;
using namespace test_keys;

// ============================================================================
// std::optional: None first, then Some(T)
// ============================================================================

using MaybeBool = std::optional<bool>;

static_assert(cardinality_v<MaybeBool> == 3);
static_assert(encode(MaybeBool{}) == 0);
static_assert(encode(MaybeBool{false}) == 1);
static_assert(encode(MaybeBool{true}) == 2);
static_assert(decode<MaybeBool>(0) == std::nullopt);
static_assert(decode<MaybeBool>(2) == MaybeBool{true});
static_assert(IndexRoundTrips<MaybeBool>());

static_assert(cardinality_v<std::optional<std::optional<bool>>> == 4);
static_assert(cardinality_v<std::optional<Nothing>> == 1);

// ============================================================================
// Products: first field varies fastest
// ============================================================================

using BoolColor = std::tuple<bool, Color>;

static_assert(cardinality_v<BoolColor> == 6);
static_assert(key_traits<BoolColor>::radix(0) == 2);
static_assert(key_traits<BoolColor>::radix(1) == 3);
static_assert(key_traits<BoolColor>::weight(0) == 1);
static_assert(key_traits<BoolColor>::weight(1) == 2);
static_assert(encode(BoolColor{false, Color::Red}) == 0);
static_assert(encode(BoolColor{true, Color::Red}) == 1);
static_assert(encode(BoolColor{false, Color::Green}) == 2);
static_assert(encode(BoolColor{true, Color::Blue}) == 5);
static_assert(decode<BoolColor>(3) == BoolColor{true, Color::Green});
static_assert(IndexRoundTrips<BoolColor>());
static_assert(DecodeIsInjective<BoolColor>());

static_assert(cardinality_v<std::pair<bool, bool>> == 4);
static_assert(cardinality_v<std::array<bool, 3>> == 8);
static_assert(encode(std::array<bool, 3>{false, false, true}) == 4);
static_assert(IndexRoundTrips<std::array<bool, 3>>());

// A field without values empties the product
static_assert(cardinality_v<std::tuple<bool, Nothing>> == 0);

// Aggregates through PFR
static_assert(cardinality_v<Point> == 6);
static_assert(encode(Point{true, Color::Green}) == 3);
static_assert(decode<Point>(5) == Point{true, Color::Blue});
static_assert(IndexRoundTrips<Point>());

static_assert(cardinality_v<Empty> == 1);

// KeyFields lists `second` before `first`, so `second` varies fastest
static_assert(cardinality_v<Described> == 6);
static_assert(encode(Described{Color::Red, true}) == 1);
static_assert(encode(Described{Color::Green, false}) == 2);
static_assert(IndexRoundTrips<Described>());

// ============================================================================
// std::variant: alternatives occupy consecutive ranges
// ============================================================================

static_assert(cardinality_v<Shape> == 1 + 2 + 3);
static_assert(key_traits<Shape>::base_of(0) == 0);
static_assert(key_traits<Shape>::base_of(1) == 1);
static_assert(key_traits<Shape>::base_of(2) == 3);
static_assert(encode(Shape{Dot{}}) == 0);
static_assert(encode(Shape{Circle{false}}) == 1);
static_assert(encode(Shape{Circle{true}}) == 2);
static_assert(encode(Shape{Color::Red}) == 3);
static_assert(encode(Shape{Color::Blue}) == 5);
static_assert(decode<Shape>(4) == Shape{Color::Green});
static_assert(IndexRoundTrips<Shape>());
static_assert(DecodeIsInjective<Shape>());

// Empty alternatives are skipped when decoding
using Gappy = std::variant<Nothing, bool, Nothing, Color>;
static_assert(cardinality_v<Gappy> == 5);
static_assert(decode<Gappy>(0).index() == 1);
static_assert(decode<Gappy>(2).index() == 3);
static_assert(IndexRoundTrips<Gappy>());

// Cardinality is the sum over alternatives, the product over fields
static_assert(cardinality_v<std::variant<bool, BoolColor, std::monostate>> ==
              cardinality_v<bool> + cardinality_v<BoolColor> + 1);
static_assert(cardinality_v<std::tuple<Example, MaybeBool, Point>> ==
              cardinality_v<Example> * cardinality_v<MaybeBool> * cardinality_v<Point>);

// Deep nesting
using Nested = std::optional<std::variant<std::tuple<bool, Example>, std::optional<Color>>>;
static_assert(cardinality_v<Nested> == 1 + 6 + 4);
static_assert(IndexRoundTrips<Nested>());
static_assert(DecodeIsInjective<Nested>());

// ============================================================================
// A user codec: any full specialization of key_traits
// ============================================================================

struct Parity {
    bool odd;
    friend constexpr bool operator==(const Parity &, const Parity &) = default;
};

template<>
struct EnumFusion::key_traits<Parity> {
    static constexpr std::size_t cardinality = 2;
    static constexpr std::size_t encode(const Parity & p) { return p.odd ? 0 : 1; }
    static constexpr Parity decode(std::size_t i) { return Parity{i == 0}; }
};

static_assert(EnumKey<Parity>);
static_assert(encode(Parity{true}) == 0);
static_assert(cardinality_v<std::optional<Parity>> == 3);
static_assert(IndexRoundTrips<std::tuple<Parity, bool>>());

int main() {
    return 0;
}
