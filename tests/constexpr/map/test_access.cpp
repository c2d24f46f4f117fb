#include "../test_helpers.hpp"
#include "../test_keys.hpp"
#include <memory>
#include <optional>
#include <string>
using namespace TestHelpers;
using namespace EnumFusion;
using namespace test_keys;

// ============================================================================
// Boolean key, integer value
// ============================================================================

static_assert([]() constexpr {
    auto m = EnumMap<bool, int>::from_fn([](bool k) { return k ? 42 : 24; });
    if (m[false] != 24 || m.get(true) != 42) return false;

    m.set(false, 25);
    if (m[false] != 25) return false;

    for (auto [key, value] : m) {
        if (!key) ++value;
    }
    return m[false] == 26 && m[true] == 42;
}(), "get / set / mutable iteration on a bool key");

// ============================================================================
// Option key: linear view follows the index order
// ============================================================================

static_assert([]() constexpr {
    using K = std::optional<bool>;
    EnumMap<K, int> m;
    static_assert(EnumMap<K, int>::size() == 3);

    m[std::nullopt] = 1;
    m[K{false}] = 2;
    m[K{true}] = 3;
    m.set(std::nullopt, 4);
    m.set(K{false}, 5);
    m.set(K{true}, 6);

    const auto view = m.as_slice();
    if (view[0] != 4 || view[1] != 5 || view[2] != 6) return false;

    const std::optional<bool> keys[] = {std::nullopt, false, true};
    const int values[] = {4, 5, 6};
    std::size_t i = 0;
    for (auto [key, value] : m.iter()) {
        if (key != keys[i] || value != values[i]) return false;
        ++i;
    }
    return i == 3;
}(), "option key keeps None, Some(false), Some(true) order");

// ============================================================================
// Storage position equals the key index, also after mutation
// ============================================================================

static_assert([]() constexpr {
    EnumMap<Point, int> m;
    for (std::size_t i = 0; i < m.size(); ++i) {
        m[decode<Point>(i)] = static_cast<int>(i * 10);
    }
    m[Point{true, Color::Blue}] = -1;

    auto slice = m.as_mut_slice();
    slice[0] = 100;

    return m.data()[encode(Point{true, Color::Blue})] == -1
        && m[Point{false, Color::Red}] == 100
        && m[Point{true, Color::Red}] == 10;
}());

// ============================================================================
// Default construction and values
// ============================================================================

static_assert([]() constexpr {
    EnumMap<Example, std::string> m;
    for (const std::string & s : m.values()) {
        if (!s.empty()) return false;
    }
    m[Example::B] = "b";
    return m.values()[1] == "b";
}());

static_assert([]() constexpr {
    auto m = from_fn<Example>([](Example e) { return static_cast<int>(encode(e)) + 1; });
    static_assert(std::is_same_v<decltype(m), EnumMap<Example, int>>);
    return m[Example::A] == 1 && m[Example::C] == 3;
}());

// ============================================================================
// Swapping values between keys and between maps
// ============================================================================

static_assert([]() constexpr {
    auto m = EnumMap<Example, int>::from_fn([](Example e) { return static_cast<int>(encode(e)); });
    m.swap(Example::A, Example::C);
    if (m[Example::A] != 2 || m[Example::C] != 0 || m[Example::B] != 1) return false;

    m.swap(Example::B, Example::B);
    if (m[Example::B] != 1) return false;

    EnumMap<Example, int> other;
    swap(m, other);
    return m[Example::A] == 0 && other[Example::A] == 2;
}());

// ============================================================================
// Comparison follows the values
// ============================================================================

static_assert([]() constexpr {
    EnumMap<bool, int> a;
    EnumMap<bool, int> b;
    if (!(a == b)) return false;
    b[true] = 1;
    if (a == b || !(a < b)) return false;
    a[false] = 1;
    return a > b;
}());

// Copy and move follow the value type
static_assert(std::is_trivially_copyable_v<EnumMap<Example, int>>);
static_assert(!std::is_copy_constructible_v<EnumMap<Example, std::unique_ptr<int>>>);
static_assert(std::is_move_constructible_v<EnumMap<Example, std::unique_ptr<int>>>);
static_assert(sizeof(EnumMap<Letter, int>) == 52 * sizeof(int));

int main() {
    return 0;
}
