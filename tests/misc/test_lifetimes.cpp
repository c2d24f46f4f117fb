#include <array>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <EnumFusion/enum_map.hpp>

#include "../constexpr/test_keys.hpp"

using namespace EnumFusion;
using test_keys::Letter;

// Counts live objects per id. Moved-from objects no longer own their id, so
// destroying them is not reported.
struct Tracker {
    static constexpr std::size_t MaxIds = 256;
    static inline std::array<int, MaxIds> created{};
    static inline std::array<int, MaxIds> dropped{};

    static void reset() {
        created.fill(0);
        dropped.fill(0);
    }
    static int live() {
        int n = 0;
        for (std::size_t i = 0; i < MaxIds; ++i) n += created[i] - dropped[i];
        return n;
    }
    static bool each_dropped_once(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            if (created[i] != 1 || dropped[i] != 1) return false;
        }
        return true;
    }
};

struct Counted {
    std::size_t id = 0;
    bool owner = false;

    explicit Counted(std::size_t i) : id(i), owner(true) {
        ++Tracker::created[id];
    }
    Counted(Counted && other) noexcept : id(other.id), owner(other.owner) {
        other.owner = false;
    }
    Counted & operator=(Counted && other) noexcept {
        if (this != &other) {
            release();
            id = other.id;
            owner = other.owner;
            other.owner = false;
        }
        return *this;
    }
    Counted(const Counted &) = delete;
    Counted & operator=(const Counted &) = delete;
    ~Counted() { release(); }

private:
    void release() {
        if (owner) {
            ++Tracker::dropped[id];
            owner = false;
        }
    }
};

struct Boom : std::runtime_error {
    using std::runtime_error::runtime_error;
};


void from_fn_tests() {
    // Initializer throws halfway: exactly the built prefix is released
    for (std::size_t fail_at : {std::size_t{0}, std::size_t{1}, std::size_t{25}, std::size_t{51}}) {
        Tracker::reset();
        bool thrown = false;
        try {
            auto m = EnumMap<Letter, Counted>::from_fn([&](Letter l) {
                const std::size_t i = encode(l);
                if (i == fail_at) throw Boom("initializer failed");
                return Counted(i);
            });
            (void)m;
        } catch (const Boom &) {
            thrown = true;
        }
        assert(thrown);
        assert(Tracker::live() == 0);
        assert(Tracker::each_dropped_once(fail_at));
        assert(Tracker::created[fail_at] == 0);
    }

    // Success: every value built once, released once with the map
    Tracker::reset();
    {
        auto m = EnumMap<Letter, Counted>::from_fn([](Letter l) { return Counted(encode(l)); });
        assert(Tracker::live() == 52);
        assert(m[Letter::z].id == 51);
    }
    assert(Tracker::live() == 0);
    assert(Tracker::each_dropped_once(52));
}

void map_tests() {
    // Consuming map that throws: new values built so far are released,
    // source values stay with the source and are released with it
    Tracker::reset();
    bool thrown = false;
    {
        auto source = EnumMap<bool, Counted>::from_fn([](bool b) { return Counted(b ? 1 : 0); });
        try {
            auto mapped = std::move(source).map([](bool b, Counted && c) {
                if (b) throw Boom("transform failed");
                Counted taken = std::move(c);
                return Counted(taken.id + 100);
            });
            (void)mapped;
        } catch (const Boom &) {
            thrown = true;
        }
        assert(thrown);
        assert(Tracker::created[100] == 1 && Tracker::dropped[100] == 1);
        assert(Tracker::dropped[0] == 1);   // moved into `taken`, released there
        assert(Tracker::dropped[1] == 0);   // still owned by source
    }
    assert(Tracker::live() == 0);
    assert(Tracker::dropped[1] == 1);

    // Consuming map that succeeds
    Tracker::reset();
    {
        auto source = EnumMap<bool, Counted>::from_fn([](bool b) { return Counted(b ? 1 : 0); });
        auto mapped = std::move(source).map([](bool, Counted && c) { return std::move(c); });
        assert(Tracker::live() == 2);
        assert(mapped[true].id == 1 && mapped[true].owner);
        assert(!source[true].owner);
    }
    assert(Tracker::live() == 0);
    assert(Tracker::each_dropped_once(2));
}

void into_entries_tests() {
    // Stop early: the rest is released by the owning range, once
    Tracker::reset();
    {
        auto m = EnumMap<Letter, Counted>::from_fn([](Letter l) { return Counted(encode(l)); });
        auto owned = std::move(m).into_entries();
        std::size_t seen = 0;
        for (auto [key, value] : owned) {
            assert(encode(key) == value.id);
            if (++seen == 10) break;
        }
        assert(Tracker::each_dropped_once(10));
        assert(Tracker::live() == 42);
    }
    assert(Tracker::live() == 0);
    assert(Tracker::each_dropped_once(52));

    // Nothing taken at all
    Tracker::reset();
    {
        auto owned = EnumMap<bool, Counted>::from_fn([](bool b) { return Counted(b ? 1 : 0); }).into_entries();
        assert(Tracker::live() == 2);
    }
    assert(Tracker::each_dropped_once(2));

    // Backwards
    Tracker::reset();
    {
        auto owned = EnumMap<bool, Counted>::from_fn([](bool b) { return Counted(b ? 1 : 0); }).into_entries();
        auto it = owned.rbegin();
        {
            auto [key, value] = *it;
            assert(key == true && value.id == 1);
        }
        assert(Tracker::dropped[1] == 1 && Tracker::dropped[0] == 0);
    }
    assert(Tracker::each_dropped_once(2));
}

void move_only_values() {
    auto m = EnumMap<bool, std::unique_ptr<std::string>>::from_fn([](bool b) {
        return std::make_unique<std::string>(b ? "on" : "off");
    });
    auto moved = std::move(m);
    assert(*moved[false] == "off");
    assert(m[false] == nullptr);

    auto lengths = moved.map([](bool, const std::unique_ptr<std::string> & p) { return p->size(); });
    assert(lengths[false] == 3 && lengths[true] == 2);
}

int main() {
    from_fn_tests();
    map_tests();
    into_entries_tests();
    move_only_values();
    std::cout << "lifetime tests passed" << std::endl;
}
