// Fuzz harness: draws an EnumMap from the input bytes and checks that it
// survives a JSON round trip.
// libFuzzer build: clang++ -std=c++23 -fsanitize=fuzzer -DENUMFUSION_LIBFUZZER -I../include fuzz_roundtrip.cpp -lspdlog -lfmt
// Without it the binary replays the files named on the command line.

#include <EnumFusion/enum_fusion.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

using namespace EnumFusion;

enum class Mode { Off, Low, High };

template<>
struct EnumFusion::KeyMeta<Mode> {
    using Variants = KeyVariants<
        Variant<Mode::Off, "off">,
        Variant<Mode::Low, "low">,
        Variant<Mode::High, "high">>;
};

using Key = std::variant<Mode, std::optional<bool>, std::uint8_t>;
using Map = EnumMap<Key, std::optional<std::int16_t>>;

static int run_one(const std::uint8_t * data, std::size_t size) {
    Unstructured u(std::span<const std::uint8_t>(data, size));
    Map original;
    if (arbitrary(u, original) != ArbitraryError::NO_ERROR) {
        return 0;
    }

    std::string json;
    if (auto res = Serialize(original, json); !res) {
        spdlog::critical("serialize failed: {}", error_to_string(res.writerError()));
        std::abort();
    }
    Map restored;
    if (auto res = Parse(restored, json); !res) {
        spdlog::critical("parse failed: {} / {}", error_to_string(res.error()), error_to_string(res.readerError()));
        std::abort();
    }
    if (!(restored == original)) {
        spdlog::critical("round trip changed the map: {}", json);
        std::abort();
    }
    return 0;
}

#ifdef ENUMFUSION_LIBFUZZER

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t * data, std::size_t size) {
    return run_one(data, size);
}

#else

int main(int argc, char ** argv) {
    constexpr SizeHint hint = size_hint<Map>();
    spdlog::info("one map takes {} to {} bytes", hint.min, hint.max.value_or(0));
    for (int i = 1; i < argc; ++i) {
        std::ifstream in(argv[i], std::ios::binary);
        const std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        run_one(bytes.data(), bytes.size());
        spdlog::info("{}: ok", argv[i]);
    }
    return 0;
}

#endif
