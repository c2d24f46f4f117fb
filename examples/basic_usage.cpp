// Basic EnumFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lspdlog -lfmt -o basic_usage

#include <EnumFusion/enum_fusion.hpp>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace EnumFusion;

enum class Channel { Red, Green, Blue, Alpha };

template<>
struct EnumFusion::KeyMeta<Channel> {
    using Variants = KeyVariants<
        Variant<Channel::Red, "red">,
        Variant<Channel::Green, "green">,
        Variant<Channel::Blue, "blue">,
        Variant<Channel::Alpha, "alpha">>;
};

struct Route {
    bool inverted;
    Channel channel;
};

int main() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_st>();
    auto logger = spdlog::logger("basic_usage", sink);

    // Every channel gets a gain, the alpha channel keeps unity
    auto gains = enum_map<Channel, int>(
        entry({Channel::Red, Channel::Green, Channel::Blue}, 80),
        otherwise(100));
    gains[Channel::Blue] = 120;
    logger.info("gains: {}", std::format("{}", gains));

    for (auto [channel, gain] : gains) {
        logger.debug("{} -> {} (index {})", key_text::to_string(channel), gain, encode(channel));
    }

    // Composite keys: 2 * 4 routes, all of them present
    auto routing = EnumMap<Route, std::optional<Channel>>::from_fn([](const Route & r) -> std::optional<Channel> {
        if (r.inverted) return std::nullopt;
        return r.channel;
    });
    logger.info("{} routes, first is {}", routing.size(), key_text::to_string(routing.begin().key()));

    std::string json;
    if (auto res = SerializePretty(routing, json); !res) {
        logger.error("serialization failed: {}", error_to_string(res.writerError()));
        return 1;
    }
    logger.info("routing as JSON:\n{}", json);

    const std::string_view input = R"({"red": 10, "green": 20, "blue": 30})";
    EnumMap<Channel, int> parsed;
    if (auto res = Parse(parsed, input); !res) {
        logger.warn("parse failed at offset {}: {}", res.pos() - input.data(), error_to_string(res.error()));
    }

    const std::string_view complete = R"({"alpha": 1, "red": 10, "green": 20, "blue": 30})";
    if (auto res = Parse(parsed, complete); !res) {
        logger.error("parse failed at offset {}: {}", res.pos() - complete.data(), error_to_string(res.error()));
        return 1;
    }
    logger.info("parsed: {}", std::format("{}", parsed));
    return 0;
}
