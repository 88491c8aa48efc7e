#include "flag_cache.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

flageval::feature_flag make_flag(const std::string& key, bool active = true) {
    flageval::feature_flag f;
    f.key = key;
    f.active = active;
    return f;
}

// Snapshot with `count` flags, each tagged with the same generation
flageval::definitions_snapshot make_definitions(int count, int generation = 0) {
    flageval::definitions_snapshot defs;
    for (int i = 0; i < count; ++i) {
        auto f = make_flag("flag-" + std::to_string(i));
        f.payloads["generation"] = generation;
        defs.flags.emplace(f.key, std::move(f));
    }
    defs.group_type_mapping["count"] = std::to_string(count);
    return defs;
}

} // namespace

TEST(flag_cache, starts_empty) {
    flageval::flag_cache cache(make_log());

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.version(), 0u);
    EXPECT_FALSE(cache.get("anything").has_value());
    EXPECT_TRUE(cache.get_all().empty());
    EXPECT_TRUE(cache.cohorts().empty());
    ASSERT_NE(cache.snapshot(), nullptr);
}

TEST(flag_cache, replace_publishes_new_version) {
    flageval::flag_cache cache(make_log());

    cache.replace(make_definitions(3));
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.version(), 1u);
    ASSERT_TRUE(cache.get("flag-2").has_value());
    EXPECT_EQ(cache.get("flag-2")->key, "flag-2");
    EXPECT_EQ(cache.get_all().size(), 3u);

    // Wholesale replace, no merge
    cache.replace(make_definitions(1));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.version(), 2u);
    EXPECT_FALSE(cache.get("flag-2").has_value());
}

TEST(flag_cache, clear) {
    flageval::flag_cache cache(make_log());
    cache.replace(make_definitions(2));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.version(), 2u);
    EXPECT_TRUE(cache.group_type_mapping().empty());
}

TEST(flag_cache, side_tables) {
    flageval::flag_cache cache;

    auto defs = make_definitions(1);
    defs.group_type_mapping["0"] = "company";
    defs.cohorts["7"] = nlohmann::json{{"type", "OR"}};
    cache.replace(std::move(defs));

    EXPECT_EQ(cache.group_type_mapping().at("0"), "company");
    ASSERT_TRUE(cache.cohort("7").has_value());
    EXPECT_EQ((*cache.cohort("7"))["type"], "OR");
    EXPECT_FALSE(cache.cohort("8").has_value());
    EXPECT_EQ(cache.cohorts().size(), 1u);
}

TEST(flag_cache, held_snapshot_is_immutable) {
    flageval::flag_cache cache(make_log());
    cache.replace(make_definitions(2));

    auto held = cache.snapshot();
    cache.replace(make_definitions(5));

    // Readers keep the snapshot they took
    EXPECT_EQ(held->version, 1u);
    EXPECT_EQ(held->definitions.flags.size(), 2u);
    EXPECT_EQ(cache.snapshot()->definitions.flags.size(), 5u);
}

TEST(flag_cache, concurrent_readers_never_see_mixed_snapshots) {
    flageval::flag_cache cache(make_log());
    cache.replace(make_definitions(1, 1));

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::atomic<uint64_t> reads{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!done) {
                auto snap = cache.snapshot();
                const auto& defs = snap->definitions;

                auto expected = std::stoul(defs.group_type_mapping.at("count"));
                if (defs.flags.size() != expected) violations++;

                std::optional<int> generation;
                for (const auto& [key, flag] : defs.flags) {
                    int g = flag.payloads.at("generation").get<int>();
                    if (generation && *generation != g) violations++;
                    generation = g;
                }
                reads++;
            }
        });
    }

    for (int gen = 2; gen < 300; ++gen) {
        cache.replace(make_definitions(1 + gen % 17, gen));
    }
    done = true;
    for (auto& r : readers) r.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_GT(reads.load(), 0u);
    EXPECT_EQ(cache.version(), 299u);
}
