#include "hf-test.hpp"

#include "dataset.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <memory>
#include <thread>
#include <vector>

#include "except.h"
#include "hfnumeric.h"
#include "test-data.hpp"

namespace {

// #region mock data
constexpr auto NativeRate = 48000u;
constexpr auto TargetRate = 44100u;
constexpr auto NativeLength = 256_uz;

auto Positions() -> std::vector<hf::Position>
{
    return {hf::MakePosition(0.0, 0.0, 1.0), hf::MakePosition(90.0, 0.0, 1.0),
        hf::MakePosition(270.0, 30.0, 1.0)};
}

auto MakeFake(std::vector<u32> subjects, std::vector<hf::Side> sides)
    -> std::shared_ptr<hftest::FakeAdapter>
{
    return std::make_shared<hftest::FakeAdapter>(std::move(subjects), std::move(sides),
        Positions(), NativeRate, NativeLength);
}

auto MakeFake() -> std::shared_ptr<hftest::FakeAdapter>
{ return MakeFake({1, 2}, {hf::Side::Left, hf::Side::Right}); }

auto MakeConfig(hf::SideSelection sides=hf::SideSelection::Any) -> hf::DatasetConfig
{
    auto config = hf::DatasetConfig{};
    config.sampleRate = TargetRate;
    config.sides = sides;
    return config;
}

/* What the dataset should return for the locator, unprocessed. */
auto Expected(const hf::Locator &loc) -> std::vector<f64>
{
    return hf::Resample(hftest::FakeAdapter::Signal(loc, NativeRate, NativeLength), NativeRate,
        TargetRate);
}

auto CountSide(const std::vector<hf::MeasurementKey> &keys, hf::Side side) -> usize
{
    return static_cast<usize>(std::count_if(keys.begin(), keys.end(),
        [side](const hf::MeasurementKey &key) { return key.side == side; }));
}
// #endregion mock data


// #region unit tests
SCENARIO( "A synthetic dataset resampled to a new rate", "[dataset]" ) {
    GIVEN( "2 subjects with 2 ears at 3 positions, at 48 kHz" ) {
        auto const adapter = MakeFake();
        auto const dataset = hf::Dataset{adapter, MakeConfig()};

        THEN( "it holds 12 measurements" ) {
            CHECK( dataset.size() == 12 );
            CHECK( dataset.subjects() == std::vector<u32>{1, 2} );
            CHECK( dataset.sampleRate() == TargetRate );
        }
        THEN( "nothing is read until asked for" ) {
            CHECK( adapter->reads() == 0 );
        }
        THEN( "every record is at the target rate with the resampled length" ) {
            auto const expectedLength = ScaledLength(NativeLength, NativeRate, TargetRate);
            for(const auto &key : dataset.keys())
            {
                auto const record = dataset.get(key);
                CHECK( record.key == key );
                CHECK( record.sampleRate == TargetRate );
                CHECK( record.samples.size() >= expectedLength-1 );
                CHECK( record.samples.size() <= expectedLength+1 );
                CHECK( record.samples == Expected(dataset.index().locator_for(key)) );
            }
            CHECK( adapter->reads() == 12 );
        }
        THEN( "records are reachable by position in key order" ) {
            auto const keys = dataset.keys();
            CHECK( dataset.at(0).key == keys.front() );
            CHECK( dataset.at(11).key == keys.back() );
            CHECK_THROWS_AS( dataset.at(12), hf::key_error );
        }
        THEN( "unknown keys raise key errors" ) {
            auto const missing = hf::MeasurementKey{3, hf::Side::Left, Positions()[0]};
            CHECK_FALSE( dataset.contains(missing) );
            CHECK_THROWS_AS( dataset.get(missing), hf::key_error );
            CHECK( adapter->reads() == 0 );
        }
    }
}

TEST_CASE( "Iteration is restartable and ordered", "[dataset][iterate]" ) {
    auto const dataset = hf::Dataset{MakeFake(), MakeConfig()};

    auto walk = [&dataset]
    {
        auto keys = std::vector<hf::MeasurementKey>{};
        for(const auto &record : dataset)
            keys.emplace_back(record.key);
        return keys;
    };
    auto const first = walk();
    auto const second = walk();
    CHECK( first.size() == dataset.size() );
    CHECK( first == second );
    CHECK( first == dataset.keys() );
    CHECK( std::distance(dataset.begin(), dataset.end()) == 12 );
}

TEST_CASE( "Invalid configurations fail at construction", "[dataset][config]" ) {
    auto const adapter = MakeFake();

    SECTION( "A zero target rate" ) {
        auto config = MakeConfig();
        config.sampleRate = 0;
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
    SECTION( "Bad resampler parameters" ) {
        auto config = MakeConfig();
        config.resampler.transition = 0.75;
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
    SECTION( "A zero response length" ) {
        auto config = MakeConfig();
        config.processing.length = 0;
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
    SECTION( "An empty dataset" ) {
        auto const empty = MakeFake({}, {hf::Side::Left, hf::Side::Right});
        CHECK_THROWS_AS( hf::Dataset(empty, MakeConfig()), hf::config_error );
        CHECK( empty->reads() == 0 );
    }
    CHECK( adapter->reads() == 0 );
}

SCENARIO( "Taking a subset", "[dataset][subset]" ) {
    GIVEN( "a dataset" ) {
        auto const adapter = MakeFake();
        auto const dataset = hf::Dataset{adapter, MakeConfig()};

        WHEN( "a subset selects one subject's right ear" ) {
            auto const subset = dataset.subset({
                [](u32 subject) { return subject == 2; },
                {},
                [](hf::Side side) { return side == hf::Side::Right; }});

            THEN( "it is smaller and every key matches" ) {
                CHECK( subset.size() == 3 );
                CHECK( subset.size() <= dataset.size() );
                for(const auto &key : subset.keys())
                {
                    CHECK( key.subject == 2 );
                    CHECK( key.side == hf::Side::Right );
                }
            }
            THEN( "it shares the adapter without rescanning" ) {
                CHECK( subset.adapter() == dataset.adapter() );
                CHECK( adapter->reads() == 0 );
                CHECK( dataset.size() == 12 );
            }
            THEN( "its records match the parent's" ) {
                for(const auto &key : subset.keys())
                    CHECK( subset.get(key).samples == dataset.get(key).samples );
            }
        }
        WHEN( "a subset selects by position" ) {
            auto const subset = dataset.subset({{},
                [](const hf::Position &pos) { return pos.elevation > 0.0; }, {}});
            THEN( "only those positions remain" ) {
                CHECK( subset.size() == 4 );
            }
        }
        WHEN( "a subset matches nothing" ) {
            THEN( "it raises a config error" ) {
                CHECK_THROWS_AS( dataset.subset({[](u32) { return false; }, {}, {}}),
                    hf::config_error );
            }
        }
    }
}

TEST_CASE( "Concurrent reads return uncorrupted records", "[dataset][thread]" ) {
    auto const dataset = hf::Dataset{MakeFake(), MakeConfig()};
    auto const keys = dataset.keys();

    auto expected = std::vector<std::vector<f64>>{};
    for(const auto &key : keys)
        expected.emplace_back(Expected(dataset.index().locator_for(key)));

    constexpr auto NumThreads = 4_uz;
    constexpr auto Rounds = 8_uz;
    auto mismatches = std::atomic<usize>{0};
    auto reads = std::atomic<usize>{0};

    auto threads = std::vector<std::thread>{};
    for(usize t{0};t < NumThreads;++t)
    {
        threads.emplace_back([&,t]
        {
            for(usize round{0};round < Rounds;++round)
            {
                for(usize i{t};i < keys.size();i += NumThreads)
                {
                    auto const record = dataset.get(keys[i]);
                    if(record.key != keys[i] || record.samples != expected[i])
                        ++mismatches;
                    ++reads;
                }
            }
        });
    }
    for(auto &thread : threads)
        thread.join();

    CHECK( mismatches.load() == 0 );
    CHECK( reads.load() == keys.size()*Rounds );
}

TEST_CASE( "Side selections", "[dataset][side]" ) {
    auto const adapter = MakeFake();

    SECTION( "left" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(hf::SideSelection::Left)};
        CHECK( dataset.size() == 6 );
        CHECK( CountSide(dataset.keys(), hf::Side::Left) == 6 );
    }
    SECTION( "right" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(hf::SideSelection::Right)};
        CHECK( dataset.size() == 6 );
        CHECK( CountSide(dataset.keys(), hf::Side::Right) == 6 );
    }
    SECTION( "both" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(hf::SideSelection::Both)};
        CHECK( dataset.size() == 12 );
    }
    SECTION( "both-left mirrors the right ears" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(hf::SideSelection::BothLeft)};
        auto const keys = dataset.keys();
        CHECK( keys.size() == 12 );
        CHECK( CountSide(keys, hf::Side::Left) == 6 );
        CHECK( CountSide(keys, hf::Side::MirroredRight) == 6 );

        auto const mirrored = hf::MeasurementKey{1, hf::Side::MirroredRight,
            hf::MakePosition(270.0, 0.0, 1.0)};
        REQUIRE( dataset.contains(mirrored) );
        auto const record = dataset.get(mirrored);
        CHECK( record.key == mirrored );

        /* The data is the right ear's, measured at 90 degrees. */
        auto const full = hf::Dataset{adapter, MakeConfig(hf::SideSelection::Any)};
        auto const source = hf::MeasurementKey{1, hf::Side::Right,
            hf::MakePosition(90.0, 0.0, 1.0)};
        CHECK( record.samples == full.get(source).samples );
    }
    SECTION( "any-right mirrors the left ears" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(hf::SideSelection::AnyRight)};
        auto const keys = dataset.keys();
        CHECK( CountSide(keys, hf::Side::Right) == 6 );
        CHECK( CountSide(keys, hf::Side::MirroredLeft) == 6 );
        CHECK( dataset.contains({2, hf::Side::MirroredLeft, hf::MakePosition(90.0, 30.0, 1.0)}) );
    }
    SECTION( "subjects missing an ear" ) {
        auto const leftOnly = MakeFake({1, 2}, {hf::Side::Left});
        CHECK_THROWS_AS( hf::Dataset(leftOnly, MakeConfig(hf::SideSelection::Both)),
            hf::config_error );
        CHECK_THROWS_AS( hf::Dataset(leftOnly, MakeConfig(hf::SideSelection::BothRight)),
            hf::config_error );
        CHECK_THROWS_AS( hf::Dataset(leftOnly, MakeConfig(hf::SideSelection::Right)),
            hf::config_error );

        auto const anyRight = hf::Dataset{leftOnly, MakeConfig(hf::SideSelection::AnyRight)};
        CHECK( anyRight.size() == 6 );
        CHECK( CountSide(anyRight.keys(), hf::Side::MirroredLeft) == 6 );
    }
}

TEST_CASE( "Subject selections", "[dataset][subjects]" ) {
    auto const adapter = MakeFake({1, 2, 3, 4}, {hf::Side::Left, hf::Side::Right});

    SECTION( "default exclusions" ) {
        auto const dataset = hf::Dataset{adapter, MakeConfig(), {2, 4}};
        CHECK( dataset.subjects() == std::vector<u32>{1, 3} );
    }
    SECTION( "an explicit exclusion replaces the defaults" ) {
        auto config = MakeConfig();
        config.subjects.exclude = std::vector<u32>{1};
        auto const dataset = hf::Dataset{adapter, config, {2, 4}};
        CHECK( dataset.subjects() == std::vector<u32>{2, 3, 4} );
    }
    SECTION( "inclusion" ) {
        auto config = MakeConfig();
        config.subjects.include = std::vector<u32>{4, 2, 9};
        auto const dataset = hf::Dataset{adapter, config};
        CHECK( dataset.subjects() == std::vector<u32>{2, 4} );
    }
    SECTION( "first and last" ) {
        auto config = MakeConfig();
        config.subjects.pick = hf::SubjectPick::First;
        CHECK( hf::Dataset(adapter, config, {1}).subjects() == std::vector<u32>{2} );
        config.subjects.pick = hf::SubjectPick::Last;
        CHECK( hf::Dataset(adapter, config, {1}).subjects() == std::vector<u32>{4} );
    }
    SECTION( "first and last pick among subjects with the selected sides" ) {
        auto const partial = MakeFake({1, 2, 3, 4}, {hf::Side::Left, hf::Side::Right});
        partial->removeSide(1, hf::Side::Right);
        partial->removeSide(4, hf::Side::Left);

        auto config = MakeConfig(hf::SideSelection::Both);
        config.subjects.pick = hf::SubjectPick::First;
        CHECK( hf::Dataset(partial, config).subjects() == std::vector<u32>{2} );
        config.subjects.pick = hf::SubjectPick::Last;
        CHECK( hf::Dataset(partial, config).subjects() == std::vector<u32>{3} );

        config.sides = hf::SideSelection::Left;
        CHECK( hf::Dataset(partial, config).subjects() == std::vector<u32>{3} );
        config.sides = hf::SideSelection::Right;
        config.subjects.pick = hf::SubjectPick::First;
        CHECK( hf::Dataset(partial, config).subjects() == std::vector<u32>{2} );
    }
    SECTION( "a selection of no subjects" ) {
        auto config = MakeConfig();
        config.subjects.include = std::vector<u32>{9};
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
}

TEST_CASE( "Position selections", "[dataset][positions]" ) {
    auto const adapter = MakeFake();

    SECTION( "an azimuth range wrapping through the front" ) {
        auto config = MakeConfig();
        config.positions.azimuth = hf::ValueRange{300.0, 60.0};
        auto const dataset = hf::Dataset{adapter, config};
        CHECK( dataset.size() == 4 );
        for(const auto &key : dataset.keys())
            CHECK( key.position.azimuth == 0.0 );
    }
    SECTION( "an elevation range" ) {
        auto config = MakeConfig();
        config.positions.elevation = hf::ValueRange{-10.0, 10.0};
        CHECK( hf::Dataset(adapter, config).size() == 8 );
    }
    SECTION( "ranges apply to mirrored positions" ) {
        auto config = MakeConfig(hf::SideSelection::BothLeft);
        config.positions.azimuth = hf::ValueRange{0.0, 180.0};
        auto const dataset = hf::Dataset{adapter, config};
        /* Left ears at 0 and 90, mirrored right ears from 0 and 270. */
        CHECK( dataset.size() == 8 );
        CHECK( CountSide(dataset.keys(), hf::Side::MirroredRight) == 4 );
    }
    SECTION( "a predicate" ) {
        auto config = MakeConfig();
        config.positions.predicate = [](const hf::Position &pos) { return pos.azimuth == 90.0; };
        CHECK( hf::Dataset(adapter, config).size() == 4 );
    }
    SECTION( "a range matching nothing" ) {
        auto config = MakeConfig();
        config.positions.distance = hf::ValueRange{2.0, 3.0};
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
    SECTION( "an inverted elevation range" ) {
        auto config = MakeConfig();
        config.positions.elevation = hf::ValueRange{10.0, -10.0};
        CHECK_THROWS_AS( hf::Dataset(adapter, config), hf::config_error );
    }
}

TEST_CASE( "Records are processed after resampling", "[dataset][processing]" ) {
    auto const adapter = MakeFake();

    SECTION( "length" ) {
        auto config = MakeConfig();
        config.processing.length = 32;
        auto const dataset = hf::Dataset{adapter, config};
        auto const record = dataset.at(0);
        CHECK( record.samples.size() == 32 );

        auto const full = Expected(dataset.index().entries()[0].locator);
        CHECK( std::equal(record.samples.begin(), record.samples.end(), full.begin()) );
    }
    SECTION( "magnitude domain" ) {
        auto config = MakeConfig();
        config.processing.length = 32;
        config.processing.domain = hf::ResponseDomain::Magnitude;
        auto const record = hf::Dataset{adapter, config}.at(3);
        CHECK( record.samples.size() == 17 );
        CHECK( record.sampleRate == TargetRate );
    }
    SECTION( "scale" ) {
        auto config = MakeConfig();
        config.processing.scaleFactor = 2.0;
        auto const dataset = hf::Dataset{adapter, config};
        auto const record = dataset.at(1);
        auto const full = Expected(dataset.index().entries()[1].locator);
        REQUIRE( record.samples.size() == full.size() );
        for(usize i{0};i < full.size();++i)
            CHECK( record.samples[i] == Approx(full[i]*2.0) );
    }
}
// #endregion unit tests

} // test namespace
