#include "hf-test.hpp"

#include "resampler.hpp"

#include <algorithm>
#include <cmath>
#include <span>
#include <vector>

#include "except.h"
#include "hfnumeric.h"
#include "test-data.hpp"

namespace {

// #region unit tests
TEST_CASE( "Resampling between equal rates is the identity", "[resampler]" ) {
    auto const input = std::vector<f64>{0.25, -1.0, 0.5, 0.0, 3.0e-7, -0.125};
    for(u32 const rate : {8000u, 44100u, 48000u, 96000u})
    {
        CHECK( hf::Resample(input, rate, rate) == input );
        CHECK( hf::Resampler{}.resample(input, rate, rate) == input );
    }
    CHECK( hf::Resample(std::vector<f64>{}, 44100, 44100).empty() );
}

TEST_CASE( "Resampled length is rounded up", "[resampler]" ) {
    CHECK( ScaledLength(256, 48000, 44100) == 236 );
    CHECK( ScaledLength(200, 44100, 48000) == 218 );
    CHECK( ScaledLength(480, 48000, 96000) == 960 );
    CHECK( ScaledLength(0, 48000, 44100) == 0 );

    auto const input = hftest::MakeSine(1000.0, 48000, 256);
    CHECK( hf::Resample(input, 48000, 44100).size() == 236 );
    CHECK( hf::Resample(input, 48000, 24000).size() == 128 );
    CHECK( hf::Resample(input, 48000, 96000).size() == 512 );
}

TEST_CASE( "Zero rates are rejected", "[resampler]" ) {
    auto const input = std::vector<f64>(16, 1.0);
    CHECK_THROWS_AS( hf::Resample(input, 0, 44100), hf::invalid_rate_error );
    CHECK_THROWS_AS( hf::Resample(input, 48000, 0), hf::invalid_rate_error );
    CHECK_THROWS_AS( hf::Resample(input, 0, 0), hf::invalid_rate_error );

    auto const resampler = hf::Resampler{};
    CHECK_THROWS_AS( resampler.resample(input, 0, 44100), hf::invalid_rate_error );
    CHECK_THROWS_AS( resampler.getFilter(44100, 0), hf::invalid_rate_error );
}

TEST_CASE( "Resampler parameters are validated", "[resampler]" ) {
    CHECK_NOTHROW( hf::ValidateResamplerParams(hf::ResamplerParams{}) );
    CHECK_NOTHROW( hf::ValidateResamplerParams(hf::ResamplerParams{120.0, 0.1}) );
    CHECK_THROWS_AS( hf::ValidateResamplerParams(hf::ResamplerParams{0.0, 0.05}),
        hf::config_error );
    CHECK_THROWS_AS( hf::ValidateResamplerParams(hf::ResamplerParams{180.0, 0.0}),
        hf::config_error );
    CHECK_THROWS_AS( hf::ValidateResamplerParams(hf::ResamplerParams{180.0, 0.5}),
        hf::config_error );
    CHECK_THROWS_AS( hf::Resampler(hf::ResamplerParams{-3.0, 0.05}), hf::config_error );
}

TEST_CASE( "Filters are cached per rate pair", "[resampler]" ) {
    auto const resampler = hf::Resampler{};
    auto const first = resampler.getFilter(48000, 44100);
    CHECK( resampler.getFilter(48000, 44100) == first );
    CHECK( resampler.getFilter(44100, 48000) != first );
    CHECK( resampler.getFilter(96000, 44100) != first );
}

SCENARIO( "A sinusoid survives a round trip between rates", "[resampler]" ) {
    GIVEN( "a 1 kHz sine at 48 kHz" ) {
        auto const input = hftest::MakeSine(1000.0, 48000, 4800);

        WHEN( "it is resampled to 44.1 kHz and back" ) {
            auto const resampler = hf::Resampler{};
            auto const down = resampler.resample(input, 48000, 44100);
            auto const back = resampler.resample(down, 44100, 48000);

            THEN( "the lengths are restored" ) {
                CHECK( down.size() == 4410 );
                REQUIRE( back.size() == input.size() );
            }
            THEN( "the middle of the signal matches within tolerance" ) {
                REQUIRE( back.size() == input.size() );
                auto const mid = std::span{input}.subspan(960, 2880);
                auto const got = std::span{back}.subspan(960, 2880);
                CHECK( hftest::Rms(mid, got) < 1.0e-3 );
            }
        }
        WHEN( "it is resampled to 44.1 kHz" ) {
            auto const down = hf::Resample(input, 48000, 44100);
            auto const expected = hftest::MakeSine(1000.0, 44100, 4410);

            THEN( "it matches a sine generated at 44.1 kHz" ) {
                REQUIRE( down.size() == expected.size() );
                auto const mid = std::span{expected}.subspan(882, 2646);
                auto const got = std::span{down}.subspan(882, 2646);
                CHECK( hftest::Rms(mid, got) < 1.0e-3 );
            }
        }
    }
}
// #endregion unit tests

} // test namespace
