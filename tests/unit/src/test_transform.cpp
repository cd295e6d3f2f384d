#include "hf-test.hpp"

#include "hrir_transform.hpp"

#include <cmath>
#include <complex>
#include <limits>
#include <numbers>
#include <vector>

#include "except.h"
#include "hfcomplex.h"

namespace {

// #region mock data
auto Impulse(usize const length, usize const offset=0) -> std::vector<f64>
{
    auto ret = std::vector<f64>(length);
    ret[offset] = 1.0;
    return ret;
}
// #endregion mock data


// #region unit tests
TEST_CASE( "Forward and inverse FFTs", "[transform][fft]" ) {
    auto buffer = std::vector<std::complex<f64>>(8);
    buffer[1] = 1.0;
    forward_fft(buffer);
    for(usize k{0};k < buffer.size();++k)
    {
        auto const expected = std::polar(1.0, -2.0*std::numbers::pi*static_cast<f64>(k)/8.0);
        CHECK( buffer[k].real() == Approx(expected.real()).margin(1e-12) );
        CHECK( buffer[k].imag() == Approx(expected.imag()).margin(1e-12) );
    }
    inverse_fft(buffer);
    CHECK( buffer[1].real() == Approx(8.0) );
    CHECK( buffer[0].real() == Approx(0.0).margin(1e-12) );
    CHECK( buffer[5].real() == Approx(0.0).margin(1e-12) );
}

TEST_CASE( "Response domains", "[transform]" ) {
    CHECK( hf::ParseResponseDomain("time") == hf::ResponseDomain::Time );
    CHECK( hf::ParseResponseDomain("Magnitude") == hf::ResponseDomain::Magnitude );
    CHECK( hf::ParseResponseDomain("magnitude_db") == hf::ResponseDomain::MagnitudeDb );
    CHECK( hf::ParseResponseDomain("magnitude-db") == hf::ResponseDomain::MagnitudeDb );
    CHECK( hf::ParseResponseDomain("phase") == hf::ResponseDomain::Phase );
    CHECK_FALSE( hf::ParseResponseDomain("cepstrum") );
    CHECK( hf::GetDomainName(hf::ResponseDomain::MagnitudeDb) == "magnitude-db" );
}

TEST_CASE( "The magnitude of an impulse is flat", "[transform]" ) {
    auto const mags = hf::MagnitudeResponse(Impulse(16, 3));
    REQUIRE( mags.size() == 9 );
    for(f64 mag : mags)
        CHECK( mag == Approx(1.0) );

    SECTION( "Non-power-of-two lengths are padded" ) {
        CHECK( hf::MagnitudeResponse(Impulse(20)).size() == 17 );
        CHECK( hf::PhaseResponse(Impulse(20)).size() == 17 );
    }
    SECTION( "A delayed impulse has linear phase" ) {
        auto const phase = hf::PhaseResponse(Impulse(8, 1));
        REQUIRE( phase.size() == 5 );
        CHECK( phase[0] == Approx(0.0).margin(1e-12) );
        CHECK( phase[1] == Approx(-std::numbers::pi/4.0) );
        CHECK( phase[2] == Approx(-std::numbers::pi/2.0) );
    }
}

TEST_CASE( "Minimum phase keeps the magnitude response", "[transform][minphase]" ) {
    auto const input = std::vector<f64>{0.0, 0.0, 0.1, 1.0, -0.5, 0.25, 0.0, -0.1};
    auto const minphase = hf::MinimumPhaseResponse(input);
    REQUIRE( minphase.size() == input.size() );

    auto const before = hf::MagnitudeResponse(input);
    auto const after = hf::MagnitudeResponse(minphase);
    REQUIRE( after.size() == before.size() );
    for(usize i{0};i < before.size();++i)
        CHECK( after[i] == Approx(before[i]).margin(1e-6) );

    SECTION( "Energy moves to the start" ) {
        auto const energy = [](const std::vector<f64> &v, usize count)
        {
            auto sum = 0.0;
            for(usize i{0};i < count;++i)
                sum += v[i]*v[i];
            return sum;
        };
        CHECK( energy(minphase, 2) > energy(input, 2) );
    }
    SECTION( "A delayed impulse becomes an impulse at zero" ) {
        auto const result = hf::MinimumPhaseResponse(Impulse(8, 5));
        CHECK( std::abs(result[0]) == Approx(1.0) );
        for(usize i{1};i < result.size();++i)
            CHECK( result[i] == Approx(0.0).margin(1e-6) );
    }
}

TEST_CASE( "Processing options", "[transform][process]" ) {
    auto const input = std::vector<f64>{1.0, 0.5, 0.25, 0.125};

    SECTION( "The identity leaves responses alone" ) {
        auto const opts = hf::ProcessingOptions{};
        CHECK( opts.isIdentity() );
        CHECK( hf::ProcessResponse(input, opts) == input );
    }
    SECTION( "Length truncates and pads" ) {
        auto opts = hf::ProcessingOptions{};
        opts.length = 2;
        CHECK( hf::ProcessResponse(input, opts) == std::vector<f64>{1.0, 0.5} );
        opts.length = 6;
        CHECK( hf::ProcessResponse(input, opts)
            == std::vector<f64>{1.0, 0.5, 0.25, 0.125, 0.0, 0.0} );
    }
    SECTION( "Scale" ) {
        auto opts = hf::ProcessingOptions{};
        opts.scaleFactor = -2.0;
        CHECK( hf::ProcessResponse(input, opts) == std::vector<f64>{-2.0, -1.0, -0.5, -0.25} );
    }
    SECTION( "Decibels" ) {
        auto opts = hf::ProcessingOptions{};
        opts.domain = hf::ResponseDomain::MagnitudeDb;
        opts.scaleFactor = 10.0;
        auto const db = hf::ProcessResponse(std::vector<f64>{1.0, 0.0, 0.0, 0.0}, opts);
        REQUIRE( db.size() == 3 );
        for(f64 v : db)
            CHECK( v == Approx(20.0) );

        auto const silent = hf::ProcessResponse(std::vector<f64>(4), opts);
        CHECK( silent[0] == Approx(-180.0) );
    }
    SECTION( "Invalid options" ) {
        auto opts = hf::ProcessingOptions{};
        opts.length = 0;
        CHECK_THROWS_AS( hf::ValidateProcessingOptions(opts), hf::config_error );
        opts.length = 8;
        opts.scaleFactor = std::numeric_limits<f64>::infinity();
        CHECK_THROWS_AS( hf::ValidateProcessingOptions(opts), hf::config_error );
    }
}
// #endregion unit tests

} // test namespace
