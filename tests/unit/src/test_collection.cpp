#include "hf-test.hpp"

#include "collection.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <string>

#include "except.h"
#include "test-data.hpp"

namespace {

// #region mock data
void Touch(const std::filesystem::path &path)
{
    auto out = std::ofstream{path};
    out << "x";
}
// #endregion mock data


// #region unit tests
TEST_CASE( "Patterns extract subject ids", "[collection][pattern]" ) {
    CHECK( hf::MatchPattern("subject_{id}.sofa", "subject_003.sofa") == std::optional<u32>{3} );
    CHECK( hf::MatchPattern("subject_{id}.sofa", "subject_165.sofa") == std::optional<u32>{165} );
    CHECK( hf::MatchPattern("hrtf ?_nh{id}.sofa", "hrtf b_nh10.sofa") == std::optional<u32>{10} );
    CHECK( hf::MatchPattern("P{id}/HRTF/96kHz/P{id}_FreeFieldComp_96kHz.sofa",
        "P0042/HRTF/96kHz/P0042_FreeFieldComp_96kHz.sofa") == std::optional<u32>{42} );
    CHECK( hf::MatchPattern("subject_{id}/*.wav", "subject_7/az30_el0.wav")
        == std::optional<u32>{7} );

    SECTION( "Non-matching paths are rejected" ) {
        CHECK_FALSE( hf::MatchPattern("subject_{id}.sofa", "subject_.sofa") );
        CHECK_FALSE( hf::MatchPattern("subject_{id}.sofa", "subject_12a.sofa") );
        CHECK_FALSE( hf::MatchPattern("subject_{id}.sofa", "subject_12.sofa.bak") );
        CHECK_FALSE( hf::MatchPattern("subject_{id}.sofa", "other/subject_12.sofa") );
        CHECK_FALSE( hf::MatchPattern("hrtf ?_nh{id}.sofa", "hrtf _nh10.sofa") );
    }
    SECTION( "Repeated ids must agree" ) {
        CHECK_FALSE( hf::MatchPattern("P{id}/P{id}.sofa", "P0042/P0043.sofa") );
        CHECK( hf::MatchPattern("P{id}/P{id}.sofa", "P7/P007.sofa") == std::optional<u32>{7} );
    }
    SECTION( "Wildcards stay within a path component" ) {
        CHECK_FALSE( hf::MatchPattern("subject_{id}/*.wav", "subject_7/sub/az30_el0.wav") );
        CHECK_FALSE( hf::MatchPattern("?{id}.sofa", "/1.sofa") );
        CHECK( hf::MatchPattern("*_{id}.sofa", "any_name_12.sofa") == std::optional<u32>{12} );
    }
}

TEST_CASE( "Formats parse by name", "[collection]" ) {
    CHECK( hf::ParseFormatType("sofa") == hf::FormatType::Sofa );
    CHECK( hf::ParseFormatType("MAT") == hf::FormatType::Mat );
    CHECK( hf::ParseFormatType("wave") == hf::FormatType::WaveDirectory );
    CHECK( hf::ParseFormatType("wav") == hf::FormatType::WaveDirectory );
    CHECK_FALSE( hf::ParseFormatType("hdf5") );
    CHECK( hf::GetFormatName(hf::FormatType::WaveDirectory) == "wave" );
}

TEST_CASE( "Collection registry", "[collection][registry]" ) {
    auto const builtin = hf::CollectionRegistry::Builtin();
    CHECK( builtin.size() == 14 );

    auto const *cipic = builtin.find("cipic");
    REQUIRE( cipic != nullptr );
    CHECK( cipic->format == hf::FormatType::Sofa );
    CHECK( cipic->defaultExclude == std::vector<u32>{21, 165} );

    auto const &cipicMat = builtin.get("cipic-mat");
    CHECK( cipicMat.format == hf::FormatType::Mat );
    CHECK( cipicMat.sampleRate == std::optional<u32>{44100} );
    REQUIRE( cipicMat.grid );
    CHECK( cipicMat.grid->azimuths.size() == 25 );
    CHECK( cipicMat.grid->elevations.size() == 50 );

    CHECK( builtin.find("nonexistent") == nullptr );
    CHECK_THROWS_AS( builtin.get("nonexistent"), hf::config_error );

    auto const names = builtin.names();
    CHECK( std::is_sorted(names.begin(), names.end()) );

    SECTION( "Entries can be added and replaced" ) {
        auto registry = hf::CollectionRegistry{};
        registry.add({"mine", hf::FormatType::Sofa, "{id}.sofa", {}, std::nullopt, std::nullopt});
        registry.add({"mine", hf::FormatType::Mat, "{id}.mat", {4}, 48000u, std::nullopt});
        REQUIRE( registry.size() == 1 );
        CHECK( registry.get("mine").format == hf::FormatType::Mat );
        CHECK( registry.get("mine").pattern == "{id}.mat" );
    }
    SECTION( "Invalid entries are rejected" ) {
        auto registry = hf::CollectionRegistry{};
        CHECK_THROWS_AS( registry.add({"", hf::FormatType::Sofa, "{id}.sofa", {}, std::nullopt,
            std::nullopt}), hf::config_error );
        CHECK_THROWS_AS( registry.add({"noid", hf::FormatType::Sofa, "subject.sofa", {},
            std::nullopt, std::nullopt}), hf::config_error );
        CHECK( registry.size() == 0 );
    }
}

SCENARIO( "Discovering dataset files", "[collection][discover]" ) {
    GIVEN( "a directory with matching and unrelated files" ) {
        auto const tmp = hftest::TempDirectory{"discover"};
        Touch(tmp.file("subject_10/hrir_final.mat"));
        Touch(tmp.file("subject_3/hrir_final.mat"));
        Touch(tmp.file("subject_3/notes.txt"));
        Touch(tmp.file("readme.txt"));
        Touch(tmp.file("subject_x/hrir_final.mat"));

        WHEN( "files are discovered" ) {
            auto const files = hf::DiscoverFiles(hf::FormatType::Mat, tmp.path(),
                "subject_{id}/hrir_final.mat");

            THEN( "only matching files are found, ordered by subject" ) {
                REQUIRE( files.size() == 2 );
                CHECK( files[0].subject == 3 );
                CHECK( files[0].path == tmp.path()/"subject_3"/"hrir_final.mat" );
                CHECK( files[1].subject == 10 );
            }
        }
        WHEN( "nothing matches" ) {
            THEN( "the result is empty" ) {
                CHECK( hf::DiscoverFiles(hf::FormatType::Sofa, tmp.path(), "{id}.sofa").empty() );
            }
        }
    }
    GIVEN( "a root that is a single file" ) {
        auto const tmp = hftest::TempDirectory{"discover"};
        Touch(tmp.file("subject_8/hrir_final.mat"));
        Touch(tmp.file("kemar.sofa"));

        THEN( "the subject comes from the trailing path components" ) {
            auto const root = tmp.path()/"subject_8"/"hrir_final.mat";
            auto const files = hf::DiscoverFiles(hf::FormatType::Mat, root,
                "subject_{id}/hrir_final.mat");
            REQUIRE( files.size() == 1 );
            CHECK( files[0].subject == 8 );
            CHECK( files[0].path == root );
        }
        THEN( "the subject is 0 when the name does not match" ) {
            auto const files = hf::DiscoverFiles(hf::FormatType::Sofa, tmp.path()/"kemar.sofa",
                "subject_{id}.sofa");
            REQUIRE( files.size() == 1 );
            CHECK( files[0].subject == 0 );
        }
        THEN( "deeper patterns than the path do not match" ) {
            CHECK( hf::SubjectForSingleFile("a/b/c/subject_{id}.sofa", "subject_4.sofa") == 0 );
            CHECK( hf::SubjectForSingleFile("subject_{id}.sofa", "x/y/subject_4.sofa") == 4 );
        }
    }
    GIVEN( "a root that does not exist" ) {
        auto const tmp = hftest::TempDirectory{"discover"};
        THEN( "discovery fails with a format error naming the format" ) {
            CHECK_THROWS_AS( hf::DiscoverFiles(hf::FormatType::Sofa, tmp.path()/"missing",
                "{id}.sofa"), hf::format_error );
            CHECK_THROWS_WITH( hf::DiscoverFiles(hf::FormatType::WaveDirectory,
                tmp.path()/"missing", "subject_{id}/*.wav"), Catch::StartsWith("wave: ") );
        }
    }
}
// #endregion unit tests

} // test namespace
