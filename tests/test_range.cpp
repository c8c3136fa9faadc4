#include <catch2/catch_test_macros.hpp>
#include <fileserve/core/range.hpp>

using namespace fileserve;

TEST_CASE("ByteRange resolution", "[range]") {
    SECTION("Closed range 0-499 in 1000 byte resource") {
        ByteRange r{0, 499};
        auto w = r.resolve(1000);
        REQUIRE(w);
        CHECK(w->start == 0);
        CHECK(w->end == 500);
        CHECK(w->length() == 500);
    }

    SECTION("Open-ended range 500-") {
        ByteRange r{500, std::nullopt};
        auto w = r.resolve(1000);
        REQUIRE(w);
        CHECK(*w == ByteWindow{500, 1000});
    }

    SECTION("Suffix range -500") {
        ByteRange r{std::nullopt, 500};
        REQUIRE(r.is_suffix());
        CHECK(r.resolve(1000) == ByteWindow{500, 1000});
    }

    SECTION("Suffix larger than the resource selects all of it") {
        ByteRange r{std::nullopt, 2000};
        CHECK(r.resolve(1000) == ByteWindow{0, 1000});
    }

    SECTION("Last byte clamped to the resource") {
        ByteRange r{500, 2000};
        CHECK(r.resolve(1000) == ByteWindow{500, 1000});
    }

    SECTION("Start at or beyond size is unsatisfiable") {
        CHECK_FALSE(ByteRange{1000, std::nullopt}.resolve(1000));
        CHECK_FALSE(ByteRange{1500, 2000}.resolve(1000));
    }

    SECTION("Zero-length suffix is unsatisfiable") {
        CHECK_FALSE(ByteRange{std::nullopt, 0}.resolve(1000));
    }

    SECTION("Nothing is satisfiable in an empty resource") {
        CHECK_FALSE(ByteRange{0, 0}.resolve(0));
        CHECK_FALSE(ByteRange{std::nullopt, 10}.resolve(0));
    }

    SECTION("Single byte") {
        CHECK(ByteRange{0, 0}.resolve(1) == ByteWindow{0, 1});
        CHECK(ByteRange{std::nullopt, 1}.resolve(100) == ByteWindow{99, 100});
    }
}

TEST_CASE("Range header parsing", "[range]") {
    SECTION("Single closed range") {
        auto ranges = range::parse("bytes=0-499");
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK((*ranges)[0] == ByteRange{0, 499});
    }

    SECTION("Open and suffix forms") {
        auto open = range::parse("bytes=9500-");
        REQUIRE(open);
        CHECK((*open)[0] == ByteRange{9500, std::nullopt});

        auto suffix = range::parse("bytes=-500");
        REQUIRE(suffix);
        CHECK((*suffix)[0] == ByteRange{std::nullopt, 500});
    }

    SECTION("Multiple ranges keep their order") {
        auto ranges = range::parse("bytes=0-0, -1");
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 2);
        CHECK((*ranges)[0] == ByteRange{0, 0});
        CHECK((*ranges)[1] == ByteRange{std::nullopt, 1});
    }

    SECTION("Unit is case-insensitive and whitespace is tolerated") {
        auto ranges = range::parse("  Bytes = 10 - 20 ");
        REQUIRE(ranges);
        CHECK((*ranges)[0] == ByteRange{10, 20});
    }

    SECTION("Empty list elements are skipped") {
        auto ranges = range::parse("bytes=,,5-9,");
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK((*ranges)[0] == ByteRange{5, 9});
    }

    SECTION("Invalid elements are dropped, valid ones kept") {
        auto ranges = range::parse("bytes=x-1, 5-");
        REQUIRE(ranges);
        REQUIRE(ranges->size() == 1);
        CHECK((*ranges)[0] == ByteRange{5, std::nullopt});
    }

    SECTION("Malformed headers") {
        CHECK_FALSE(range::parse(""));
        CHECK_FALSE(range::parse("bytes"));
        CHECK_FALSE(range::parse("items=0-10"));
        CHECK_FALSE(range::parse("bytes="));
        CHECK_FALSE(range::parse("bytes=abc"));
        CHECK_FALSE(range::parse("bytes=10"));
        CHECK_FALSE(range::parse("bytes=-"));
        CHECK_FALSE(range::parse("bytes=500-100"));
        CHECK_FALSE(range::parse("bytes=1-2-3"));
        CHECK_FALSE(range::parse("bytes=+1-5"));
        CHECK_FALSE(range::parse("bytes=99999999999999999999999-"));
    }
}

TEST_CASE("RangeSpec classification", "[range]") {
    SECTION("Absent header") {
        auto spec = RangeSpec::evaluate(std::nullopt, 100);
        CHECK(spec.status == RangeStatus::None);
        CHECK_FALSE(spec.window);
    }

    SECTION("Malformed header serves the whole resource") {
        auto spec = RangeSpec::evaluate("bytes=oops", 100);
        CHECK(spec.status == RangeStatus::Malformed);
        CHECK_FALSE(spec.window);
    }

    SECTION("Satisfiable") {
        auto spec = RangeSpec::evaluate("bytes=0-49", 100);
        REQUIRE(spec.satisfiable());
        CHECK(*spec.window == ByteWindow{0, 50});
    }

    SECTION("Unsatisfiable") {
        auto spec = RangeSpec::evaluate("bytes=100-", 100);
        CHECK(spec.status == RangeStatus::Unsatisfiable);
        CHECK_FALSE(spec.window);

        CHECK(RangeSpec::evaluate("bytes=-0", 100).status == RangeStatus::Unsatisfiable);
        CHECK(RangeSpec::evaluate("bytes=0-", 0).status == RangeStatus::Unsatisfiable);
    }

    SECTION("Only the first valid range decides") {
        auto spec = RangeSpec::evaluate("bytes=10-19, 50-59, 90-", 100);
        REQUIRE(spec.satisfiable());
        CHECK(*spec.window == ByteWindow{10, 20});
        CHECK(spec.ignored_ranges == 2);

        // First range out of bounds: 416 even though a later one would fit
        auto first_bad = RangeSpec::evaluate("bytes=200-300, 0-10", 100);
        CHECK(first_bad.status == RangeStatus::Unsatisfiable);
    }

    SECTION("Status names") {
        CHECK(range_status_name(RangeStatus::Satisfiable) == "satisfiable");
        CHECK(range_status_name(RangeStatus::Malformed) == "malformed");
    }
}

TEST_CASE("Content-Range header values", "[range]") {
    CHECK(range::content_range(ByteWindow{0, 50}, 100) == "bytes 0-49/100");
    CHECK(range::content_range(ByteWindow{99, 100}, 100) == "bytes 99-99/100");
    CHECK(range::content_range(ByteWindow{500, 1000}, 1000) == "bytes 500-999/1000");
    CHECK(range::unsatisfied_content_range(100) == "bytes */100");
}
