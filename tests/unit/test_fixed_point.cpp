/*
 * Unit tests for fixed-point lengths
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

#include <dimtol/fixed_point.hpp>
#include <dimtol/format.hpp>

using namespace dimtol;

template<typename Fn>
static std::string error_message(Fn&& fn) {
    try {
        fn();
    } catch (const error& e) {
        return e.what();
    }
    return {};
}

TEST_SUITE("FixedPoint Construction") {
    TEST_CASE("constants") {
        CHECK(F64::ONE.ticks() == 10'000);
        CHECK(F16::ONE.ticks() == 10'000);
        CHECK(F16::ZERO.is_zero());
        CHECK(F16::MAX.ticks() == 32'767);
        CHECK(F16::MIN.ticks() == -32'768);
        CHECK(F32::MAX.ticks() == std::numeric_limits<std::int32_t>::max());
        CHECK(F64::MIN.ticks() == std::numeric_limits<std::int64_t>::min());
    }

    TEST_CASE("from_mm") {
        CHECK(F64::from_mm(12.5).ticks() == 125'000);
        CHECK(F64::from_mm(2.07).ticks() == 20'700);
        CHECK(F64::from_mm(-0.5).ticks() == -5'000);
        CHECK(F32::from_mm(0.00005).ticks() == 0);
        CHECK(F16::from_mm(3.2767).ticks() == 32'767);
    }

    TEST_CASE("from_mm truncates toward zero") {
        CHECK(F64::from_mm(0.0003).ticks() == 2);
        CHECK(F64::from_mm(0.0024).ticks() == 23);
        CHECK(F64::from_mm(-0.0003).ticks() == -2);
        CHECK(F64::checked_from_mm(0.0003).ticks() == 2);
        CHECK(F64::parse("0.0003").ticks() == 3);
    }

    TEST_CASE("checked_from_mm - overflow") {
        CHECK(F16::checked_from_mm(1.5).ticks() == 15'000);
        CHECK_THROWS_AS(F16::checked_from_mm(4.0), overflow_error);
        CHECK_THROWS_AS(F16::checked_from_mm(-4.0), overflow_error);
        CHECK_THROWS_AS(F32::checked_from_mm(std::nan("")), overflow_error);
        CHECK_THROWS_AS(F64::checked_from_mm(1e300), overflow_error);
    }

    TEST_CASE("checked_from - raw ticks") {
        CHECK(F16::checked_from(-32768).ticks() == -32'768);
        CHECK(F16::checked_from(std::uint64_t{32767}).ticks() == 32'767);
        CHECK_THROWS_AS(F16::checked_from(32768), overflow_error);
        CHECK_THROWS_AS(F32::checked_from(std::numeric_limits<std::uint64_t>::max()), overflow_error);
    }

    TEST_CASE("widening is implicit") {
        F64 wide = F16::from_raw(-7);
        CHECK(wide.ticks() == -7);
        F32 mid = F16::MAX;
        CHECK(mid.ticks() == 32'767);
    }

    TEST_CASE("narrowing reports overflow instead of wrapping") {
        F64 big = F64::from_raw(40'000);
        CHECK_THROWS_AS(F16::checked_from(big), overflow_error);
        CHECK_FALSE(F16::try_narrow(big).has_value());

        auto ok = F16::try_narrow(F64::from_raw(-32'768));
        REQUIRE(ok.has_value());
        CHECK(ok->ticks() == -32'768);
        CHECK(F32::checked_from(F64::from_raw(125'000)).ticks() == 125'000);

        std::string msg = error_message([&] { F16::checked_from(big); });
        CHECK(msg.find("F16") != std::string::npos);
    }
}

TEST_SUITE("FixedPoint Parsing") {
    TEST_CASE("parse - valid") {
        CHECK(F64::parse("12345.12343").ticks() == 123'451'234);
        CHECK(F32::parse(" +2.07").ticks() == 20'700);
        CHECK(F16::parse("-.044").ticks() == -440);
        CHECK(F16::parse(".04") == F16::parse("0.04"));
        CHECK(F16::parse("3.2767") == F16::MAX);
        CHECK(F16::parse("-3.2768") == F16::MIN);
    }

    TEST_CASE("parse - invalid") {
        CHECK_THROWS_AS(F64::parse("12345*12343"), parse_error);
        CHECK_THROWS_AS(F64::parse("   "), parse_error);
        CHECK_THROWS_AS(F64::parse(" -  "), parse_error);
        CHECK_THROWS_AS(F64::parse("+"), parse_error);
        CHECK_THROWS_AS(F16::parse("3.2768"), overflow_error);
        CHECK_THROWS_AS(F32::parse("214748.3648"), overflow_error);
    }

    TEST_CASE("parse - empty input names the type") {
        CHECK(error_message([] { F64::parse(""); }) == "cannot parse an empty string into F64");
        CHECK(error_message([] { F32::parse(""); }) == "cannot parse an empty string into F32");
        CHECK(error_message([] { F16::parse(""); }) == "cannot parse an empty string into F16");
    }

    TEST_CASE("try_parse") {
        CHECK(F64::try_parse("1.5") == F64::from_raw(15'000));
        CHECK_FALSE(F64::try_parse("abc").has_value());
        CHECK_FALSE(F16::try_parse("10").has_value());
    }

    TEST_CASE("parse of the full-precision string returns the value") {
        std::vector<F64> values = {F64::ZERO, F64::from_raw(1), F64::from_raw(-455), F64::from_raw(123'451'234),
                                   F64::MIN, F64::MAX};
        for (F64 v : values) {
            CHECK(F64::parse(v.to_string(4)) == v);
        }
        CHECK(F16::parse(F16::MIN.to_string(4)) == F16::MIN);
    }
}

TEST_SUITE("FixedPoint Rounding") {
    TEST_CASE("round - nearest, ties away from zero") {
        CHECK(F64::from_raw(12'455).round(units::MY).ticks() == 12'460);
        CHECK(F64::from_raw(-12'455).round(units::MY).ticks() == -12'460);
        CHECK(F64::from_raw(12'454).round(units::MY).ticks() == 12'450);
        CHECK(F32::from_raw(15'000).round(units::MM).ticks() == 20'000);
        CHECK(F32::from_raw(-15'000).round(units::MM).ticks() == -20'000);
        CHECK(F16::from_raw(123).round(unit(0)).ticks() == 123);
    }

    TEST_CASE("round - idempotent") {
        for (std::int64_t t : {-12'455, -5, 0, 7, 12'455, 99'999}) {
            F64 once = F64::from_raw(t).round(units::MY);
            CHECK(once.round(units::MY) == once);
        }
    }

    TEST_CASE("floor - toward negative infinity") {
        CHECK(F64::from_raw(-67).floor(unit::potency(3)).ticks() == -1'000);
        CHECK(F64::parse("-340.993").floor(units::MM).ticks() == -3'410'000);
        CHECK(F64::from_raw(-1'000).floor(unit::potency(3)).ticks() == -1'000);
        CHECK(F32::from_raw(67).floor(unit::potency(3)).ticks() == 0);
        CHECK(F16::from_raw(-10).floor(units::MY).ticks() == -10);
        CHECK(F16::from_raw(-11).floor(units::MY).ticks() == -20);
        CHECK(F16::from_raw(5).floor(unit(0)).ticks() == 5);
    }
}

TEST_SUITE("FixedPoint Display") {
    TEST_CASE("to_string") {
        F64 v = F64::from_raw(12'455);
        CHECK(v.to_string() == "1.2455");
        CHECK(v.to_string(3) == "1.246");
        CHECK(v.to_string(0) == "1");
        CHECK(v.to_string(7) == "1.2455");
        CHECK(F64::from_mm(12.5).to_string() == "12.5");
        CHECK(F64::ZERO.to_string() == "0.0");
        CHECK(F32::from_raw(-50).to_string() == "-0.005");
    }

    TEST_CASE("to_string - alternate, sign and policy") {
        format_spec alt;
        alt.alternate = true;
        CHECK(F64::from_raw(-455).to_string(alt) == "-455");

        format_spec plus;
        plus.sign_plus = true;
        CHECK(F64::from_raw(455).to_string(plus) == "+0.0455");
        CHECK(F64::from_raw(-455).to_string(plus) == "-0.0455");

        format_spec strict;
        strict.precision = 5;
        strict.policy = precision_policy::reject;
        CHECK_THROWS_AS(F64::ONE.to_string(strict), std::invalid_argument);
        strict.precision = 4;
        CHECK(F64::ONE.to_string(strict) == "1.0000");
    }

    TEST_CASE("debug_string") {
        CHECK(F64::from_mm(12.5).debug_string() == "F64(12.5000)");
        CHECK(F16::from_raw(-1).debug_string() == "F16(-0.0001)");
    }

    TEST_CASE("fmt formatter") {
        F64 v = F64::from_mm(12.5);
        CHECK(fmt::format("{}", v) == "12.5");
        CHECK(fmt::format("{:.2}", v) == "12.50");
        CHECK(fmt::format("{:#}", v) == "125000");
        CHECK(fmt::format("{:+.1}", v) == "+12.5");
        CHECK(fmt::format("{} / {}", F16::from_raw(5), F32::ONE) == "0.0005 / 1.0");
    }
}

TEST_SUITE("FixedPoint Arithmetic") {
    TEST_CASE("same width") {
        F64 a = F64::from_mm(2.0);
        F64 b = F64::from_mm(3.5);
        CHECK((a + b).ticks() == 55'000);
        CHECK((a - b).ticks() == -15'000);
        CHECK(a * b == F64::from_mm(7.0));
        CHECK(F64::from_mm(7.0) / a == b);
        CHECK(a + (-a) == F64::ZERO);
        CHECK(-F16::from_raw(5) == F16::from_raw(-5));
    }

    TEST_CASE("same width wraps") {
        CHECK(F16::MAX + F16::from_raw(1) == F16::MIN);
        CHECK(F16::MIN - F16::from_raw(1) == F16::MAX);
        CHECK(-F16::MIN == F16::MIN);
    }

    TEST_CASE("integers") {
        CHECK(F32::from_raw(10) * 3 == F32::from_raw(30));
        CHECK(3 * F32::from_raw(10) == F32::from_raw(30));
        CHECK(F32::from_raw(10) / 4 == F32::from_raw(2));
        CHECK(F32::from_raw(-10) / 4 == F32::from_raw(-2));
        CHECK(F32::from_raw(10) + 5 == F32::from_raw(15));
        CHECK(F32::from_raw(10) - 15 == F32::from_raw(-5));
    }

    TEST_CASE("compound assignment") {
        F32 v = F32::ONE;
        v += F32::ONE;
        CHECK(v.ticks() == 20'000);
        v -= F32::from_raw(5'000);
        CHECK(v.ticks() == 15'000);
        v *= 2;
        CHECK(v.ticks() == 30'000);
        v /= 3;
        CHECK(v.ticks() == 10'000);
        v *= F32::from_mm(2.5);
        CHECK(v.ticks() == 25'000);
        v /= F32::from_mm(0.5);
        CHECK(v.ticks() == 50'000);
    }

    TEST_CASE("cross width widens") {
        auto s = F64::from_raw(5) + F16::from_raw(7);
        static_assert(std::is_same_v<decltype(s), F64>, "sum takes the wider type");
        CHECK(s.ticks() == 12);

        auto d = F16::from_raw(5) - F32::from_raw(70'000);
        static_assert(std::is_same_v<decltype(d), F32>, "difference takes the wider type");
        CHECK(d.ticks() == -69'995);

        CHECK((F16::MAX + F32::from_raw(1)).ticks() == 32'768);
    }

    TEST_CASE("sum") {
        std::vector<F32> values = {F32::from_mm(1.5), F32::from_mm(2.5), F32::from_raw(-1)};
        CHECK(sum(values).ticks() == 39'999);
        CHECK(sum(std::vector<F16>{}) == F16::ZERO);
    }

    TEST_CASE("predicates") {
        F32 neg = F32::from_raw(-25);
        CHECK(neg.abs().ticks() == 25);
        CHECK(neg.abs_diff(F32::from_raw(25)).ticks() == 50);
        CHECK(neg.signum().ticks() == -1);
        CHECK(F32::ZERO.signum().ticks() == 0);
        CHECK(F32::ONE.signum().ticks() == 1);
        CHECK(neg.is_negative());
        CHECK_FALSE(neg.is_positive());
        CHECK_FALSE(neg.is_zero());
        CHECK(F32::ZERO.is_zero());
    }

    TEST_CASE("comparison") {
        CHECK(F16::from_raw(-1) < F16::ZERO);
        CHECK(F16::ONE >= F16::ONE);
        CHECK(F16::ONE != F16::ZERO);
        CHECK(F64::from_mm(1.0) == F64::ONE);
    }
}

TEST_SUITE("FixedPoint Bytes") {
    TEST_CASE("byte orders") {
        F32 v = F32::from_raw(0x01020304);
        F32::bytes_type be = {1, 2, 3, 4};
        F32::bytes_type le = {4, 3, 2, 1};
        CHECK(v.to_be_bytes() == be);
        CHECK(v.to_le_bytes() == le);
        CHECK(F32::from_be_bytes(be) == v);
        CHECK(F32::from_le_bytes(le) == v);
        CHECK(F32::from_ne_bytes(v.to_ne_bytes()) == v);
    }

    TEST_CASE("negative values") {
        F16::bytes_type be = {0xff, 0xfe};
        CHECK(F16::from_raw(-2).to_be_bytes() == be);
        CHECK(F16::from_be_bytes(be).ticks() == -2);
        CHECK(F64::from_le_bytes(F64::MIN.to_le_bytes()) == F64::MIN);
    }
}

TEST_SUITE("FixedPoint Hash") {
    TEST_CASE("usable in unordered containers") {
        std::unordered_set<F64> set;
        set.insert(F64::ONE);
        set.insert(F64::from_mm(1.0));
        set.insert(F64::ZERO);
        CHECK(set.size() == 2);
        CHECK(set.count(F64::from_raw(10'000)) == 1);
    }
}
