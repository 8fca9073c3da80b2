#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/sixj.hpp>

#include <array>

TEST_CASE("SixJ", "[yutsis][sixj]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto J1 = arena.make(JType::Integer, L"J1");
  auto J2 = arena.make(JType::Integer, L"J2");
  auto J3 = arena.make(JType::Integer, L"J3");
  auto J4 = arena.make(JType::Integer, L"J4");
  auto J5 = arena.make(JType::Integer, L"J5");
  auto J6 = arena.make(JType::Integer, L"J6");
  auto a = arena.make(JType::HalfInteger, L"a", {.is_particle = true});
  auto b = arena.make(JType::HalfInteger, L"b", {.is_particle = true});
  auto c = arena.make(JType::HalfInteger, L"c", {.is_particle = true});
  auto d = arena.make(JType::HalfInteger, L"d", {.is_particle = true});
  auto k = arena.make(JType::HalfInteger, L"k");

  SECTION("validation") {
    REQUIRE_NOTHROW(SixJ(arena, {J1, J2, J3, J4, J5, J6}));
    CHECK(SixJ(arena, {J1, J2, J3, J4, J5, J6}).nint() == 6);
    CHECK(SixJ(arena, {a, b, J1, c, d, J2}).nint() == 2);
    CHECK(SixJ(arena, {J1, J2, J3, a, b, c}).nint() == 3);
    REQUIRE_THROWS_AS(SixJ(arena, {a, b, c, d, k, J1}), InvariantViolation);
    REQUIRE_THROWS_AS(SixJ(arena, {J1, J2, J3, J4, a, b}),
                      InvariantViolation);
  }

  SECTION("triads") {
    SixJ sixj(arena, {J1, J2, J3, J4, J5, J6});
    CHECK(sixj.contains(J4));
    CHECK(!sixj.contains(a));
    CHECK(sixj.position(J5) == 4);
    CHECK(!sixj.position(a));

    CHECK(sixj.contains(TriangularDelta{{J1, J2, J3}}));
    CHECK(sixj.contains(TriangularDelta{{J6, J1, J5}}));
    CHECK(sixj.contains(TriangularDelta{{J2, J4, J6}}));
    CHECK(sixj.contains(TriangularDelta{{J3, J4, J5}}));
    CHECK(!sixj.contains(TriangularDelta{{J1, J2, J4}}));
    CHECK(!sixj.contains(TriangularDelta{{J4, J5, J6}}));
  }

  SECTION("symmetries") {
    SixJ sixj(arena, {J1, J2, J3, J4, J5, J6});
    sixj.swap_columns(0, 2);
    CHECK(sixj.indices() == std::array{J3, J2, J1, J6, J5, J4});
    sixj.swap_rows_in_columns(0, 1);
    CHECK(sixj.indices() == std::array{J6, J5, J1, J3, J2, J4});
    // the triads are invariant
    CHECK(sixj.contains(TriangularDelta{{J1, J2, J3}}));
    CHECK(sixj.contains(TriangularDelta{{J1, J5, J6}}));
    REQUIRE_THROWS_AS(sixj.swap_columns(0, 3), InvariantViolation);
  }

  SECTION("canonicalize") {
    SECTION("two integers") {
      // integer column moves to the right
      SixJ sixj(arena, {J1, a, b, J2, c, d});
      sixj.canonicalize(arena);
      CHECK(sixj.indices() == std::array{a, b, J1, c, d, J2});

      // a non-particle index moves to the fifth position
      SixJ sixj2(arena, {k, a, J1, b, c, J2});
      sixj2.canonicalize(arena);
      CHECK(sixj2.indices()[4] == k);
      CHECK(sixj2.contains(TriangularDelta{{k, a, J1}}));
      CHECK(sixj2.contains(TriangularDelta{{J1, b, c}}));
    }

    SECTION("three integers") {
      SixJ sixj(arena, {J1, a, b, c, J2, J3});
      sixj.canonicalize(arena);
      CHECK(sixj.indices() == std::array{J1, J2, J3, c, a, b});
    }
  }

  SECTION("printing") {
    CHECK(SixJ(arena, {J1, J2, J3, J4, J5, J6}).to_wstring(arena) ==
          L"SixJ(J1 J2 J3; J4 J5 J6)");
  }
}
