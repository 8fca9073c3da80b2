#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/delta.hpp>
#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/triangular_delta.hpp>

TEST_CASE("Delta", "[yutsis][delta]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto zero = arena.make(JType::Integer, L"0", {.zero = true});
  auto b = arena.make(JType::Integer, L"b");
  auto a = arena.make(JType::Integer, L"a");
  auto p = arena.make(JType::Integer, L"p", {.external = true});
  auto q = arena.make(JType::HalfInteger, L"q", {.external = true});

  SECTION("ordering") {
    // zero first, then external, then by label
    Delta d1(arena, b, a);
    CHECK(d1.first() == a);
    CHECK(d1.second() == b);

    Delta d2(arena, a, p);
    CHECK(d2.first() == p);
    CHECK(d2.second() == a);

    Delta d3(arena, p, zero);
    CHECK(d3.first() == zero);
    CHECK(d3.second() == p);
    CHECK(d3.contains(p));
    CHECK(!d3.contains(a));

    CHECK(Delta(arena, a, b) == Delta(arena, b, a));
    CHECK(d1.to_wstring(arena) == L"delta(a, b)");
  }

  SECTION("type mismatch") {
    REQUIRE_THROWS_AS(Delta(arena, p, q), InvariantViolation);
  }

  SECTION("apply") {
    arena[b].jhat = 2;
    arena[b].jphase = 1;
    Delta(arena, a, b).apply(arena);
    CHECK(arena[a].jhat == 2);
    CHECK(arena[a].jphase == 1);
    CHECK(arena[b].jhat == 0);
  }

  SECTION("triangular delta") {
    TriangularDelta tri{{a, b, p}};
    CHECK(tri.contains(p));
    CHECK(!tri.contains(zero));
    CHECK(tri.to_wstring(arena) == L"{a b p}");
  }
}
