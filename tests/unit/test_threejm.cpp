#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/threejm.hpp>

#include <array>

TEST_CASE("ThreeJM", "[yutsis][threejm]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto a = arena.make(JType::HalfInteger, L"a");
  auto b = arena.make(JType::HalfInteger, L"b");
  auto c = arena.make(JType::Integer, L"c");

  SECTION("from Clebsch-Gordan") {
    SECTION("positive projections") {
      // C^{c m_c}_{a m_a b m_b} = (-1)^{a - b + m_c} hat(c) (a b c; m_a m_b -m_c)
      // and -m_c carries (-1)^{c - m_c}
      ClebschGordan cg{{a, b, c}};
      auto threejm = cg.to_threejm(arena);
      CHECK(threejm.indices() == std::array{a, b, c});
      CHECK(threejm.signs() == std::array{1, 1, -1});
      CHECK(arena[a].jphase == 1);
      CHECK(arena[b].jphase == -1);
      CHECK(arena[c].jphase == 1);
      CHECK(arena[c].mphase == 0);
      CHECK(arena[c].jhat == 1);
    }

    SECTION("negative projections") {
      ClebschGordan cg{{a, b, c}, {-1, 1, -1}};
      auto threejm = cg.to_threejm(arena);
      CHECK(threejm.signs() == std::array{-1, 1, 1});
      CHECK(arena[a].jphase == 2);
      CHECK(arena[a].mphase == -1);
      CHECK(arena[b].jphase == -1);
      CHECK(arena[c].jphase == 0);
      CHECK(arena[c].mphase == -1);
      CHECK(arena[c].jhat == 1);
    }
  }

  SECTION("exchange") {
    ThreeJM threejm({a, b, c}, {1, -1, 1});
    threejm.exchange(0, 2, arena);
    CHECK(threejm.indices() == std::array{c, b, a});
    CHECK(threejm.signs() == std::array{1, -1, 1});
    CHECK(arena[a].jphase == 1);
    CHECK(arena[b].jphase == 1);
    CHECK(arena[c].jphase == 1);

    // no-op
    threejm.exchange(1, 1, arena);
    CHECK(arena[a].jphase == 1);

    REQUIRE_THROWS_AS(threejm.exchange(0, 3, arena), InvariantViolation);
  }

  SECTION("flip signs") {
    ThreeJM threejm({a, b, c}, {1, -1, -1});
    threejm.flip_signs(arena);
    CHECK(threejm.signs() == std::array{-1, 1, 1});
    CHECK(arena[a].jphase == 0);
    CHECK(arena[b].jphase == 2);
    CHECK(arena[c].jphase == 2);
  }

  SECTION("count") {
    ThreeJM threejm({a, a, c}, {1, -1, 1});
    CHECK(threejm.count(a) == 2);
    CHECK(threejm.count(b) == 0);
    CHECK(threejm.count(c) == 1);
  }

  SECTION("invalid signs") {
    REQUIRE_THROWS_AS(ThreeJM({a, b, c}, {1, 0, 1}), InvariantViolation);
  }

  SECTION("printing") {
    CHECK(ThreeJM({a, b, c}, {1, -1, 1}).to_wstring(arena) ==
          L"3JM: a(+) b(-) c(+)");
    CHECK(ClebschGordan{{a, b, c}}.to_wstring(arena) == L"CG: a(+) b(+) c(+)");
  }
}
