#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/functions.hpp>

#include <array>

TEST_CASE("handle_zero_lines", "[yutsis][zero_lines]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto zero = arena.make(JType::Integer, L"0", {.zero = true});
  auto a = arena.make(JType::HalfInteger, L"a");
  auto b = arena.make(JType::HalfInteger, L"b");
  container::vector<Delta> deltas;

  SECTION("closed line") {
    // sum_m (-1)^{a-m} (a a 0; m -m 0) = hat(a)
    container::vector<ThreeJM> threejms{ThreeJM({a, a, zero}, {1, -1, 1})};
    handle_zero_lines(arena, threejms, deltas, zero);
    CHECK(threejms.empty());
    CHECK(deltas.empty());
    CHECK(arena[a].jhat == 1);
    CHECK(arena[a].jphase == 0);
  }

  SECTION("coupling to zero") {
    SECTION("opposite projections") {
      container::vector<ThreeJM> threejms{ThreeJM({a, b, zero}, {1, -1, 1})};
      handle_zero_lines(arena, threejms, deltas, zero);
      CHECK(threejms.empty());
      REQUIRE(deltas.size() == 1);
      CHECK(deltas[0] == Delta(arena, a, b));
      CHECK(arena[a].jhat == -1);
      CHECK(arena[b].jhat == 0);
      CHECK(arena[b].jphase == 0);
    }

    SECTION("equal projections") {
      container::vector<ThreeJM> threejms{ThreeJM({a, b, zero}, {1, 1, 1})};
      handle_zero_lines(arena, threejms, deltas, zero);
      CHECK(threejms.empty());
      REQUIRE(deltas.size() == 1);
      // m_b is flipped, which adds (-1)^{b-m_b}
      CHECK(arena[b].jphase == 1);
      CHECK(arena[b].mphase == -1);
      CHECK(arena[a].jhat == -1);
    }

    SECTION("zero line in the first slot") {
      container::vector<ThreeJM> threejms{
          ThreeJM({zero, a, b}, {1, 1, -1})};
      handle_zero_lines(arena, threejms, deltas, zero);
      CHECK(threejms.empty());
      REQUIRE(deltas.size() == 1);
      // two exchanges
      CHECK(arena[a].jphase == 2);
      CHECK(arena[b].jphase == 2);
      CHECK(arena[a].jhat == -1);
    }

    SECTION("the dropped index is replaced in the other symbols") {
      auto c = arena.make(JType::Integer, L"c");
      container::vector<ThreeJM> threejms{ThreeJM({a, b, zero}, {1, -1, 1}),
                                          ThreeJM({b, a, c}, {1, -1, 1})};
      handle_zero_lines(arena, threejms, deltas, zero);
      // (a a c) makes c a zero line, which is then closed
      CHECK(threejms.empty());
      REQUIRE(deltas.size() == 2);
      CHECK(deltas[0] == Delta(arena, a, b));
      CHECK(deltas[1] == Delta(arena, c, zero));
      CHECK(deltas[1].first() == zero);
      CHECK(arena[c].zero);
    }
  }

  SECTION("repeated index makes a zero line") {
    auto x = arena.make(JType::Integer, L"x");
    container::vector<ThreeJM> threejms{ThreeJM({a, a, x}, {1, -1, 1})};
    handle_zero_lines(arena, threejms, deltas, zero);
    CHECK(arena[x].zero);
    REQUIRE(deltas.size() == 1);
    CHECK(deltas[0].first() == zero);
    CHECK(deltas[0].second() == x);
    CHECK(threejms.empty());
    CHECK(arena[a].jhat == 1);
  }

  SECTION("fixed point") {
    auto c = arena.make(JType::Integer, L"c");
    auto d = arena.make(JType::Integer, L"d");
    auto e = arena.make(JType::HalfInteger, L"e");
    auto f = arena.make(JType::HalfInteger, L"f");
    auto g = arena.make(JType::Integer, L"g");
    container::vector<ThreeJM> threejms{ThreeJM({c, c, zero}, {1, -1, 1}),
                                        ThreeJM({a, b, zero}, {1, 1, 1}),
                                        ThreeJM({e, f, g}, {1, -1, 1}),
                                        ThreeJM({d, d, zero}, {-1, 1, 1})};
    handle_zero_lines(arena, threejms, deltas, zero);
    REQUIRE(threejms.size() == 1);
    CHECK(threejms[0].indices() == std::array{e, f, g});
    CHECK(threejms[0].signs() == std::array{1, -1, 1});
    REQUIRE(deltas.size() == 1);
    CHECK(arena[c].jhat == 1);
    CHECK(arena[d].jhat == 1);
    CHECK(arena[a].jhat == -1);

    const auto threejms_before = threejms;
    const auto deltas_before = deltas;
    container::vector<std::array<int, 4>> accumulators;
    for (std::size_t k = 0; k != arena.size(); ++k) {
      const auto& idx = arena[IdxId{k}];
      accumulators.push_back({idx.jphase, idx.mphase, idx.sign, idx.jhat});
    }

    handle_zero_lines(arena, threejms, deltas, zero);
    REQUIRE(threejms.size() == threejms_before.size());
    CHECK(threejms[0].indices() == threejms_before[0].indices());
    CHECK(threejms[0].signs() == threejms_before[0].signs());
    CHECK(deltas == deltas_before);
    for (std::size_t k = 0; k != arena.size(); ++k) {
      const auto& idx = arena[IdxId{k}];
      CHECK(accumulators[k] ==
            std::array{idx.jphase, idx.mphase, idx.sign, idx.jhat});
    }
  }

  SECTION("errors") {
    SECTION("several zero lines") {
      auto zero2 = arena.make(JType::Integer, L"z", {.zero = true});
      auto c = arena.make(JType::Integer, L"c");
      container::vector<ThreeJM> threejms{
          ThreeJM({zero, zero2, c}, {1, 1, 1})};
      REQUIRE_THROWS_AS(handle_zero_lines(arena, threejms, deltas, zero),
                        InvariantViolation);
    }

    SECTION("equal projections on a closed line") {
      container::vector<ThreeJM> threejms{ThreeJM({a, a, zero}, {1, 1, 1})};
      REQUIRE_THROWS_AS(handle_zero_lines(arena, threejms, deltas, zero),
                        InvariantViolation);
    }

    SECTION("index appearing three times") {
      container::vector<ThreeJM> threejms{ThreeJM({a, a, a}, {1, 1, -1})};
      REQUIRE_THROWS_AS(handle_zero_lines(arena, threejms, deltas, zero),
                        InvariantViolation);
    }

    SECTION("iteration limit") {
      container::vector<ThreeJM> threejms{ThreeJM({a, b, zero}, {1, -1, 1})};
      REQUIRE_THROWS_AS(handle_zero_lines(arena, threejms, deltas, zero, 0),
                        InvariantViolation);
    }
  }
}
