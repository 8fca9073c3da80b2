#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/functions.hpp>

TEST_CASE("handle_deltas", "[yutsis][deltas]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto zero = arena.make(JType::Integer, L"0", {.zero = true});
  auto a = arena.make(JType::Integer, L"a");
  auto b = arena.make(JType::Integer, L"b");
  auto c = arena.make(JType::Integer, L"c");
  auto d = arena.make(JType::Integer, L"d");
  auto k = arena.make(JType::Integer, L"k", {.is_particle = true});
  auto m = arena.make(JType::Integer, L"m");
  auto p = arena.make(JType::Integer, L"p", {.external = true});

  SECTION("chain") {
    arena[b].jhat = 1;
    arena[c].jphase = 1;
    container::vector<Delta> deltas{Delta(arena, b, c), Delta(arena, a, b)};
    auto idxmap = handle_deltas(arena, deltas);
    CHECK(deltas.empty());
    REQUIRE(idxmap.size() == 2);
    CHECK(idxmap.at(b) == a);
    CHECK(idxmap.at(c) == a);
    CHECK(arena.root(b) == a);
    CHECK(arena.root(c) == a);
    CHECK(!arena[a].constrained_to);
    // the survivor collects the factors
    CHECK(arena[a].jhat == 1);
    CHECK(arena[a].jphase == 1);
    CHECK(arena[b].jhat == 0);
  }

  SECTION("survivor preference") {
    SECTION("external") {
      container::vector<Delta> deltas{Delta(arena, a, p)};
      auto idxmap = handle_deltas(arena, deltas);
      CHECK(idxmap.at(a) == p);
      CHECK(arena.root(a) == p);
    }

    SECTION("zero") {
      container::vector<Delta> deltas{Delta(arena, p, a), Delta(arena, a, zero)};
      auto idxmap = handle_deltas(arena, deltas);
      CHECK(idxmap.at(a) == zero);
      CHECK(idxmap.at(p) == zero);
      CHECK(!idxmap.contains(zero));
    }

    SECTION("particle") {
      container::vector<Delta> deltas{Delta(arena, b, k), Delta(arena, k, m)};
      auto idxmap = handle_deltas(arena, deltas);
      CHECK(idxmap.at(b) == k);
      CHECK(idxmap.at(m) == k);
    }
  }

  SECTION("independent groups") {
    container::vector<Delta> deltas{Delta(arena, a, b), Delta(arena, c, d)};
    auto idxmap = handle_deltas(arena, deltas);
    REQUIRE(idxmap.size() == 2);
    CHECK(idxmap.at(b) == a);
    CHECK(idxmap.at(d) == c);
  }

  SECTION("no deltas") {
    container::vector<Delta> deltas;
    CHECK(handle_deltas(arena, deltas).empty());
  }
}
