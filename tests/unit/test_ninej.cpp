#include <catch2/catch_test_macros.hpp>

#include <AMC/yutsis/exception.hpp>
#include <AMC/yutsis/ninej.hpp>

#include <array>
#include <string>

TEST_CASE("NineJ", "[yutsis][ninej]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  std::array<IdxId, 9> J;
  for (std::size_t k = 0; k != 9; ++k)
    J[k] = arena.make(JType::Integer, L"J" + std::to_wstring(k + 1));

  auto all_phases = [&](int expected) {
    for (auto id : J) {
      if (arena[id].jphase != expected) return false;
    }
    return true;
  };

  SECTION("all integers are kept in place") {
    NineJ ninej(arena, J);
    CHECK(ninej.indices() == J);
    CHECK(all_phases(0));
    CHECK(ninej.contains(J[4]));
    CHECK(ninej.to_wstring(arena) == L"NineJ(J1 J2 J3; J4 J5 J6; J7 J8 J9)");
  }

  SECTION("permutations") {
    NineJ ninej(arena, J);
    ninej.swap_columns(0, 2, arena);
    CHECK(ninej.indices() ==
          std::array{J[2], J[1], J[0], J[5], J[4], J[3], J[8], J[7], J[6]});
    CHECK(all_phases(1));

    ninej.swap_rows(0, 1, arena);
    CHECK(ninej.indices() ==
          std::array{J[5], J[4], J[3], J[2], J[1], J[0], J[8], J[7], J[6]});
    CHECK(all_phases(2));

    // no-op
    ninej.swap_rows(2, 2, arena);
    CHECK(all_phases(2));

    REQUIRE_THROWS_AS(ninej.swap_rows(0, 3, arena), InvariantViolation);
  }

  SECTION("reflections") {
    NineJ ninej(arena, J);
    ninej.reflect_main_diagonal();
    CHECK(ninej.indices() ==
          std::array{J[0], J[3], J[6], J[1], J[4], J[7], J[2], J[5], J[8]});
    ninej.reflect_main_diagonal();
    ninej.reflect_anti_diagonal();
    CHECK(ninej.indices() ==
          std::array{J[8], J[5], J[2], J[7], J[4], J[1], J[6], J[3], J[0]});
    CHECK(all_phases(0));
  }

  SECTION("place index") {
    NineJ ninej(arena, J);
    ninej.place_index(J[0], 8, arena);
    CHECK(ninej.indices()[8] == J[0]);
    CHECK(all_phases(2));
    REQUIRE_THROWS_AS(ninej.place_index(J[0], 9, arena), InvariantViolation);
  }

  SECTION("three integers") {
    auto a = arena.make(JType::HalfInteger, L"a");
    auto b = arena.make(JType::HalfInteger, L"b");
    auto c = arena.make(JType::HalfInteger, L"c");
    auto d = arena.make(JType::HalfInteger, L"d");
    auto e = arena.make(JType::HalfInteger, L"e");
    auto f = arena.make(JType::HalfInteger, L"f");
    // { j1 j3 J3 }
    // { j2 J2 j6 }
    // { J1 j4 j5 }
    NineJ ninej(arena, {a, b, J[0], c, J[1], d, J[2], e, f});
    CHECK(ninej.indices() ==
          std::array{f, e, J[2], d, J[1], c, J[0], b, a});
    for (auto id : ninej.indices()) CHECK(arena[id].jphase == 2);
  }
}
