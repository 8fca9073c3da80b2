#include <catch2/catch_test_macros.hpp>

#include <AMC/core/context.hpp>
#include <AMC/yutsis/functions.hpp>

#include <array>
#include <string>

namespace {

using namespace amc;
using namespace amc::yutsis;

/// the complete bipartite graph K3,3, the graph of a 9j-symbol; line e_ij
/// joins the i-th node of one side to the j-th node of the other
container::vector<ClebschGordan> utility_graph(
    IdxArena& arena, std::array<std::array<IdxId, 3>, 3>& lines) {
  for (std::size_t i = 0; i != 3; ++i) {
    for (std::size_t j = 0; j != 3; ++j)
      lines[i][j] = arena.make(JType::Integer, L"e" + std::to_wstring(i) +
                                                   std::to_wstring(j));
  }
  container::vector<ClebschGordan> clebsches;
  for (std::size_t i = 0; i != 3; ++i)
    clebsches.push_back({{lines[i][0], lines[i][1], lines[i][2]}});
  for (std::size_t j = 0; j != 3; ++j)
    clebsches.push_back({{lines[0][j], lines[1][j], lines[2][j]}});
  return clebsches;
}

/// the Moebius ladder on eight nodes, the graph of a 12j-symbol of the
/// first kind: the cycle a..h with the chords i, j, k, l joining opposite
/// nodes
container::vector<ClebschGordan> moebius_ladder(IdxArena& arena) {
  std::array<IdxId, 12> lines;
  for (std::size_t n = 0; n != 12; ++n)
    lines[n] = arena.make(JType::Integer,
                          std::wstring(1, static_cast<wchar_t>(L'a' + n)));
  const auto [a, b, c, d, e, f, g, h, i, j, k, l] = lines;
  return {{{a, h, i}, {-1, 1, -1}}, {{b, a, j}, {-1, 1, 1}},
          {{c, b, k}, {-1, 1, 1}},  {{d, c, l}, {1, -1, 1}},
          {{e, d, i}, {1, 1, 1}},   {{f, e, j}, {-1, 1, 1}},
          {{g, f, k}, {-1, 1, 1}},  {{h, g, l}, {1, 1, -1}}};
}

std::wstring labels(const IdxArena& arena,
                    const container::vector<SixJ>& sixjs) {
  std::wstring result;
  for (const auto& sixj : sixjs) result += sixj.to_wstring(arena);
  return result;
}

}  // namespace

TEST_CASE("collect_ninejs", "[yutsis][collect]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto zero = arena.make(JType::Integer, L"0", {.zero = true});
  std::array<std::array<IdxId, 3>, 3> e;
  const auto clebsches = utility_graph(arena, e);

  SECTION("three 6j-symbols") {
    auto graph = yutsis_reduction(arena, clebsches, zero);
    CHECK(graph.get_number_of_nodes() == 0);
    CHECK(graph.sign() == 1);
    CHECK(graph.triangular_deltas().empty());
    CHECK(graph.ninejs().empty());
    REQUIRE(graph.sixjs().size() == 3);
    REQUIRE(graph.additional_indices().size() == 1);

    // the square reduction introduced a summation index shared by all three
    const auto x = graph.additional_indices()[0];
    CHECK(arena[x].label == L"J0");
    CHECK(arena[x].jhat == 2);
    for (const auto& sixj : graph.sixjs()) CHECK(sixj.contains(x));
  }

  SECTION("9j-symbol") {
    auto graph = yutsis_reduction(
        arena, clebsches, zero, Context({.collect_ninejs = true}));
    CHECK(graph.sixjs().empty());
    CHECK(graph.additional_indices().empty());
    CHECK(graph.sign() == 1);
    REQUIRE(graph.ninejs().size() == 1);
    CHECK(graph.ninejs()[0].indices() ==
          std::array{e[2][0], e[2][1], e[2][2], e[1][0], e[1][1], e[1][2],
                     e[0][0], e[0][1], e[0][2]});
  }

  SECTION("12j-symbols need 9j-symbols") {
    auto graph = yutsis_reduction(
        arena, clebsches, zero, Context({.collect_twelvejfirsts = true}));
    CHECK(graph.sixjs().size() == 3);
    CHECK(graph.twelvejfirsts().empty());
  }

  SECTION("collecting twice changes nothing") {
    auto graph = yutsis_reduction(
        arena, clebsches, zero,
        Context({.collect_ninejs = true, .collect_twelvejfirsts = true}));
    REQUIRE(graph.ninejs().size() == 1);
    graph.collect_ninejs();
    graph.collect_twelvejfirsts();
    CHECK(graph.ninejs().size() == 1);
    CHECK(graph.twelvejfirsts().empty());
  }
}

TEST_CASE("collect_twelvejfirsts", "[yutsis][collect]") {
  using namespace amc;
  using namespace amc::yutsis;

  IdxArena arena;
  auto zero = arena.make(JType::Integer, L"0", {.zero = true});
  const auto clebsches = moebius_ladder(arena);

  SECTION("five 6j-symbols") {
    auto graph = yutsis_reduction(arena, clebsches, zero);
    CHECK(graph.get_number_of_nodes() == 0);
    CHECK(graph.sign() == 1);
    CHECK(graph.triangular_deltas().empty());
    CHECK(graph.deltas().empty());
    CHECK(labels(arena, graph.sixjs()) ==
          L"SixJ(b h J0; i j a)SixJ(f d J0; i j e)SixJ(k h J1; J0 c b)"
          L"SixJ(l f J1; J0 c d)SixJ(g h l; J1 f k)");
    REQUIRE(graph.additional_indices().size() == 2);
    for (auto x : graph.additional_indices()) CHECK(arena[x].jhat == 2);
  }

  SECTION("9j-symbol and two 6j-symbols") {
    auto graph = yutsis_reduction(arena, clebsches, zero,
                                  Context({.collect_ninejs = true}));
    REQUIRE(graph.ninejs().size() == 1);
    CHECK(graph.ninejs()[0].to_wstring(arena) ==
          L"NineJ(k f g; c d l; b J0 h)");
    CHECK(labels(arena, graph.sixjs()) ==
          L"SixJ(b h J0; i j a)SixJ(f d J0; i j e)");
    REQUIRE(graph.additional_indices().size() == 1);
    CHECK(arena[graph.additional_indices()[0]].label == L"J0");
    CHECK(graph.twelvejfirsts().empty());
  }

  SECTION("12j-symbol") {
    auto graph = yutsis_reduction(
        arena, clebsches, zero,
        Context({.collect_ninejs = true, .collect_twelvejfirsts = true}));
    CHECK(graph.sixjs().empty());
    CHECK(graph.ninejs().empty());
    CHECK(graph.additional_indices().empty());
    CHECK(graph.sign() == 1);
    REQUIRE(graph.twelvejfirsts().size() == 1);
    CHECK(graph.twelvejfirsts()[0].to_wstring(arena) ==
          L"TwelveJFirst(h a b c; i j k l; d e f g)");

    // phases reduced modulo 2, and the hats left on the chords
    struct Expected {
      wchar_t label;
      int jphase;
      int mphase;
      int jhat;
    };
    for (const auto& [label, jphase, mphase, jhat] :
         {Expected{L'a', 1, 1, 0}, Expected{L'b', 1, 1, 0},
          Expected{L'c', 0, 0, 0}, Expected{L'd', 0, 0, 0},
          Expected{L'e', 0, 0, 0}, Expected{L'f', 1, 1, 0},
          Expected{L'g', 1, 1, 0}, Expected{L'h', 0, 0, 0},
          Expected{L'i', 1, 1, 2}, Expected{L'j', 0, 0, 2},
          Expected{L'k', 0, 0, 2}, Expected{L'l', 1, 1, 2}}) {
      auto idx = arena[IdxId{static_cast<std::size_t>(label - L'a') + 1}];
      REQUIRE(idx.label == std::wstring(1, label));
      idx.simplify();
      CHECK(idx.jphase == jphase);
      CHECK(idx.mphase == mphase);
      CHECK(idx.jhat == jhat);
      CHECK(idx.sign == 1);
    }
  }
}
