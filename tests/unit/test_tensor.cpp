#include <catch2/catch_test_macros.hpp>

#include "catch2_amc.hpp"

#include <AMC/core/tensor.hpp>
#include <AMC/core/term.hpp>

#include <stdexcept>

TEST_CASE("CouplingScheme", "[elements][scheme]") {
  using namespace amc;

  SECTION("constructors") {
    CouplingScheme leaf(-3);
    CHECK(leaf.is_leaf());
    CHECK(leaf.leaf() == -3);
    CHECK(leaf.ncouplings() == 0);
    REQUIRE_THROWS_AS(CouplingScheme(0), std::invalid_argument);

    CouplingScheme s{{1, -4}, {3, -2}};
    CHECK(!s.is_leaf());
    CHECK(s.ncouplings() == 3);
    CHECK(s.left() == CouplingScheme(1, -4));
    CHECK(s.right().right().leaf() == -2);
    CHECK(s.to_wstring() == L"((1, -4), (3, -2))");
  }

  SECTION("defaults") {
    CHECK(CouplingScheme::left_to_right(2, 3).to_wstring() == L"((2, 3), 4)");
    CHECK(CouplingScheme::make_default(1, 1) == CouplingScheme(1, 2));
    CHECK(CouplingScheme::make_default(2, 2) ==
          CouplingScheme({1, 2}, {3, 4}));
    CHECK(CouplingScheme::make_default(3, 0) ==
          CouplingScheme({1, 2}, 3));
    CHECK(CouplingScheme::make_default(0, 2) == CouplingScheme(1, 2));
    CHECK(!CouplingScheme::make_default(0, 0));
  }

  SECTION("validation") {
    REQUIRE_NOTHROW(CouplingScheme({1, -4}, {3, -2}).validate(4));
    // slot out of range
    REQUIRE_THROWS_AS(CouplingScheme({1, 5}, {3, 2}).validate(4),
                      std::invalid_argument);
    // duplicate slot, sign does not matter
    REQUIRE_THROWS_AS(CouplingScheme({1, -1}, {3, 2}).validate(4),
                      std::invalid_argument);
    // missing slot
    REQUIRE_THROWS_AS(CouplingScheme(1, 2).validate(3),
                      std::invalid_argument);
  }
}

TEST_CASE("TensorDeclaration", "[elements][tensor]") {
  using namespace amc;

  SECTION("defaults") {
    TensorDeclaration v(L"V", 2, 2);
    CHECK(v.name() == L"V");
    CHECK(v.mode() == std::pair<std::size_t, std::size_t>{2, 2});
    CHECK(v.total_mode() == 4);
    CHECK(v.scalar());
    CHECK(!v.reduce());
    CHECK(!v.diagonal());
    REQUIRE(v.scheme());
    CHECK(*v.scheme() == CouplingScheme({1, 2}, {3, 4}));
    CHECK(v.nsubscripts() == 4);
    CHECK(v.to_wstring() ==
          L"Tensor V {mode=(2, 2), scalar=true, reduce=false, "
          L"diagonal=false, scheme=((1, 2), (3, 4))}");
  }

  SECTION("nonscalar tensors are always reduced") {
    TensorDeclaration a(L"A", 1, 1, {.scalar = false});
    CHECK(!a.scalar());
    CHECK(a.reduce());
  }

  SECTION("explicit scheme") {
    TensorDeclaration w(L"W", 2, 2,
                        {.scheme = CouplingScheme({1, -4}, {3, -2})});
    CHECK(*w.scheme() == CouplingScheme({1, -4}, {3, -2}));
    REQUIRE_THROWS_AS(
        TensorDeclaration(L"W", 2, 2, {.scheme = CouplingScheme(1, 2)}),
        std::invalid_argument);
  }

  SECTION("diagonal tensors") {
    TensorDeclaration d(L"D", 1, 1, {.diagonal = true});
    CHECK(d.diagonal());
    CHECK(!d.scheme());
    CHECK(d.nsubscripts() == 1);
    REQUIRE_THROWS_AS(TensorDeclaration(L"D", 1, 1,
                                        {.diagonal = true,
                                         .scheme = CouplingScheme(1, 2)}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TensorDeclaration(L"D", 2, 1, {.diagonal = true}),
                      std::invalid_argument);
  }

  SECTION("a single slot cannot be coupled") {
    REQUIRE_THROWS_AS(TensorDeclaration(L"a", 1, 0), std::invalid_argument);
  }

  SECTION("no slots") {
    TensorDeclaration c(L"c", 0, 0);
    CHECK(!c.scheme());
    CHECK(c.nsubscripts() == 0);
  }
}

TEST_CASE("Variable", "[elements][variable]") {
  using namespace amc;

  const Index p(L"p"), q(L"q"), r(L"r"), s(L"s");
  auto V = make_tensor(L"V", 2, 2);

  SECTION("constructors") {
    Variable v(V, {p, q, r, s});
    CHECK(&v.tensor() == V.get());
    CHECK(v.subscripts().size() == 4);
    CHECK(v.subscript(1) == p);
    CHECK(v.subscript(-4) == s);
    CHECK(v.depends_on() == container::set<Index>{p, q, r, s});
    CHECK(v.to_wstring() == L"V_{p q r s}");

    REQUIRE_THROWS_AS(Variable(V, {p, q}), std::invalid_argument);
    REQUIRE_THROWS_AS(Variable(nullptr, {}), std::invalid_argument);
  }

  SECTION("diagonal") {
    auto D = make_tensor(L"D", 1, 1,
                         TensorDeclaration::Attributes{.diagonal = true});
    Variable d(D, {p});
    CHECK(d.to_wstring() == L"D_{p}");
    REQUIRE_THROWS_AS(Variable(D, {p, q}), std::invalid_argument);
  }

  SECTION("reduced") {
    Variable v(V, {p, q, r, s});
    const Index J0(L"J0", JType::Integer, IndexClass::AngularMomentum);
    const Index J1(L"J1", JType::Integer, IndexClass::AngularMomentum);
    const Index zero(L"0", JType::Integer, IndexClass::AngularMomentum);
    ReducedVariable rv(v, {J0, J1, zero});
    CHECK(rv.rank() == zero);
    CHECK(rv.labels().size() == 3);
    CHECK(rv.to_wstring() == L"V_{p q r s}^{J0 J1 0}");
    REQUIRE_THROWS_AS(ReducedVariable(v, {J0, zero}), std::invalid_argument);

    // a tensor without scheme has only its rank
    Variable c(make_tensor(L"c", 0, 0), {});
    REQUIRE_NOTHROW(ReducedVariable(c, {zero}));
  }

  SECTION("terms") {
    auto A = make_tensor(L"A", 1, 1);
    const Index t(L"t");
    Term term{rational(1, 2), {t}, {Variable(A, {p, t}), Variable(V, {t, q, r, s})}};
    CHECK(term.to_wstring() == L"1/2 sum_{t} A_{p t} V_{t q r s}");

    Equation eq{Variable(V, {p, q, r, s}), {term}};
    CHECK(eq.to_wstring() ==
          L"V_{p q r s} = 1/2 sum_{t} A_{p t} V_{t q r s}");
    CHECK(Equation{Variable(V, {p, q, r, s}), {}}.to_wstring() ==
          L"V_{p q r s} = 0");
  }
}

TEST_CASE("Index", "[elements][index]") {
  using namespace amc;

  const Index p(L"p");
  CHECK(p.type() == JType::HalfInteger);
  CHECK(p.is_particle());
  const Index J(L"J", JType::Integer, IndexClass::AngularMomentum);
  CHECK(!J.is_particle());
  CHECK(coupled_type(p, p) == JType::Integer);
  CHECK(coupled_type(p, J) == JType::HalfInteger);
  // identified by label
  CHECK(p == Index(L"p", JType::Integer));
  CHECK(J < p);
}
