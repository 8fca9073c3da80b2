#include <AMC/yutsis/functions.hpp>

#include <AMC/yutsis/exception.hpp>

#include <AMC/core/logger.hpp>
#include <AMC/core/wstring.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/stable_partition.hpp>
#include <range/v3/algorithm/stable_sort.hpp>

#include <iostream>
#include <string>
#include <tuple>
#include <utility>

namespace amc::yutsis {

namespace {

void erase_removed(container::vector<ThreeJM>& threejms,
                   const container::vector<bool>& removed) {
  container::vector<ThreeJM> kept;
  kept.reserve(threejms.size());
  for (std::size_t i = 0; i != threejms.size(); ++i) {
    if (!removed[i]) kept.push_back(threejms[i]);
  }
  threejms = std::move(kept);
}

/// (j j x): x must be a zero line
bool mark_zero_lines(IdxArena& arena, container::vector<ThreeJM>& threejms,
                     container::vector<Delta>& deltas, IdxId zero) {
  bool changed = false;
  for (const auto& threejm : threejms) {
    for (auto id : threejm.indices()) {
      const auto count = threejm.count(id);
      if (count == 3)
        throw InvariantViolation(
            "handle_zero_lines: index " + to_string(arena[id].label) +
            " appears three times in a 3JM-symbol");
      if (count != 2) continue;

      const auto other = *ranges::find_if(threejm.indices(),
                                          [id](IdxId i) { return i != id; });
      if (!arena[other].zero) {
        arena[other].zero = true;
        deltas.emplace_back(arena, other, zero);
        changed = true;
        if (Logger::instance().zero_lines)
          std::wcout << L"zero line: " << arena[other].label << std::endl;
      }
      break;
    }
  }
  return changed;
}

/// (j1 j2 0) with j1 != j2 becomes a delta
bool remove_zero_lines_between_distinct(IdxArena& arena,
                                        container::vector<ThreeJM>& threejms,
                                        container::vector<Delta>& deltas) {
  bool changed = false;
  container::vector<bool> removed(threejms.size(), false);
  for (std::size_t i = 0; i != threejms.size(); ++i) {
    auto& threejm = threejms[i];
    for (std::size_t k = 0; k != 3; ++k) {
      if (!arena[threejm.idx(k)].zero) continue;

      threejm.exchange(k, 2, arena);
      if (arena[threejm.idx(0)].zero || arena[threejm.idx(1)].zero)
        throw InvariantViolation(
            "handle_zero_lines: 3JM-symbol with several zero lines");
      if (threejm.idx(0) == threejm.idx(1)) break;

      const auto idx1 = threejm.idx(0);
      const auto idx2 = threejm.idx(1);

      // make the projections opposite by flipping m2 everywhere
      if (threejm.sign(0) == threejm.sign(1)) {
        arena[idx2].mphase = -arena[idx2].mphase;
        for (std::size_t j = 0; j != threejms.size(); ++j) {
          if (removed[j]) continue;
          for (std::size_t kp = 0; kp != 3; ++kp) {
            if (threejms[j].idx(kp) != idx2) continue;
            threejms[j].set_sign(kp, -threejms[j].sign(kp));
            arena[idx2].jphase += 1;
            arena[idx2].mphase += threejms[j].sign(kp) == -1 ? -1 : 1;
          }
        }
      }

      if (threejm.sign(0) == -1) threejm.exchange(0, 1, arena);

      deltas.emplace_back(arena, idx1, idx2);
      const auto survivor = deltas.back().first();
      const auto dropped = deltas.back().second();
      arena[survivor].jhat -= 1;

      for (std::size_t j = 0; j != threejms.size(); ++j) {
        if (removed[j]) continue;
        for (std::size_t kp = 0; kp != 3; ++kp) {
          if (threejms[j].idx(kp) == dropped) threejms[j].set_idx(kp, survivor);
        }
      }

      if (Logger::instance().zero_lines)
        std::wcout << L"zero line: " << deltas.back().to_wstring(arena)
                   << std::endl;

      removed[i] = true;
      changed = true;
      break;
    }
  }

  erase_removed(threejms, removed);
  return changed;
}

/// (j j 0) becomes a hat factor
bool remove_zero_lines_between_same(IdxArena& arena,
                                    container::vector<ThreeJM>& threejms) {
  bool changed = false;
  container::vector<bool> removed(threejms.size(), false);
  for (std::size_t i = 0; i != threejms.size(); ++i) {
    auto& threejm = threejms[i];
    for (std::size_t k = 0; k != 3; ++k) {
      if (!arena[threejm.idx(k)].zero) continue;

      threejm.exchange(k, 2, arena);
      const auto idx1 = threejm.idx(0);
      if (threejm.idx(1) != idx1 || arena[idx1].zero)
        throw InvariantViolation(
            "handle_zero_lines: unexpected 3JM-symbol with a zero line");
      if (threejm.sign(0) == threejm.sign(1))
        throw InvariantViolation(
            "handle_zero_lines: 3JM-symbol (j j 0; m m 0) is not supported");

      if (threejm.sign(0) == -1) threejm.exchange(0, 1, arena);
      arena[idx1].jhat += 1;

      if (Logger::instance().zero_lines)
        std::wcout << L"zero line closes " << arena[idx1].label << std::endl;

      removed[i] = true;
      changed = true;
      break;
    }
  }

  erase_removed(threejms, removed);
  return changed;
}

}  // namespace

void handle_zero_lines(IdxArena& arena, container::vector<ThreeJM>& threejms,
                       container::vector<Delta>& deltas, IdxId zero,
                       std::size_t max_iterations) {
  std::size_t iteration = 0;
  bool changed = true;
  while (changed) {
    if (iteration == max_iterations)
      throw InvariantViolation(
          "handle_zero_lines: no fixed point after " +
          std::to_string(max_iterations) + " iterations");
    ++iteration;

    const bool marked = mark_zero_lines(arena, threejms, deltas, zero);
    const bool distinct =
        remove_zero_lines_between_distinct(arena, threejms, deltas);
    const bool same = remove_zero_lines_between_same(arena, threejms);
    changed = marked || distinct || same;
  }

  for (const auto& threejm : threejms) {
    for (auto id : threejm.indices()) {
      if (arena[id].zero)
        throw InvariantViolation("handle_zero_lines: zero line " +
                                 to_string(arena[id].label) +
                                 " left in a 3JM-symbol");
    }
  }
}

void canonicalize(IdxArena& arena, container::vector<ThreeJM>& threejms) {
  container::map<IdxId, std::size_t> appearances;
  for (const auto& threejm : threejms) {
    for (auto id : threejm.indices()) ++appearances[id];
  }
  for (const auto& [id, count] : appearances) {
    if (count != 2)
      throw InvariantViolation("canonicalize: index " +
                               to_string(arena[id].label) + " appears " +
                               std::to_string(count) +
                               " times instead of twice");
  }
  if (threejms.empty()) return;

  container::vector<std::size_t> placed{0};
  container::vector<bool> is_placed(threejms.size(), false);
  is_placed[0] = true;
  for (std::size_t p = 0; p != placed.size(); ++p) {
    const auto current = placed[p];
    for (std::size_t j = 0; j != threejms.size(); ++j) {
      if (j == current) continue;
      auto& other = threejms[j];
      for (std::size_t i = 0; i != 3; ++i) {
        for (std::size_t l = 0; l != 3; ++l) {
          if (threejms[current].idx(i) != other.idx(l)) continue;
          if (threejms[current].sign(i) == other.sign(l)) {
            if (is_placed[j])
              throw InvariantViolation(
                  "canonicalize: inconsistent projection signs on index " +
                  to_string(arena[other.idx(l)].label));
            other.flip_signs(arena);
            if (Logger::instance().canonicalize)
              std::wcout << L"canonicalize: flipped " << other.to_wstring(arena)
                         << std::endl;
          }
          if (!is_placed[j]) {
            is_placed[j] = true;
            placed.push_back(j);
          }
        }
      }
    }

    // disconnected string: continue from the first symbol not reached
    if (p + 1 == placed.size() && placed.size() != threejms.size()) {
      const auto next = static_cast<std::size_t>(
          ranges::find(is_placed, false) - is_placed.begin());
      is_placed[next] = true;
      placed.push_back(next);
    }
  }
}

container::map<IdxId, IdxId> handle_deltas(IdxArena& arena,
                                           container::vector<Delta>& deltas) {
  const auto& logger = Logger::instance();
  container::map<IdxId, IdxId> idxmap;
  container::vector<bool> processed(deltas.size(), false);

  for (std::size_t i = 0; i != deltas.size(); ++i) {
    if (processed[i]) continue;

    // all deltas connected to this one
    container::vector<std::size_t> group{i};
    processed[i] = true;
    for (std::size_t p = 0; p != group.size(); ++p) {
      const auto& delta = deltas[group[p]];
      for (std::size_t j = 0; j != deltas.size(); ++j) {
        if (processed[j]) continue;
        if (deltas[j].contains(delta.first()) ||
            deltas[j].contains(delta.second())) {
          processed[j] = true;
          group.push_back(j);
        }
      }
    }

    auto key = [&](std::size_t d) {
      const auto& idx = arena[deltas[d].first()];
      return std::tuple<int, int, int, std::size_t, const std::wstring&>(
          idx.zero ? 0 : 1, idx.external ? 0 : 1, idx.is_particle ? 0 : 1,
          idx.label.size(), idx.label);
    };
    ranges::stable_sort(group, [&](std::size_t a, std::size_t b) {
      return key(a) < key(b);
    });
    const auto survivor = arena.root(deltas[group.front()].first());

    // deltas that do not touch the survivor go first
    ranges::stable_partition(group, [&](std::size_t d) {
      return !deltas[d].contains(survivor);
    });
    for (auto d : group) {
      for (auto id : deltas[d].indices()) {
        if (id == survivor || idxmap.contains(id)) continue;
        const auto root = arena.root(id);
        if (root != survivor) arena.set_constraint(root, survivor);
        idxmap.emplace(id, survivor);
        if (logger.deltas)
          std::wcout << L"delta: " << arena[id].label << L" -> "
                     << arena[survivor].label << std::endl;
      }
    }
  }

  deltas.clear();
  return idxmap;
}

container::map<IdxId, IdxId> handle_deltas(YutsisGraph& graph) {
  return handle_deltas(graph.arena(), graph.deltas());
}

YutsisGraph yutsis_reduction(IdxArena& arena,
                             const container::vector<ClebschGordan>& clebsches,
                             IdxId zero, const Context& ctx) {
  container::vector<ThreeJM> threejms;
  threejms.reserve(clebsches.size());
  for (const auto& cg : clebsches) threejms.push_back(cg.to_threejm(arena));

  container::vector<Delta> deltas;
  handle_zero_lines(arena, threejms, deltas, zero,
                    ctx.max_zero_line_iterations());
  canonicalize(arena, threejms);

  YutsisGraph graph(arena, threejms, std::move(deltas), zero);
  graph.separate();

  auto components = graph.disconnected_graphs();
  for (auto& component : components)
    component.reduce(ctx.max_reduction_iterations());

  auto result = std::move(components.front());
  for (std::size_t k = 1; k < components.size(); ++k)
    result.merge(components[k]);

  if (ctx.collect_ninejs()) result.collect_ninejs();
  if (ctx.collect_twelvejfirsts()) result.collect_twelvejfirsts();

  return result;
}

}  // namespace amc::yutsis
