#include "app/IsolationForest.hpp"

#include <algorithm>
#include <cmath>
#include <random>

using ransomwatch::model::FeatureVector;
using ransomwatch::model::kFeatureCount;

namespace ransomwatch::app {

void StandardScaler::fit(const std::vector<FeatureVector>& rows) {
  mean.fill(0.0);
  scale.fill(1.0);
  if (rows.empty()) return;
  const double n = static_cast<double>(rows.size());
  for (const auto& r : rows) for (size_t f = 0; f < kFeatureCount; ++f) mean[f] += r[f];
  for (size_t f = 0; f < kFeatureCount; ++f) mean[f] /= n;
  FeatureVector var{};
  for (const auto& r : rows) for (size_t f = 0; f < kFeatureCount; ++f) { double d = r[f] - mean[f]; var[f] += d * d; }
  for (size_t f = 0; f < kFeatureCount; ++f) {
    double sd = std::sqrt(var[f] / n);
    scale[f] = (sd > 1e-12) ? sd : 1.0;
  }
}

FeatureVector StandardScaler::transform(const FeatureVector& x) const {
  FeatureVector out{};
  for (size_t f = 0; f < kFeatureCount; ++f) out[f] = (x[f] - mean[f]) / scale[f];
  return out;
}

double IsolationForest::average_path_length(double n) {
  if (n <= 1.0) return 0.0;
  if (n <= 2.0) return 1.0;
  constexpr double kEulerGamma = 0.5772156649015329;
  return 2.0 * (std::log(n - 1.0) + kEulerGamma) - 2.0 * (n - 1.0) / n;
}

namespace {

struct TreeBuilder {
  const std::vector<FeatureVector>& rows;
  std::mt19937_64& rng;
  int depth_limit;
  IsoTree tree{};

  int build(std::vector<size_t>& idx, size_t begin, size_t end, int depth) {
    const int node_id = static_cast<int>(tree.nodes.size());
    tree.nodes.push_back(IsoNode{});
    const size_t n = end - begin;
    tree.nodes[node_id].size = static_cast<int>(n);
    if (depth >= depth_limit || n <= 1) return node_id;

    FeatureVector lo, hi;
    lo.fill(0.0); hi.fill(0.0);
    for (size_t f = 0; f < kFeatureCount; ++f) { lo[f] = rows[idx[begin]][f]; hi[f] = lo[f]; }
    for (size_t i = begin + 1; i < end; ++i) {
      const auto& r = rows[idx[i]];
      for (size_t f = 0; f < kFeatureCount; ++f) { lo[f] = std::min(lo[f], r[f]); hi[f] = std::max(hi[f], r[f]); }
    }
    std::vector<size_t> candidates;
    for (size_t f = 0; f < kFeatureCount; ++f) if (hi[f] > lo[f]) candidates.push_back(f);
    if (candidates.empty()) return node_id;   // all rows identical

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    const size_t feat = candidates[pick(rng)];
    std::uniform_real_distribution<double> cut(lo[feat], hi[feat]);
    const double threshold = cut(rng);   // in [lo, hi): both sides non-empty

    auto mid = std::partition(idx.begin() + static_cast<std::ptrdiff_t>(begin),
                              idx.begin() + static_cast<std::ptrdiff_t>(end),
                              [&](size_t i) { return rows[i][feat] <= threshold; });
    const size_t split = static_cast<size_t>(mid - idx.begin());
    int l = build(idx, begin, split, depth + 1);
    int r = build(idx, split, end, depth + 1);
    auto& node = tree.nodes[node_id];
    node.feature = static_cast<int>(feat);
    node.threshold = threshold;
    node.left = l;
    node.right = r;
    return node_id;
  }
};

} // namespace

void IsolationForest::fit(const std::vector<FeatureVector>& rows, const ForestParams& params) {
  trees_.clear();
  subsample_ = 0;
  if (rows.empty() || params.trees <= 0) return;
  subsample_ = std::min<int>(std::max(1, params.max_samples), static_cast<int>(rows.size()));
  const int depth_limit = static_cast<int>(std::ceil(std::log2(std::max(2, subsample_))));
  std::mt19937_64 rng(params.seed);
  std::uniform_int_distribution<size_t> draw(0, rows.size() - 1);
  trees_.reserve(static_cast<size_t>(params.trees));
  for (int t = 0; t < params.trees; ++t) {
    std::vector<size_t> idx(static_cast<size_t>(subsample_));
    for (auto& i : idx) i = draw(rng);   // bootstrap: with replacement
    TreeBuilder b{rows, rng, depth_limit};
    b.build(idx, 0, idx.size(), 0);
    trees_.push_back(std::move(b.tree));
  }
}

void IsolationForest::assign(std::vector<IsoTree> trees, int subsample) {
  trees_ = std::move(trees);
  subsample_ = subsample;
}

double IsolationForest::mean_path_length(const FeatureVector& x) const {
  if (trees_.empty()) return 0.0;
  double total = 0.0;
  for (const auto& t : trees_) {
    int i = 0, depth = 0;
    while (!t.nodes[i].leaf()) {
      const auto& nd = t.nodes[i];
      i = (x[nd.feature] <= nd.threshold) ? nd.left : nd.right;
      ++depth;
    }
    total += depth + average_path_length(t.nodes[i].size);
  }
  return total / static_cast<double>(trees_.size());
}

double IsolationForest::score_samples(const FeatureVector& x) const {
  const double c = average_path_length(subsample_);
  if (c <= 0.0) return -0.5;
  return -std::pow(2.0, -mean_path_length(x) / c);
}

} // namespace ransomwatch::app
