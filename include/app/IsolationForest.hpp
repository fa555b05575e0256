#pragma once
#include "model/Features.hpp"
#include <cstdint>
#include <vector>

namespace ransomwatch::app {

// Per-feature standardization (population std). Zero-variance features
// keep scale 1 so they pass through centred.
struct StandardScaler {
  ransomwatch::model::FeatureVector mean{};
  ransomwatch::model::FeatureVector scale{};

  void fit(const std::vector<ransomwatch::model::FeatureVector>& rows);
  [[nodiscard]] ransomwatch::model::FeatureVector transform(const ransomwatch::model::FeatureVector& x) const;
};

struct IsoNode {
  int feature{-1};
  double threshold{0.0};
  int left{-1};
  int right{-1};
  int size{0};            // training rows that reached this node
  bool leaf() const { return left < 0; }
};

struct IsoTree { std::vector<IsoNode> nodes; };

struct ForestParams {
  int trees{200};
  int max_samples{256};
  uint64_t seed{42};
};

// Isolation forest: each tree is grown on a bootstrap subsample by
// picking a random non-constant feature and a uniform threshold inside
// the node's range, down to a depth limit of ceil(log2(subsample)).
class IsolationForest {
public:
  void fit(const std::vector<ransomwatch::model::FeatureVector>& rows, const ForestParams& params);

  // -2^(-E[h(x)] / c(subsample)), in [-1, 0]; lower is more anomalous.
  [[nodiscard]] double score_samples(const ransomwatch::model::FeatureVector& x) const;
  [[nodiscard]] double mean_path_length(const ransomwatch::model::FeatureVector& x) const;

  [[nodiscard]] bool empty() const { return trees_.empty(); }
  [[nodiscard]] const std::vector<IsoTree>& trees() const { return trees_; }
  [[nodiscard]] int subsample() const { return subsample_; }

  // Used when restoring a persisted model.
  void assign(std::vector<IsoTree> trees, int subsample);

  // Average unsuccessful-search path length in a BST of n points.
  [[nodiscard]] static double average_path_length(double n);

private:
  std::vector<IsoTree> trees_;
  int subsample_{0};
};

} // namespace ransomwatch::app
