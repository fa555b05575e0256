#include "minitest.hpp"
#include "app/IsolationForest.hpp"
#include <random>

using namespace ransomwatch::app;
using ransomwatch::model::FeatureVector;

static std::vector<FeatureVector> gaussian_rows(size_t n, uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> nd(0.0, 1.0);
  std::vector<FeatureVector> rows(n);
  for (auto& r : rows) for (auto& v : r) v = nd(rng);
  return rows;
}

TEST(average_path_length_known_values) {
  ASSERT_NEAR(IsolationForest::average_path_length(0.0), 0.0, 1e-12);
  ASSERT_NEAR(IsolationForest::average_path_length(1.0), 0.0, 1e-12);
  ASSERT_NEAR(IsolationForest::average_path_length(2.0), 1.0, 1e-12);
  // 2(ln 255 + gamma) - 2*255/256
  ASSERT_NEAR(IsolationForest::average_path_length(256.0), 10.2448, 1e-3);
}

TEST(forest_scores_outlier_below_inliers) {
  auto rows = gaussian_rows(500, 1);
  IsolationForest f;
  f.fit(rows, ForestParams{.trees = 100, .max_samples = 256, .seed = 3});
  ASSERT_EQ(f.trees().size(), 100u);
  ASSERT_EQ(f.subsample(), 256);
  FeatureVector centre{}; centre.fill(0.0);
  FeatureVector far{}; far.fill(8.0);
  double s_centre = f.score_samples(centre);
  double s_far = f.score_samples(far);
  ASSERT_TRUE(s_far < s_centre);
  ASSERT_TRUE(s_centre >= -1.0 && s_centre <= 0.0);
  ASSERT_TRUE(f.mean_path_length(far) < f.mean_path_length(centre));
}

TEST(forest_is_deterministic_for_a_seed) {
  auto rows = gaussian_rows(300, 9);
  IsolationForest a, b;
  a.fit(rows, ForestParams{.trees = 50, .max_samples = 64, .seed = 11});
  b.fit(rows, ForestParams{.trees = 50, .max_samples = 64, .seed = 11});
  for (size_t i = 0; i < 20; ++i) ASSERT_NEAR(a.score_samples(rows[i]), b.score_samples(rows[i]), 0.0);
}

TEST(forest_subsample_capped_by_rows) {
  auto rows = gaussian_rows(40, 2);
  IsolationForest f;
  f.fit(rows, ForestParams{.trees = 10, .max_samples = 256, .seed = 1});
  ASSERT_EQ(f.subsample(), 40);
  for (const auto& t : f.trees()) {
    ASSERT_TRUE(!t.nodes.empty());
    ASSERT_EQ(t.nodes[0].size, 40);
    for (const auto& n : t.nodes) {
      if (n.leaf()) continue;
      ASSERT_EQ(t.nodes[n.left].size + t.nodes[n.right].size, n.size);
    }
  }
}

TEST(forest_constant_data_scores_half) {
  std::vector<FeatureVector> rows(50);
  for (auto& r : rows) r.fill(1.0);
  IsolationForest f;
  f.fit(rows, ForestParams{.trees = 10, .max_samples = 32, .seed = 5});
  FeatureVector x{}; x.fill(100.0);
  ASSERT_NEAR(f.score_samples(rows[0]), -0.5, 1e-12);
  ASSERT_NEAR(f.score_samples(x), -0.5, 1e-12);
}

TEST(forest_empty_input) {
  IsolationForest f;
  f.fit({}, ForestParams{});
  ASSERT_TRUE(f.empty());
  FeatureVector x{};
  ASSERT_NEAR(f.score_samples(x), -0.5, 1e-12);
}

TEST(scaler_zero_variance_keeps_unit_scale) {
  std::vector<FeatureVector> rows(4);
  for (size_t i = 0; i < rows.size(); ++i) { rows[i].fill(3.0); rows[i][0] = static_cast<double>(i); }
  StandardScaler s;
  s.fit(rows);
  ASSERT_NEAR(s.mean[0], 1.5, 1e-12);
  ASSERT_NEAR(s.scale[0], std::sqrt(1.25), 1e-12);
  ASSERT_NEAR(s.scale[1], 1.0, 1e-12);
  auto t = s.transform(rows[3]);
  ASSERT_NEAR(t[0], 1.5 / std::sqrt(1.25), 1e-12);
  ASSERT_NEAR(t[1], 0.0, 1e-12);
}
