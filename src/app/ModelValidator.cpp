#include "app/ModelValidator.hpp"
#include "util/Log.hpp"

#include <cmath>
#include <cstdio>

using ransomwatch::model::kFeatureCount;
using ransomwatch::model::kFeatureNames;

namespace ransomwatch::app {

namespace {

std::string fmt(const char* f, double a, double b = 0.0) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), f, a, b);
  return buf;
}

void check_trees(const IsolationForest& forest, std::vector<std::string>& problems) {
  if (forest.empty() || forest.subsample() <= 0) {
    problems.emplace_back("forest has no trees");
    return;
  }
  for (size_t t = 0; t < forest.trees().size(); ++t) {
    const auto& nodes = forest.trees()[t].nodes;
    const int count = static_cast<int>(nodes.size());
    if (nodes.empty()) {
      problems.push_back("tree " + std::to_string(t) + " is empty");
      return;
    }
    for (int i = 0; i < count; ++i) {
      const auto& n = nodes[static_cast<size_t>(i)];
      bool leaf = n.left < 0 && n.right < 0 && n.size >= 0;
      bool inner = n.left > i && n.left < count && n.right > i && n.right < count &&
                   n.feature >= 0 && n.feature < static_cast<int>(kFeatureCount) && std::isfinite(n.threshold);
      if (!leaf && !inner) {
        problems.push_back("tree " + std::to_string(t) + " node " + std::to_string(i) + " is malformed");
        return;
      }
    }
  }
}

} // namespace

ModelCheck validate_model(const std::shared_ptr<const TrainedModel>& model, std::chrono::milliseconds interval,
                          const Thresholds& thresholds, const ransomwatch::model::FeatureVector* live) {
  ModelCheck out{};
  auto& p = out.problems;
  if (!model) {
    p.emplace_back("no model");
    return out;
  }
  const TrainedModel& m = *model;
  if (m.schema_version != ransomwatch::model::kFeatureSchemaVersion || m.feature_count != kFeatureCount)
    p.push_back(fmt("feature schema %g with %g features does not match this build",
                    m.schema_version, static_cast<double>(m.feature_count)));
  if (m.interval != interval)
    p.push_back(fmt("trained at a %g ms interval, running at %g ms",
                    static_cast<double>(m.interval.count()), static_cast<double>(interval.count())));
  if (!(m.contamination > 0.0 && m.contamination < 0.5)) p.push_back(fmt("contamination %g outside (0, 0.5)", m.contamination));
  if (m.samples < 2) p.push_back(fmt("trained on %g samples", static_cast<double>(m.samples)));

  for (size_t f = 0; f < kFeatureCount; ++f) {
    const auto& s = m.stats[f];
    bool scaler_ok = std::isfinite(m.scaler.mean[f]) && std::isfinite(m.scaler.scale[f]) && m.scaler.scale[f] > 0.0;
    bool stats_ok = std::isfinite(s.min) && std::isfinite(s.max) && std::isfinite(s.mean) && std::isfinite(s.std) &&
                    s.min <= s.max && s.std >= 0.0;
    if (!scaler_ok) p.push_back(std::string("scaler for ") + kFeatureNames[f] + " is not finite");
    if (!stats_ok) p.push_back(std::string("baseline statistics for ") + kFeatureNames[f] + " are inconsistent");
  }
  check_trees(m.forest, p);
  if (!std::isfinite(m.offset) || m.offset < -1.0 || m.offset > 0.0)
    p.push_back(fmt("offset %g outside [-1, 0]", m.offset));
  if (!std::isfinite(m.train_score_std) || m.train_score_std < 0.0)
    p.push_back(fmt("training score spread %g is invalid", m.train_score_std));

  if (live && p.empty()) {
    OnlineAnalyzer analyzer(thresholds);
    analyzer.set_model(model);
    Verdict v = analyzer.score(*live);
    if (!std::isfinite(v.score) || !(v.raw_score >= -1.0 && v.raw_score <= 0.0))
      p.push_back(fmt("live vector scored %g (isolation %g)", v.score, v.raw_score));
    out.live = std::move(v);
  }
  for (const auto& msg : p) RW_LOG_WARN("ModelValidator", "%s", msg.c_str());
  return out;
}

} // namespace ransomwatch::app
