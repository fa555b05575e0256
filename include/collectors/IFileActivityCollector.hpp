#pragma once
#include "model/FileActivity.hpp"

namespace ransomwatch::collectors {

// Drains file events observed since the previous call.
class IFileActivityCollector {
public:
  virtual ~IFileActivityCollector() = default;
  [[nodiscard]] virtual ransomwatch::model::FileActivityBatch sample() = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Stand-in when no file-event backend could be opened: every batch is
// empty and flagged unavailable.
class NullFileCollector : public IFileActivityCollector {
public:
  ransomwatch::model::FileActivityBatch sample() override {
    ransomwatch::model::FileActivityBatch b{};
    b.available = false;
    return b;
  }
  const char* name() const override { return "unavailable"; }
};

} // namespace ransomwatch::collectors
