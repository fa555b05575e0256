#pragma once
#include "model/System.hpp"

namespace ransomwatch::collectors {

class MemoryCollector {
public:
  bool sample(ransomwatch::model::MemorySample& out) const; // returns true on success
};

} // namespace ransomwatch::collectors
