#pragma once
#include "rs/ids/Id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rs {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands; // in teardown order
};

// Translates a declarative description into scene commands using
// deterministic ids (idBase + slot).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }
};

} // namespace rs
