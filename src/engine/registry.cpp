#include "engine/registry.hpp"

#include <algorithm>

namespace sg::engine {

auto StepRegistry::register_step_factory(std::string name, StepFactory factory) -> void {
  steps_[std::move(name)] = std::move(factory);
}

auto StepRegistry::register_branch_factory(std::string name, BranchFactory factory) -> void {
  branches_[std::move(name)] = std::move(factory);
}

auto StepRegistry::find_step(std::string_view name) const -> const StepFactory* {
  auto it = steps_.find(std::string(name));
  if (it == steps_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto StepRegistry::find_branch(std::string_view name) const -> const BranchFactory* {
  auto it = branches_.find(std::string(name));
  if (it == branches_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto StepRegistry::step_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(steps_.size());
  for (const auto& [name, _] : steps_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace sg::engine
