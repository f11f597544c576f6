#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/capability/build.hpp"

namespace meshdeploy::build {

/*
  Resolves source references to executables that were built ahead of time.

  A reference is looked up as given (absolute or relative to the working
  directory), then below each search path. For linux targets the name
  "<ref>.linux" is tried before "<ref>". Results are memoized per
  (reference, target kind).
*/
class PrebuiltBuilder : public capability::BuildCapability {
 public:
  explicit PrebuiltBuilder(std::vector<std::filesystem::path> search_paths);

  capability::Artifact Build(const std::string& source_ref, model::HostTargetKind target) override;

  std::size_t Resolutions() const;

 private:
  std::filesystem::path Resolve(const std::string& source_ref, model::HostTargetKind target) const;

  const std::vector<std::filesystem::path> search_paths_;

  mutable std::mutex                                                        mutex_;
  std::map<std::pair<std::string, model::HostTargetKind>, capability::Artifact> cache_;
  std::size_t                                                               resolutions_{0};
};

} // namespace meshdeploy::build
