#include "internal/build/prebuilt_builder.hpp"

#include <unistd.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::build {

namespace fs = std::filesystem;

namespace {

bool IsExecutableFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

PrebuiltBuilder::PrebuiltBuilder(std::vector<fs::path> search_paths) : search_paths_(std::move(search_paths)) {
}

fs::path PrebuiltBuilder::Resolve(const std::string& source_ref, model::HostTargetKind target) const {
  std::vector<std::string> names;
  if (target == model::HostTargetKind::kLinux) {
    names.push_back(source_ref + ".linux");
  }
  names.push_back(source_ref);

  for (const auto& name : names) {
    if (IsExecutableFile(name)) {
      return fs::absolute(name);
    }
    if (fs::path(name).is_absolute()) continue;
    for (const auto& dir : search_paths_) {
      const auto candidate = dir / name;
      if (IsExecutableFile(candidate)) {
        return fs::absolute(candidate);
      }
    }
  }
  throw util::BuildError("no executable for '" + source_ref + "' (" + std::string(model::ToString(target)) + ") in " +
                         std::to_string(search_paths_.size()) + " search paths");
}

capability::Artifact PrebuiltBuilder::Build(const std::string& source_ref, model::HostTargetKind target) {
  if (source_ref.empty()) {
    throw util::BuildError("empty source reference");
  }

  std::lock_guard lock(mutex_);
  const auto      key = std::make_pair(source_ref, target);
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }

  capability::Artifact artifact{source_ref, target, Resolve(source_ref, target).string()};
  ++resolutions_;
  cache_.emplace(key, artifact);

  MESHDEPLOY_LOG_INFO("Artifact resolved", {observability::StringField("source", source_ref),
                                            observability::StringField("target", model::ToString(target)),
                                            observability::StringField("path", artifact.path)});
  return artifact;
}

std::size_t PrebuiltBuilder::Resolutions() const {
  std::lock_guard lock(mutex_);
  return resolutions_;
}

} // namespace meshdeploy::build
