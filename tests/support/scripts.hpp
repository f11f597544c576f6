#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "internal/util/ids.hpp"

namespace meshdeploy::testing {

// Fresh directory below the system temp dir, removed on destruction.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& prefix)
      : path_(std::filesystem::temp_directory_path() / (prefix + "-" + util::RandomHexId())) {
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&)            = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  // Writes an executable /bin/sh script named `name` and returns its path.
  std::filesystem::path Script(const std::string& name, const std::string& body) const {
    const auto    file = path_ / name;
    std::ofstream out(file, std::ios::trunc);
    out << "#!/bin/sh\n" << body << "\n";
    out.close();
    std::filesystem::permissions(file, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
    return file;
  }

 private:
  std::filesystem::path path_;
};

} // namespace meshdeploy::testing
