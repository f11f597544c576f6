#include "internal/build/prebuilt_builder.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/scripts.hpp"

namespace {

using meshdeploy::build::PrebuiltBuilder;
using meshdeploy::model::HostTargetKind;
using meshdeploy::testing::ScratchDir;

bool ThrowsBuildError(PrebuiltBuilder& builder, const std::string& ref, HostTargetKind target) {
  try {
    builder.Build(ref, target);
  } catch (const meshdeploy::util::BuildError&) {
    return true;
  }
  return false;
}

void TestResolvesBelowSearchPaths() {
  ScratchDir first("meshdeploy-bin");
  ScratchDir second("meshdeploy-bin");
  const auto tool = second.Script("tool", "exit 0");

  PrebuiltBuilder builder({first.Path(), second.Path()});
  const auto      artifact = builder.Build("tool", HostTargetKind::kLocal);
  assert(artifact.source_ref == "tool");
  assert(artifact.target == HostTargetKind::kLocal);
  assert(artifact.path == std::filesystem::absolute(tool).string());
}

void TestLinuxTargetPrefersLinuxBuild() {
  ScratchDir bin("meshdeploy-bin");
  const auto native = bin.Script("svc", "exit 0");
  const auto linux_build = bin.Script("svc.linux", "exit 0");

  PrebuiltBuilder builder({bin.Path()});
  assert(builder.Build("svc", HostTargetKind::kLinux).path == linux_build.string());
  assert(builder.Build("svc", HostTargetKind::kLocal).path == native.string());
}

void TestLinuxTargetFallsBackToPlainName() {
  ScratchDir bin("meshdeploy-bin");
  const auto plain = bin.Script("svc", "exit 0");

  PrebuiltBuilder builder({bin.Path()});
  assert(builder.Build("svc", HostTargetKind::kLinux).path == plain.string());
}

void TestAbsoluteReference() {
  ScratchDir bin("meshdeploy-bin");
  const auto tool = bin.Script("tool", "exit 0");

  PrebuiltBuilder builder({});
  assert(builder.Build(tool.string(), HostTargetKind::kLocal).path == tool.string());
}

void TestResultsAreMemoized() {
  ScratchDir bin("meshdeploy-bin");
  bin.Script("svc", "exit 0");

  PrebuiltBuilder builder({bin.Path()});
  builder.Build("svc", HostTargetKind::kLocal);
  builder.Build("svc", HostTargetKind::kLocal);
  assert(builder.Resolutions() == 1);

  // memoized per target kind
  builder.Build("svc", HostTargetKind::kLinux);
  assert(builder.Resolutions() == 2);

  // a cached artifact survives removal of the file
  std::filesystem::remove(bin.Path() / "svc");
  assert(builder.Build("svc", HostTargetKind::kLocal).source_ref == "svc");
  assert(builder.Resolutions() == 2);
}

void TestMissingReferences() {
  ScratchDir bin("meshdeploy-bin");
  {
    std::ofstream out(bin.Path() / "data.txt");
    out << "not a program\n";
  }

  PrebuiltBuilder builder({bin.Path()});
  assert(ThrowsBuildError(builder, "", HostTargetKind::kLocal));
  assert(ThrowsBuildError(builder, "ghost", HostTargetKind::kLocal));
  assert(ThrowsBuildError(builder, "data.txt", HostTargetKind::kLocal));
  assert(builder.Resolutions() == 0);
}

} // namespace

int main() {
  TestResolvesBelowSearchPaths();
  TestLinuxTargetPrefersLinuxBuild();
  TestLinuxTargetFallsBackToPlainName();
  TestAbsoluteReference();
  TestResultsAreMemoized();
  TestMissingReferences();

  std::cout << "meshdeploy_unit_prebuilt_builder: pass\n";
  return 0;
}
