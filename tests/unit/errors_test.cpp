#include <cassert>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using pano::util::ErrorCode;
using pano::util::ErrorCodeName;
using pano::util::ErrorCodeOf;

void TestClassification() {
  assert(ErrorCodeOf(pano::util::NotFound("x")) == ErrorCode::NotFound);
  assert(ErrorCodeOf(pano::util::InvalidState("x")) == ErrorCode::InvalidState);
  assert(ErrorCodeOf(pano::util::InvalidArgument("x")) == ErrorCode::InvalidArgument);
  assert(ErrorCodeOf(pano::util::MetadataUnavailable("x")) == ErrorCode::MetadataUnavailable);
  assert(ErrorCodeOf(pano::util::IndexOutOfRange("x")) == ErrorCode::IndexOutOfRange);
  assert(ErrorCodeOf(pano::util::ExternalToolFailure("nona", 1, "x")) == ErrorCode::ExternalToolFailure);
  assert(ErrorCodeOf(std::runtime_error("x")) == ErrorCode::InternalError);
}

void TestStorageHierarchy() {
  assert(ErrorCodeOf(pano::util::StorageError("x")) == ErrorCode::StorageError);
  assert(ErrorCodeOf(pano::util::StorageCorrupt("x")) == ErrorCode::StorageCorrupt);
  // a missing artifact is an ordinary storage error
  assert(ErrorCodeOf(pano::util::ArtifactMissing("x")) == ErrorCode::StorageError);
}

void TestToolFailureCarriesDetails() {
  try {
    throw pano::util::ExternalToolFailure("enblend", 2, "enblend exited with code 2");
  } catch (const pano::util::ExternalToolFailure& e) {
    assert(e.Tool() == "enblend");
    assert(e.ExitCode() == 2);
    assert(std::strcmp(e.what(), "enblend exited with code 2") == 0);
  }
}

void TestNames() {
  assert(std::strcmp(ErrorCodeName(ErrorCode::OK), "ok") == 0);
  assert(std::strcmp(ErrorCodeName(ErrorCode::IndexOutOfRange), "index_out_of_range") == 0);
  assert(std::strcmp(ErrorCodeName(ErrorCode::ExternalToolFailure), "external_tool_failure") == 0);
}

} // namespace

int main() {
  TestClassification();
  TestStorageHierarchy();
  TestToolFailureCarriesDetails();
  TestNames();

  std::cout << "pano_manager_unit_errors: pass\n";
  return 0;
}
