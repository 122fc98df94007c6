#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace modeldb::util {

/*
  Central error type.

  Every failure that leaves the deployment pipeline is a DeployError.
  Callers branch on kind(), never on the dynamic type.
*/

enum class ErrorKind {
  kUnsupportedFlavor,
  kFlavorNotPresent,
  kManifestNotFound,
  kMissingArtifactData,
  kMalformedFlavorConfig,
  kSchemaCreation,
  kCommit,
  kModelNotFound,
  kInvalidArgument,
  kInternal
};

std::string_view ErrorKindName(ErrorKind kind);

class DeployError : public std::runtime_error {
 public:
  DeployError(ErrorKind kind, const std::string& msg, std::exception_ptr cause = nullptr);

  ErrorKind kind() const noexcept {
    return kind_;
  }

  // Underlying failure for wrapped errors (kInternal, kCommit), may be null.
  std::exception_ptr cause() const noexcept {
    return cause_;
  }

 private:
  ErrorKind          kind_;
  std::exception_ptr cause_;
};

// Wraps the in-flight exception as kind, appending its message.
// Must be called from inside a catch block.
[[noreturn]] void ThrowWrapped(ErrorKind kind, const std::string& context);

// Best-effort description of an exception_ptr ("unknown error" for non std types).
std::string DescribeCause(const std::exception_ptr& cause);

} // namespace modeldb::util
