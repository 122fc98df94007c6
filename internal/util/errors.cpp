#include "internal/util/errors.hpp"

namespace modeldb::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedFlavor:
      return "UnsupportedFlavorError";
    case ErrorKind::kFlavorNotPresent:
      return "FlavorNotPresentError";
    case ErrorKind::kManifestNotFound:
      return "ManifestNotFoundError";
    case ErrorKind::kMissingArtifactData:
      return "MissingArtifactDataError";
    case ErrorKind::kMalformedFlavorConfig:
      return "MalformedFlavorConfigError";
    case ErrorKind::kSchemaCreation:
      return "SchemaCreationError";
    case ErrorKind::kCommit:
      return "CommitError";
    case ErrorKind::kModelNotFound:
      return "ModelNotFoundError";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgumentError";
    case ErrorKind::kInternal:
      return "InternalError";
  }
  return "InternalError";
}

DeployError::DeployError(ErrorKind kind, const std::string& msg, std::exception_ptr cause)
    : std::runtime_error(msg), kind_(kind), cause_(std::move(cause)) {
}

std::string DescribeCause(const std::exception_ptr& cause) {
  if (!cause) {
    return {};
  }
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

void ThrowWrapped(ErrorKind kind, const std::string& context) {
  auto cause   = std::current_exception();
  auto details = DescribeCause(cause);
  throw DeployError(kind, details.empty() ? context : context + ": " + details, cause);
}

} // namespace modeldb::util
