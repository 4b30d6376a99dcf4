#include "veilguard/common/result.hpp"

namespace veilguard::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Generic:
    return "error";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  case ErrorKind::DetectionFailure:
    return "detection_failure";
  case ErrorKind::ClassificationFailure:
    return "classification_failure";
  case ErrorKind::StorageUnavailable:
    return "storage_unavailable";
  case ErrorKind::Timeout:
    return "timeout";
  }
  return "error";
}

} // namespace veilguard::common
