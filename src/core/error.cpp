#include <boxscan/core/error.hpp>

namespace boxscan::core {

std::string_view to_string(ScanError error) noexcept {
  switch (error) {
    case ScanError::None:
      return "None";
    case ScanError::DetectionFailure:
      return "DetectionFailure";
    case ScanError::ExtractionFailure:
      return "ExtractionFailure";
    case ScanError::RecoveryFailure:
      return "RecoveryFailure";
    case ScanError::NoMatchFound:
      return "NoMatchFound";
    case ScanError::IndexUnavailable:
      return "IndexUnavailable";
    case ScanError::Timeout:
      return "Timeout";
    case ScanError::ServiceUnavailable:
      return "ServiceUnavailable";
    case ScanError::InvalidInput:
      return "InvalidInput";
    case ScanError::InvalidImage:
      return "InvalidImage";
    case ScanError::LoadFailed:
      return "LoadFailed";
    case ScanError::InvalidConfig:
      return "InvalidConfig";
    case ScanError::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace boxscan::core
