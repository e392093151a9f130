#include "util/result.hpp"

namespace relup {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "ok";
        case ErrorKind::Io:                return "io";
        case ErrorKind::Config:            return "config";
        case ErrorKind::MissingDependency: return "missing_dependency";
        case ErrorKind::BuildFailure:      return "build_failure";
        case ErrorKind::SigningFailure:    return "signing_failure";
        case ErrorKind::NetworkFailure:    return "network_failure";
        case ErrorKind::InvalidManifest:   return "invalid_manifest";
        case ErrorKind::ChecksumMismatch:  return "checksum_mismatch";
        case ErrorKind::SignatureMissing:  return "signature_missing";
        case ErrorKind::SignatureInvalid:  return "signature_invalid";
        case ErrorKind::ApplyFailure:      return "apply_failure";
        case ErrorKind::NoBackupAvailable: return "no_backup_available";
        case ErrorKind::LockContention:    return "lock_contention";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown";
}

} // namespace relup
