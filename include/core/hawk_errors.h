#pragma once

namespace hawk {

// Failure taxonomy shared by resolver, navigation and fetch results
enum class ErrorKind {
  NONE,
  DETECTION,   // Page could not be inspected; detection failed open
  SOLVE,       // Solver unreachable, rejected the task or timed out
  INJECTION,   // Token obtained but the page did not accept it
  NAVIGATION,  // Driver-level navigation failure
  ABORT        // Run-wide stop requested
};

inline const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE: return "none";
    case ErrorKind::DETECTION: return "detection";
    case ErrorKind::SOLVE: return "solve";
    case ErrorKind::INJECTION: return "injection";
    case ErrorKind::NAVIGATION: return "navigation";
    case ErrorKind::ABORT: return "abort";
    default: return "unknown";
  }
}

}  // namespace hawk
