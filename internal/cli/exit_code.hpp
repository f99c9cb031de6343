#pragma once

#include <exception>

namespace datalens::cli {

enum ExitCode : int {
  kExitOk              = 0,
  kExitUsage           = 1,
  kExitFatal           = 2,
  kExitNotFound        = 3,
  kExitInvalidArgument = 4,
  kExitInvalidState    = 5,
};

// Maps the util error types to process exit codes; anything else is fatal.
ExitCode ToExitCode(const std::exception& e);

} // namespace datalens::cli
