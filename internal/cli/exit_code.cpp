#include "exit_code.hpp"

#include "internal/util/errors.hpp"

namespace datalens::cli {

ExitCode ToExitCode(const std::exception& e) {
  using namespace datalens::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return kExitNotFound;
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const AlreadyExists*>(&e)) {
    return kExitInvalidArgument;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return kExitInvalidState;
  }

  return kExitFatal;
}

} // namespace datalens::cli
