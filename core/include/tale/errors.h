#pragma once

#include <string>
#include <vector>

namespace tale {

enum class ErrorKind {
  Parse,
  Validation,
  Mechanics,
  StateConflict,
  Persistence,
};

const char* to_string(ErrorKind kind);

// One reported problem. `field` is a keypath into the narrator payload
// ("patches[2].value") or empty when the problem is not field scoped.
struct TurnError {
  ErrorKind kind = ErrorKind::Validation;
  std::string code;
  std::string field;
  std::string message;
};

std::string describe(const TurnError& error);
std::string describe(const std::vector<TurnError>& errors);

} // namespace tale
