#include "tale/errors.h"

namespace tale {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Parse:
      return "parse";
    case ErrorKind::Validation:
      return "validation";
    case ErrorKind::Mechanics:
      return "mechanics";
    case ErrorKind::StateConflict:
      return "state_conflict";
    case ErrorKind::Persistence:
      return "persistence";
  }
  return "unknown";
}

std::string describe(const TurnError& error) {
  std::string out = std::string(to_string(error.kind)) + "/" + error.code;
  if (!error.field.empty()) {
    out += " at " + error.field;
  }
  if (!error.message.empty()) {
    out += ": " + error.message;
  }
  return out;
}

std::string describe(const std::vector<TurnError>& errors) {
  std::string out;
  for (const auto& e : errors) {
    if (!out.empty()) out += "; ";
    out += describe(e);
  }
  return out;
}

} // namespace tale
