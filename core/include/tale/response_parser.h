#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/errors.h"

namespace tale {

struct ParsedResponse {
  std::string narrative;
  // Always an object holding `roll_requests`, `patches` and `lore_deltas`
  // (empty lists when absent or when the payload could not be read).
  nlohmann::json payload = nlohmann::json::object();
  bool payload_found = false;
  // Set when invalid UTF-8 in the raw output was replaced with U+FFFD.
  bool text_repaired = false;
  std::vector<TurnError> errors;  // kind Parse

  bool ok() const { return errors.empty(); }
};

// Splits raw narrator output into narrative text and the structured payload.
// Never throws; malformed input produces errors and whatever narrative could
// be recovered.
class ResponseParser {
 public:
  static constexpr std::string_view kTextMarker = "DM_TEXT:";
  static constexpr std::string_view kJsonMarker = "DM_JSON:";

  ParsedResponse parse(std::string_view raw) const;

  // Index one past the closing brace of the object starting at `open`, or
  // npos when it never closes. String literals and escapes are skipped.
  static size_t find_object_end(std::string_view text, size_t open);
};

// Replaces invalid UTF-8 sequences in `text` with U+FFFD. Returns true when
// anything changed.
bool ensure_valid_utf8(std::string& text);

// Appends the patches and lore deltas of `extra` to `base`. Roll requests
// are left alone: mechanics have already run when a final narration arrives.
void append_payload(nlohmann::json& base, const nlohmann::json& extra);

} // namespace tale
