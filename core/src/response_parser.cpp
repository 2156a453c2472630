#include "tale/response_parser.h"

#include <cctype>

namespace tale {

namespace {
constexpr const char* kLists[] = {"roll_requests", "patches", "lore_deltas"};

std::string trim(std::string_view text) {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  return std::string(text.substr(b, e - b));
}

void parse_error(ParsedResponse& out, const char* code, const std::string& message) {
  out.errors.push_back(TurnError{ErrorKind::Parse, code, "", message});
}

nlohmann::json normalize(nlohmann::json payload) {
  for (const char* key : kLists) {
    if (!payload.contains(key) || payload[key].is_null()) {
      payload[key] = nlohmann::json::array();
    }
  }
  return payload;
}

// End of the segment that starts at `begin`: the nearest marker after it.
size_t segment_end(size_t begin, size_t other_marker, size_t length) {
  return (other_marker != std::string_view::npos && other_marker >= begin) ? other_marker : length;
}

void read_object(ParsedResponse& out, std::string_view text) {
  auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded()) {
    parse_error(out, "payload_invalid_json", "structured payload is not valid JSON");
    return;
  }
  if (!parsed.is_object()) {
    parse_error(out, "payload_not_object", "structured payload must be a JSON object");
    return;
  }
  out.payload = normalize(std::move(parsed));
  out.payload_found = true;
}
} // namespace

size_t ResponseParser::find_object_end(std::string_view text, size_t open) {
  if (open >= text.size() || text[open] != '{') return std::string_view::npos;
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (size_t i = open; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      ++depth;
    } else if (c == '}') {
      --depth;
      if (depth == 0) return i + 1;
    }
  }
  return std::string_view::npos;
}

ParsedResponse ResponseParser::parse(std::string_view input) const {
  std::string cleaned(input);
  ParsedResponse out;
  out.text_repaired = ensure_valid_utf8(cleaned);
  const std::string_view raw = cleaned;
  out.payload = normalize(nlohmann::json::object());

  const size_t text_pos = raw.find(kTextMarker);
  const size_t json_pos = raw.find(kJsonMarker);

  if (json_pos != std::string_view::npos) {
    const size_t begin = json_pos + kJsonMarker.size();
    const size_t end = segment_end(begin, text_pos, raw.size());
    const std::string segment = trim(raw.substr(begin, end - begin));
    if (segment.empty()) {
      parse_error(out, "payload_missing", "DM_JSON marker present but no payload follows");
    } else if (segment.front() == '{') {
      const size_t close = find_object_end(segment, 0);
      if (close == std::string_view::npos) {
        parse_error(out, "payload_invalid_json", "structured payload is not a closed JSON object");
      } else {
        read_object(out, std::string_view(segment).substr(0, close));
      }
    } else {
      read_object(out, segment);
    }

    if (text_pos != std::string_view::npos) {
      const size_t tb = text_pos + kTextMarker.size();
      const size_t te = segment_end(tb, json_pos, raw.size());
      out.narrative = trim(raw.substr(tb, te - tb));
    } else {
      out.narrative = trim(raw.substr(0, json_pos));
    }
    return out;
  }

  // No payload marker: the first balanced group that reads as a JSON object
  // is the payload. Braces in prose stay in the narrative.
  const size_t search_from = text_pos == std::string_view::npos ? 0 : text_pos + kTextMarker.size();
  bool saw_group = false;
  size_t open = raw.find('{', search_from);
  while (open != std::string_view::npos) {
    const size_t close = find_object_end(raw, open);
    if (close == std::string_view::npos) {
      open = raw.find('{', open + 1);
      continue;
    }
    saw_group = true;
    const std::string_view candidate = raw.substr(open, close - open);
    auto parsed = nlohmann::json::parse(candidate.begin(), candidate.end(), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
      out.payload = normalize(std::move(parsed));
      out.payload_found = true;
      out.narrative =
          trim(std::string(raw.substr(search_from, open - search_from)) + std::string(raw.substr(close)));
      return out;
    }
    open = raw.find('{', close);
  }

  if (saw_group) {
    parse_error(out, "payload_invalid_json", "no balanced group in narrator output is a JSON object");
  } else {
    parse_error(out, "payload_missing", "no structured payload found in narrator output");
  }
  out.narrative = trim(raw.substr(search_from));
  return out;
}

bool ensure_valid_utf8(std::string& text) {
  const nlohmann::json wrapped = text;
  const std::string escaped = wrapped.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::string repaired = nlohmann::json::parse(escaped).get<std::string>();
  if (repaired == text) return false;
  text = std::move(repaired);
  return true;
}

void append_payload(nlohmann::json& base, const nlohmann::json& extra) {
  if (!extra.is_object()) return;
  for (const char* key : {"patches", "lore_deltas"}) {
    if (!extra.contains(key) || !extra[key].is_array()) continue;
    if (!base.contains(key) || !base[key].is_array()) {
      base[key] = nlohmann::json::array();
    }
    for (const auto& item : extra[key]) {
      base[key].push_back(item);
    }
  }
}

} // namespace tale
