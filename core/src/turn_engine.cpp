#include "tale/turn_engine.h"

#include "tale/log.h"

#include <algorithm>
#include <utility>

namespace tale {

namespace {
uint64_t fnv1a_64(const std::string& data) {
  uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::vector<std::string> as_warnings(const std::vector<TurnError>& errors) {
  std::vector<std::string> out;
  for (const auto& e : errors) out.push_back(describe(e));
  return out;
}
} // namespace

const char* to_string(TurnPhase phase) {
  switch (phase) {
    case TurnPhase::Initialized:
      return "INITIALIZED";
    case TurnPhase::ContextBuilt:
      return "CONTEXT_BUILT";
    case TurnPhase::ProposalReceived:
      return "PROPOSAL_RECEIVED";
    case TurnPhase::MechanicsExecuted:
      return "MECHANICS_EXECUTED";
    case TurnPhase::FinalResponse:
      return "FINAL_RESPONSE";
    case TurnPhase::Validated:
      return "VALIDATED";
    case TurnPhase::Persisted:
      return "PERSISTED";
    case TurnPhase::Failed:
      return "FAILED";
  }
  return "FAILED";
}

bool is_terminal(TurnPhase phase) {
  return phase == TurnPhase::Persisted || phase == TurnPhase::Failed;
}

bool is_legal_transition(TurnPhase from, TurnPhase to) {
  if (is_terminal(from)) return false;
  if (to == TurnPhase::Failed) return true;
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

nlohmann::json to_json(const TurnResult& result) {
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& e : result.errors) {
    errors.push_back({{"kind", to_string(e.kind)}, {"code", e.code}, {"field", e.field}, {"message", e.message}});
  }
  nlohmann::json j = {{"success", result.success},
                      {"phase", to_string(result.phase)},
                      {"narrative", result.narrative},
                      {"roll_results", to_json(result.roll_results)},
                      {"errors", errors},
                      {"warnings", result.warnings},
                      {"seed", result.seed}};
  if (result.success) {
    j["turn_index"] = result.turn_index;
    j["state_hash"] = result.state_hash;
  } else {
    j["failed_phase"] = to_string(result.failed_phase);
  }
  return j;
}

int64_t derive_turn_seed(const std::string& campaign_id, int64_t turn_index) {
  const uint64_t hash = fnv1a_64(campaign_id + ":" + std::to_string(turn_index));
  return static_cast<int64_t>(hash & 0x7fffffffffffffffull);
}

TurnRun::TurnRun(TurnEngine& engine, TurnRequest request) : engine_(engine), request_(std::move(request)) {}

bool TurnRun::step() {
  switch (result_.phase) {
    case TurnPhase::Initialized:
      build_context();
      break;
    case TurnPhase::ContextBuilt:
      receive_proposal();
      break;
    case TurnPhase::ProposalReceived:
      execute_mechanics();
      break;
    case TurnPhase::MechanicsExecuted:
      final_response();
      break;
    case TurnPhase::FinalResponse:
      validate();
      break;
    case TurnPhase::Validated:
      persist();
      break;
    case TurnPhase::Persisted:
    case TurnPhase::Failed:
      return false;
  }
  if (finished()) {
    guard_.reset();
  }
  return !finished();
}

const TurnResult& TurnRun::run() {
  while (step()) {
  }
  return result_;
}

bool TurnRun::advance_to(TurnPhase next) {
  if (!is_legal_transition(result_.phase, next)) {
    log::error(std::string("turn: illegal transition ") + to_string(result_.phase) + " -> " + to_string(next));
    return false;
  }
  log::debug(std::string("turn ") + request_.campaign_id + ": " + to_string(next));
  result_.phase = next;
  return true;
}

void TurnRun::fail(std::vector<TurnError> errors) {
  result_.failed_phase = result_.phase;
  result_.errors.insert(result_.errors.end(), errors.begin(), errors.end());
  result_.success = false;
  result_.turn_index = 0;
  result_.state_hash.clear();
  result_.phase = TurnPhase::Failed;
  log::warn(std::string("turn ") + request_.campaign_id + " failed at " + to_string(result_.failed_phase) + " with " +
            std::to_string(result_.errors.size()) + " errors");
}

void TurnRun::fail(ErrorKind kind, const std::string& code, const std::string& message) {
  fail({TurnError{kind, code, "", message}});
}

void TurnRun::build_context() {
  guard_ = engine_.locks_.try_acquire(request_.campaign_id);
  if (!guard_) {
    fail(ErrorKind::StateConflict, "campaign_busy", "another turn is in flight for " + request_.campaign_id);
    return;
  }

  std::string error;
  if (!engine_.store_.get_campaign(request_.campaign_id, campaign_, error)) {
    fail(ErrorKind::StateConflict, "unknown_campaign", error);
    return;
  }
  if (campaign_.status != CampaignStatus::Active) {
    fail(ErrorKind::StateConflict, "campaign_not_active",
         std::string("campaign is ") + to_string(campaign_.status));
    return;
  }
  if (!engine_.states_.current_state(campaign_.id, current_, error)) {
    fail(ErrorKind::Persistence, "state_unavailable", error);
    return;
  }

  const int64_t next_index = current_.turn_index() + 1;
  result_.seed = request_.seed.has_value() ? *request_.seed : derive_turn_seed(campaign_.id, next_index);

  context_.campaign_id = campaign_.id;
  context_.turn_index = next_index;
  if (ensure_valid_utf8(request_.player_input)) {
    result_.warnings.push_back("player input contained invalid UTF-8; replaced");
  }
  context_.player_input = request_.player_input;
  context_.state = current_.document();
  const int64_t window = engine_.config_.recent_turn_window;
  if (window > 0 && current_.turn_index() > 0) {
    const int64_t first = std::max<int64_t>(1, current_.turn_index() - window + 1);
    if (!engine_.store_.read_turns(campaign_.id, first, current_.turn_index(), context_.recent_turns, error)) {
      fail(ErrorKind::Persistence, "store_read_failed", error);
      return;
    }
  }
  advance_to(TurnPhase::ContextBuilt);
}

void TurnRun::receive_proposal() {
  const auto raw = engine_.narrator_.propose(context_);
  if (!raw.has_value()) {
    fail(ErrorKind::Parse, "narrator_no_response", "narrator returned no proposal");
    return;
  }
  ParsedResponse parsed = engine_.parser_.parse(*raw);
  if (parsed.text_repaired) {
    result_.warnings.push_back("narrator output contained invalid UTF-8; replaced");
  }
  if (!parsed.ok()) {
    if (parsed.narrative.empty()) {
      fail(parsed.errors);
      return;
    }
    // Recoverable: the narrative stands and the payload is treated as empty.
    const auto warnings = as_warnings(parsed.errors);
    result_.warnings.insert(result_.warnings.end(), warnings.begin(), warnings.end());
  }
  result_.narrative = parsed.narrative;
  payload_ = parsed.payload;
  advance_to(TurnPhase::ProposalReceived);
}

void TurnRun::run_mechanics(const std::vector<RollRequest>& requests) {
  DiceRoller dice(result_.seed);
  MechanicsExecutor executor(dice);
  result_.roll_results = executor.execute(requests, current_.character());
  executed_requests_ = nlohmann::json::array();
  for (const auto& r : requests) executed_requests_.push_back(to_json(r));
  for (const auto& r : result_.roll_results) {
    if (!r.error.empty()) {
      result_.warnings.push_back("roll " + r.id + ": " + r.error);
    }
  }
}

void TurnRun::execute_mechanics() {
  std::vector<TurnError> ignored;  // reported again at validation
  const auto requests = decode_roll_requests(payload_["roll_requests"], ignored);
  run_mechanics(requests);
  advance_to(TurnPhase::MechanicsExecuted);
}

void TurnRun::final_response() {
  if (!result_.roll_results.empty()) {
    const auto raw = engine_.narrator_.finalize(context_, result_.narrative, result_.roll_results);
    if (raw.has_value()) {
      ParsedResponse parsed = engine_.parser_.parse(*raw);
      if (!parsed.narrative.empty()) {
        result_.narrative = parsed.narrative;
      }
      if (parsed.payload_found) {
        append_payload(payload_, parsed.payload);
      } else if (parsed.narrative.empty()) {
        result_.warnings.push_back("final narration unreadable; keeping the proposal");
      }
    }
  }
  advance_to(TurnPhase::FinalResponse);
}

std::string TurnRun::render_response() const {
  return std::string(ResponseParser::kTextMarker) + "\n" + result_.narrative + "\n\n" +
         std::string(ResponseParser::kJsonMarker) + "\n" + payload_.dump(2);
}

bool TurnRun::try_repair(ValidationResult& validation) {
  for (int attempt = 1; attempt <= engine_.config_.max_repair_attempts; ++attempt) {
    log::info("turn " + request_.campaign_id + ": repair attempt " + std::to_string(attempt) + "/" +
              std::to_string(engine_.config_.max_repair_attempts));
    const auto raw = engine_.narrator_.repair(context_, validation.error_list(), render_response());
    if (!raw.has_value()) {
      return false;
    }
    ParsedResponse parsed = engine_.parser_.parse(*raw);
    if (!parsed.ok()) {
      continue;
    }
    DecodedPayload decoded = decode_payload(parsed.payload);
    ValidationResult repaired = engine_.validator_.validate(decoded);
    if (!repaired.valid()) {
      validation = repaired;
      continue;
    }
    if (!parsed.narrative.empty()) result_.narrative = parsed.narrative;
    payload_ = parsed.payload;
    decoded_ = std::move(decoded);
    nlohmann::json requests = nlohmann::json::array();
    for (const auto& r : decoded_.roll_requests) requests.push_back(to_json(r));
    if (requests != executed_requests_) {
      // Same seed, so the re-run is as reproducible as the first.
      run_mechanics(decoded_.roll_requests);
    }
    validation = repaired;
    return true;
  }
  return false;
}

void TurnRun::validate() {
  decoded_ = decode_payload(payload_);
  ValidationResult validation = engine_.validator_.validate(decoded_);
  if (!validation.valid() && !try_repair(validation)) {
    fail(validation.error_list());
    return;
  }
  const auto warnings = validation.warning_messages();
  result_.warnings.insert(result_.warnings.end(), warnings.begin(), warnings.end());

  next_ = current_;
  std::string error;
  if (!next_.apply_patch(decoded_.patches, error)) {
    fail(ErrorKind::Validation, "patch_not_applicable", error);
    return;
  }
  next_.set_turn_index(context_.turn_index);
  advance_to(TurnPhase::Validated);
}

void TurnRun::persist() {
  TurnEvent event;
  event.campaign_id = campaign_.id;
  event.turn_index = context_.turn_index;
  event.player_input = request_.player_input;
  event.narrative = result_.narrative;
  event.roll_requests = executed_requests_;
  event.roll_results = to_json(result_.roll_results);
  event.patch = patches_to_json(decoded_.patches);
  event.state_hash = next_.compute_hash();
  nlohmann::json lore = nlohmann::json::array();
  for (const auto& d : decoded_.lore_deltas) lore.push_back(to_json(d));
  event.lore_deltas = lore;
  event.universe_time = next_.universe_time();
  event.created_at = utc_timestamp();
  event.seed = result_.seed;

  std::string error;
  if (!engine_.store_.append_turn(event, error)) {
    log::error("turn " + campaign_.id + ": persistence failed: " + error);
    fail(ErrorKind::Persistence, "store_write_failed", error);
    return;
  }
  if (!engine_.lore_.record(campaign_.id, event.turn_index, decoded_.lore_deltas, error)) {
    log::warn("turn " + campaign_.id + ": lore record failed: " + error);
    result_.warnings.push_back("lore not recorded: " + error);
  }
  bool written = false;
  if (!engine_.states_.save_snapshot(next_, false, written, error)) {
    log::warn("turn " + campaign_.id + ": snapshot failed: " + error);
    result_.warnings.push_back("snapshot not saved: " + error);
  }

  result_.turn_index = event.turn_index;
  result_.state_hash = event.state_hash;
  result_.state = next_;
  result_.success = true;
  advance_to(TurnPhase::Persisted);
  log::info("turn " + campaign_.id + " #" + std::to_string(event.turn_index) + " persisted (" +
            std::to_string(result_.roll_results.size()) + " rolls, " + std::to_string(decoded_.patches.size()) +
            " patches)");
}

TurnEngine::TurnEngine(const EngineConfig& config, TurnStore& store, Narrator& narrator, LoreSink& lore,
                       CampaignLockRegistry& locks)
    : config_(config),
      store_(store),
      narrator_(narrator),
      lore_(lore),
      locks_(locks),
      states_(store, config),
      validator_(config) {}

TurnResult TurnEngine::process_turn(const TurnRequest& request) {
  TurnRun run(*this, request);
  return run.run();
}

TurnRun TurnEngine::start(TurnRequest request) {
  return TurnRun(*this, std::move(request));
}

} // namespace tale
