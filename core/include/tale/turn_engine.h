#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/campaign_lock.h"
#include "tale/campaign_state.h"
#include "tale/config.h"
#include "tale/dice.h"
#include "tale/errors.h"
#include "tale/lore.h"
#include "tale/mechanics.h"
#include "tale/narrator.h"
#include "tale/payload.h"
#include "tale/response_parser.h"
#include "tale/state_service.h"
#include "tale/turn_store.h"
#include "tale/validation.h"

namespace tale {

enum class TurnPhase {
  Initialized,
  ContextBuilt,
  ProposalReceived,
  MechanicsExecuted,
  FinalResponse,
  Validated,
  Persisted,
  Failed,
};

const char* to_string(TurnPhase phase);
bool is_terminal(TurnPhase phase);
// Each phase moves to the next one in order, or to Failed.
bool is_legal_transition(TurnPhase from, TurnPhase to);

struct TurnRequest {
  std::string campaign_id;
  std::string player_input;
  std::optional<int64_t> seed;
};

struct TurnResult {
  bool success = false;
  TurnPhase phase = TurnPhase::Initialized;
  TurnPhase failed_phase = TurnPhase::Initialized;  // last phase reached before failing
  int64_t turn_index = 0;                            // 0 unless persisted
  int64_t seed = 0;
  std::string narrative;
  std::vector<RollResult> roll_results;
  std::vector<TurnError> errors;
  std::vector<std::string> warnings;
  std::string state_hash;
  CampaignState state;
};

nlohmann::json to_json(const TurnResult& result);

// Seed used when the request carries none.
int64_t derive_turn_seed(const std::string& campaign_id, int64_t turn_index);

class TurnEngine;

// One turn in flight. Each step() moves one phase forward; the campaign lock
// is held from CONTEXT_BUILT until the run is terminal.
class TurnRun {
 public:
  TurnRun(TurnEngine& engine, TurnRequest request);

  // False once the run is terminal.
  bool step();
  const TurnResult& run();

  TurnPhase phase() const { return result_.phase; }
  bool finished() const { return is_terminal(result_.phase); }
  const TurnResult& result() const { return result_; }

 private:
  bool advance_to(TurnPhase next);
  void fail(std::vector<TurnError> errors);
  void fail(ErrorKind kind, const std::string& code, const std::string& message);

  void build_context();
  void receive_proposal();
  void execute_mechanics();
  void final_response();
  void validate();
  void persist();

  bool try_repair(ValidationResult& validation);
  void run_mechanics(const std::vector<RollRequest>& requests);
  std::string render_response() const;

  TurnEngine& engine_;
  TurnRequest request_;
  TurnResult result_;
  std::optional<CampaignLockRegistry::Guard> guard_;
  Campaign campaign_;
  CampaignState current_;
  CampaignState next_;
  NarrationContext context_;
  nlohmann::json payload_ = nlohmann::json::object();
  DecodedPayload decoded_;
  nlohmann::json executed_requests_ = nlohmann::json::array();
};

class TurnEngine {
 public:
  TurnEngine(const EngineConfig& config, TurnStore& store, Narrator& narrator, LoreSink& lore,
             CampaignLockRegistry& locks);

  TurnResult process_turn(const TurnRequest& request);
  TurnRun start(TurnRequest request);

  const EngineConfig& config() const { return config_; }
  StateService& states() { return states_; }
  CampaignLockRegistry& locks() { return locks_; }

 private:
  friend class TurnRun;

  const EngineConfig& config_;
  TurnStore& store_;
  Narrator& narrator_;
  LoreSink& lore_;
  CampaignLockRegistry& locks_;
  StateService states_;
  OutputValidator validator_;
  ResponseParser parser_;
};

} // namespace tale
