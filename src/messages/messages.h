#pragma once

#include "environment/state.h"
#include "knowledge/state.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier {

// ── Channels ────────────────────────────────────────────────────
namespace channel {
constexpr const char* kMonitorRequest     = "monitor.request";
constexpr const char* kMonitorResult      = "monitor.result";
constexpr const char* kAnalyzeResult      = "analyze.result";
constexpr const char* kPlanResult         = "plan.result";
constexpr const char* kExecuteResult      = "execute.result";
constexpr const char* kKnowledgeUpdate    = "knowledge.update";
constexpr const char* kKnowledgeSet       = "knowledge.set";
constexpr const char* kEnvironmentUpdate  = "environment.update";
constexpr const char* kEnvironmentMove    = "environment.move";
constexpr const char* kEnvironmentLoad    = "environment.load";
constexpr const char* kEnvironmentDeliver = "environment.deliver";
constexpr const char* kEnvironmentClear   = "environment.clear";
constexpr const char* kEnvironmentStatus  = "environment.status";
constexpr const char* kUserAddOrder       = "user.add_order";
constexpr const char* kUserToggleObstacle = "user.toggle_obstacle";
constexpr const char* kSystemInit         = "system.init";
constexpr const char* kSystemReset        = "system.reset";
} // namespace channel

// ── MAPE records ────────────────────────────────────────────────

struct ObstacleDelta {
    std::vector<Coord> added;
    std::vector<Coord> removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

// Monitor's view of one tick. All-false / zero when uninitialised.
struct Facts {
    uint64_t      seq{0};
    bool          initialized{false};
    MissionState  mission_state{MissionState::Idle};
    bool          path_blocked{false};
    ObstacleDelta obstacle_delta;
    int           pending_count{0};
    double        elapsed_since_first_pending{0.0};
    bool          robot_stuck{false};
    bool          route_viable{true};
    bool          all_delivered{false};
    bool          robot_at_base{false};
    int           capacity{0};
    double        timeout_s{0.0};
};

struct MonitorResult {
    Facts               facts;
    KnowledgeSnapshot   knowledge;
    EnvironmentSnapshot environment;
};

enum class Decision : uint8_t {
    NoAction,
    StartMission,
    Replan,
    EnterStuck,
    Resume,
    BeginReturn,
    CompleteMission,
};

const char* to_string(Decision d);
Decision    parse_decision(const std::string& s);

struct AnalyzeResult {
    uint64_t            seq{0};
    Decision            decision{Decision::NoAction};
    std::string         reason;
    KnowledgeSnapshot   knowledge;
    EnvironmentSnapshot environment;
};

// What Execute is told to do this tick.
enum class Directive : uint8_t {
    Continue,
    StartMission,
    Replan,
    BeginReturn,
    EnterStuck,
    Resume,
    Complete,
};

const char* to_string(Directive d);
Directive   parse_directive(const std::string& s);

struct PlanResult {
    uint64_t                 seq{0};
    Directive                directive{Directive::Continue};
    std::optional<Plan>      plan;
    std::vector<std::string> orders_to_load;
    std::string              reason;
};

// Field patch sent on knowledge.set.
struct PatchEnvelope {
    uint64_t       seq{0};        // tick that produced it
    uint64_t       patch_id{0};   // per-writer, monotonic
    nlohmann::json fields = nlohmann::json::object();
};

// ── JSON codec ──────────────────────────────────────────────────
// Enum fields are encoded by name; an unknown name raises ValidationError.

void to_json(nlohmann::json& j, const Coord& c);
void from_json(const nlohmann::json& j, Coord& c);

void to_json(nlohmann::json& j, const GridLayout& g);
void from_json(const nlohmann::json& j, GridLayout& g);

void to_json(nlohmann::json& j, const RobotState& r);
void from_json(const nlohmann::json& j, RobotState& r);

void to_json(nlohmann::json& j, const CommandAck& a);
void from_json(const nlohmann::json& j, CommandAck& a);

void to_json(nlohmann::json& j, const EnvironmentSnapshot& e);
void from_json(const nlohmann::json& j, EnvironmentSnapshot& e);

void to_json(nlohmann::json& j, const MissionState& s);
void from_json(const nlohmann::json& j, MissionState& s);

void to_json(nlohmann::json& j, const Order& o);
void from_json(const nlohmann::json& j, Order& o);

void to_json(nlohmann::json& j, const PathStep& p);
void from_json(const nlohmann::json& j, PathStep& p);

void to_json(nlohmann::json& j, const Plan& p);
void from_json(const nlohmann::json& j, Plan& p);

void to_json(nlohmann::json& j, const Metrics& m);
void from_json(const nlohmann::json& j, Metrics& m);

void to_json(nlohmann::json& j, const KnowledgeSnapshot& k);
void from_json(const nlohmann::json& j, KnowledgeSnapshot& k);

void to_json(nlohmann::json& j, const ObstacleDelta& d);
void from_json(const nlohmann::json& j, ObstacleDelta& d);

void to_json(nlohmann::json& j, const Facts& f);
void from_json(const nlohmann::json& j, Facts& f);

void to_json(nlohmann::json& j, const MonitorResult& r);
void from_json(const nlohmann::json& j, MonitorResult& r);

void to_json(nlohmann::json& j, const AnalyzeResult& r);
void from_json(const nlohmann::json& j, AnalyzeResult& r);

void to_json(nlohmann::json& j, const PlanResult& r);
void from_json(const nlohmann::json& j, PlanResult& r);

void to_json(nlohmann::json& j, const PatchEnvelope& p);
void from_json(const nlohmann::json& j, PatchEnvelope& p);

} // namespace courier
