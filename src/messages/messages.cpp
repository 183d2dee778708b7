#include "messages/messages.h"

#include "errors/errors.h"

namespace courier {

using nlohmann::json;

const char* to_string(Decision d) {
    switch (d) {
    case Decision::NoAction:        return "no_action";
    case Decision::StartMission:    return "start_mission";
    case Decision::Replan:          return "replan";
    case Decision::EnterStuck:      return "enter_stuck";
    case Decision::Resume:          return "resume";
    case Decision::BeginReturn:     return "begin_return";
    case Decision::CompleteMission: return "complete_mission";
    }
    return "unknown";
}

Decision parse_decision(const std::string& s) {
    if (s == "no_action")        return Decision::NoAction;
    if (s == "start_mission")    return Decision::StartMission;
    if (s == "replan")           return Decision::Replan;
    if (s == "enter_stuck")      return Decision::EnterStuck;
    if (s == "resume")           return Decision::Resume;
    if (s == "begin_return")     return Decision::BeginReturn;
    if (s == "complete_mission") return Decision::CompleteMission;
    throw ValidationError("unknown decision '" + s + "'");
}

const char* to_string(Directive d) {
    switch (d) {
    case Directive::Continue:     return "continue";
    case Directive::StartMission: return "start_mission";
    case Directive::Replan:       return "replan";
    case Directive::BeginReturn:  return "begin_return";
    case Directive::EnterStuck:   return "enter_stuck";
    case Directive::Resume:       return "resume";
    case Directive::Complete:     return "complete";
    }
    return "unknown";
}

Directive parse_directive(const std::string& s) {
    if (s == "continue")      return Directive::Continue;
    if (s == "start_mission") return Directive::StartMission;
    if (s == "replan")        return Directive::Replan;
    if (s == "begin_return")  return Directive::BeginReturn;
    if (s == "enter_stuck")   return Directive::EnterStuck;
    if (s == "resume")        return Directive::Resume;
    if (s == "complete")      return Directive::Complete;
    throw ValidationError("unknown directive '" + s + "'");
}

// ── Grid / robot ────────────────────────────────────────────────

void to_json(json& j, const Coord& c) { j = json{{"x", c.x}, {"y", c.y}}; }

void from_json(const json& j, Coord& c) {
    j.at("x").get_to(c.x);
    j.at("y").get_to(c.y);
}

void to_json(json& j, const GridLayout& g) {
    j = json{
        {"width", g.width},
        {"height", g.height},
        {"base", g.base},
        {"houses", g.houses},
        {"static_obstacles", g.static_obstacles},
    };
}

void from_json(const json& j, GridLayout& g) {
    j.at("width").get_to(g.width);
    j.at("height").get_to(g.height);
    j.at("base").get_to(g.base);
    j.at("houses").get_to(g.houses);
    j.at("static_obstacles").get_to(g.static_obstacles);
}

void to_json(json& j, const RobotState& r) {
    j = json{
        {"position", r.position},
        {"cargo", r.cargo},
        {"capacity", r.capacity},
        {"status", to_string(r.status)},
    };
}

void from_json(const json& j, RobotState& r) {
    j.at("position").get_to(r.position);
    j.at("cargo").get_to(r.cargo);
    j.at("capacity").get_to(r.capacity);
    r.status = parse_robot_status(j.at("status").get<std::string>());
}

void to_json(json& j, const CommandAck& a) {
    j = json{{"intent", a.intent}, {"command", a.command}, {"ok", a.ok}, {"error", a.error}};
}

void from_json(const json& j, CommandAck& a) {
    a.intent  = j.value("intent", uint64_t{0});
    a.command = j.value("command", std::string{});
    a.ok      = j.value("ok", true);
    a.error   = j.value("error", std::string{});
}

void to_json(json& j, const EnvironmentSnapshot& e) {
    j = json{
        {"version", e.version},
        {"sample_seq", e.sample_seq},
        {"initialized", e.initialized},
        {"layout", e.layout},
        {"dynamic_obstacles", e.dynamic_obstacles},
        {"robot", e.robot},
        {"last_ack", e.last_ack},
    };
}

void from_json(const json& j, EnvironmentSnapshot& e) {
    j.at("version").get_to(e.version);
    e.sample_seq  = j.value("sample_seq", uint64_t{0});
    j.at("initialized").get_to(e.initialized);
    if (!e.initialized) return;
    j.at("layout").get_to(e.layout);
    j.at("dynamic_obstacles").get_to(e.dynamic_obstacles);
    j.at("robot").get_to(e.robot);
    if (j.contains("last_ack")) j.at("last_ack").get_to(e.last_ack);
}

// ── Knowledge ───────────────────────────────────────────────────

void to_json(json& j, const MissionState& s) { j = to_string(s); }

void from_json(const json& j, MissionState& s) {
    s = parse_mission_state(j.get<std::string>());
}

void to_json(json& j, const Order& o) {
    j = json{
        {"id", o.id},
        {"destination", o.destination},
        {"status", to_string(o.status)},
        {"created_at", o.created_at},
        {"delivered_at", o.delivered_at},
    };
}

void from_json(const json& j, Order& o) {
    j.at("id").get_to(o.id);
    j.at("destination").get_to(o.destination);
    o.status       = parse_order_status(j.at("status").get<std::string>());
    j.at("created_at").get_to(o.created_at);
    o.delivered_at = j.value("delivered_at", 0.0);
}

void to_json(json& j, const PathStep& p) {
    j = json{{"x", p.cell.x}, {"y", p.cell.y}, {"leg", to_string(p.leg)}};
}

void from_json(const json& j, PathStep& p) {
    j.at("x").get_to(p.cell.x);
    j.at("y").get_to(p.cell.y);
    p.leg = parse_leg_kind(j.at("leg").get<std::string>());
}

void to_json(json& j, const Plan& p) {
    j = json{
        {"sequence", p.sequence},
        {"destinations", p.destinations},
        {"path", p.path},
        {"cost", p.cost},
        {"computed_at", p.computed_at},
    };
}

void from_json(const json& j, Plan& p) {
    j.at("sequence").get_to(p.sequence);
    j.at("destinations").get_to(p.destinations);
    j.at("path").get_to(p.path);
    j.at("cost").get_to(p.cost);
    j.at("computed_at").get_to(p.computed_at);
    if (p.sequence.size() != p.destinations.size()) {
        throw ValidationError("plan sequence and destinations differ in length");
    }
}

void to_json(json& j, const Metrics& m) {
    j = json{
        {"total_deliveries", m.total_deliveries},
        {"total_distance", m.total_distance},
        {"replan_count", m.replan_count},
        {"average_delivery_time_s", m.average_delivery_time_s},
    };
}

void from_json(const json& j, Metrics& m) {
    j.at("total_deliveries").get_to(m.total_deliveries);
    j.at("total_distance").get_to(m.total_distance);
    j.at("replan_count").get_to(m.replan_count);
    j.at("average_delivery_time_s").get_to(m.average_delivery_time_s);
}

void to_json(json& j, const KnowledgeSnapshot& k) {
    j = json{
        {"version", k.version},
        {"sample_seq", k.sample_seq},
        {"applied_patch", k.applied_patch},
        {"initialized", k.initialized},
        {"base", k.base},
        {"capacity", k.capacity},
        {"mission_timeout_s", k.mission_timeout_s},
        {"orders", k.orders},
        {"carried", k.carried},
        {"mission_state", k.mission_state},
        {"resume_state", k.resume_state},
        {"plan", k.plan ? json(*k.plan) : json(nullptr)},
        {"plan_index", k.plan_index},
        {"mission_started_at", k.mission_started_at},
        {"metrics", k.metrics},
    };
}

void from_json(const json& j, KnowledgeSnapshot& k) {
    j.at("version").get_to(k.version);
    k.sample_seq    = j.value("sample_seq", uint64_t{0});
    k.applied_patch = j.value("applied_patch", uint64_t{0});
    j.at("initialized").get_to(k.initialized);
    j.at("base").get_to(k.base);
    j.at("capacity").get_to(k.capacity);
    j.at("mission_timeout_s").get_to(k.mission_timeout_s);
    j.at("orders").get_to(k.orders);
    j.at("carried").get_to(k.carried);
    j.at("mission_state").get_to(k.mission_state);
    j.at("resume_state").get_to(k.resume_state);
    const auto& plan = j.at("plan");
    if (plan.is_null()) {
        k.plan.reset();
    } else {
        k.plan = plan.get<Plan>();
    }
    j.at("plan_index").get_to(k.plan_index);
    j.at("mission_started_at").get_to(k.mission_started_at);
    j.at("metrics").get_to(k.metrics);
}

// ── MAPE records ────────────────────────────────────────────────

void to_json(json& j, const ObstacleDelta& d) {
    j = json{{"added", d.added}, {"removed", d.removed}};
}

void from_json(const json& j, ObstacleDelta& d) {
    j.at("added").get_to(d.added);
    j.at("removed").get_to(d.removed);
}

void to_json(json& j, const Facts& f) {
    j = json{
        {"seq", f.seq},
        {"initialized", f.initialized},
        {"mission_state", f.mission_state},
        {"path_blocked", f.path_blocked},
        {"obstacle_delta", f.obstacle_delta},
        {"pending_count", f.pending_count},
        {"elapsed_since_first_pending", f.elapsed_since_first_pending},
        {"robot_stuck", f.robot_stuck},
        {"route_viable", f.route_viable},
        {"all_delivered", f.all_delivered},
        {"robot_at_base", f.robot_at_base},
        {"capacity", f.capacity},
        {"timeout_s", f.timeout_s},
    };
}

void from_json(const json& j, Facts& f) {
    j.at("seq").get_to(f.seq);
    j.at("initialized").get_to(f.initialized);
    j.at("mission_state").get_to(f.mission_state);
    j.at("path_blocked").get_to(f.path_blocked);
    j.at("obstacle_delta").get_to(f.obstacle_delta);
    j.at("pending_count").get_to(f.pending_count);
    j.at("elapsed_since_first_pending").get_to(f.elapsed_since_first_pending);
    j.at("robot_stuck").get_to(f.robot_stuck);
    j.at("route_viable").get_to(f.route_viable);
    j.at("all_delivered").get_to(f.all_delivered);
    j.at("robot_at_base").get_to(f.robot_at_base);
    j.at("capacity").get_to(f.capacity);
    j.at("timeout_s").get_to(f.timeout_s);
}

void to_json(json& j, const MonitorResult& r) {
    j = json{{"facts", r.facts}, {"knowledge", r.knowledge}, {"environment", r.environment}};
}

void from_json(const json& j, MonitorResult& r) {
    j.at("facts").get_to(r.facts);
    j.at("knowledge").get_to(r.knowledge);
    j.at("environment").get_to(r.environment);
}

void to_json(json& j, const AnalyzeResult& r) {
    j = json{
        {"seq", r.seq},
        {"decision", to_string(r.decision)},
        {"reason", r.reason},
        {"knowledge", r.knowledge},
        {"environment", r.environment},
    };
}

void from_json(const json& j, AnalyzeResult& r) {
    j.at("seq").get_to(r.seq);
    r.decision = parse_decision(j.at("decision").get<std::string>());
    r.reason   = j.value("reason", std::string{});
    j.at("knowledge").get_to(r.knowledge);
    j.at("environment").get_to(r.environment);
}

void to_json(json& j, const PlanResult& r) {
    j = json{
        {"seq", r.seq},
        {"directive", to_string(r.directive)},
        {"plan", r.plan ? json(*r.plan) : json(nullptr)},
        {"orders_to_load", r.orders_to_load},
        {"reason", r.reason},
    };
}

void from_json(const json& j, PlanResult& r) {
    j.at("seq").get_to(r.seq);
    r.directive = parse_directive(j.at("directive").get<std::string>());
    const auto& plan = j.at("plan");
    if (plan.is_null()) {
        r.plan.reset();
    } else {
        r.plan = plan.get<Plan>();
    }
    r.orders_to_load = j.value("orders_to_load", std::vector<std::string>{});
    r.reason         = j.value("reason", std::string{});
}

void to_json(json& j, const PatchEnvelope& p) {
    j = json{{"seq", p.seq}, {"patch_id", p.patch_id}, {"fields", p.fields}};
}

void from_json(const json& j, PatchEnvelope& p) {
    p.seq      = j.value("seq", uint64_t{0});
    p.patch_id = j.value("patch_id", uint64_t{0});
    p.fields   = j.at("fields");
}

} // namespace courier
