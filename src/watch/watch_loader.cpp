#include "watch_loader.hpp"
#include "metric_source.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace watch {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static MetricVariable parse_variable(const std::string& s) {
    for (std::size_t i = 0; i < metric_variable_count(); ++i) {
        const auto v = static_cast<MetricVariable>(i);
        if (s == variable_name(v)) return v;
    }
    throw std::runtime_error("WatchLoader: unknown variable '" + s + "'");
}

static Comparator parse_comparator(const std::string& s) {
    if (s == "<")  return Comparator::LessThan;
    if (s == "<=") return Comparator::LessOrEqual;
    if (s == "==") return Comparator::Equal;
    if (s == ">=") return Comparator::GreaterOrEqual;
    if (s == ">")  return Comparator::GreaterThan;
    throw std::runtime_error("WatchLoader: unknown comparator '" + s + "'");
}

static CombinationPolicy parse_policy(const std::string& s) {
    if (s == "All") return CombinationPolicy::AllMustMatch;
    if (s == "Any") return CombinationPolicy::AnyMayMatch;
    throw std::runtime_error("WatchLoader: unknown policy '" + s + "'");
}

static MessageSeverity parse_severity(const std::string& s) {
    if (s == "Log")     return MessageSeverity::Log;
    if (s == "Warning") return MessageSeverity::Warning;
    if (s == "Error")   return MessageSeverity::Error;
    throw std::runtime_error("WatchLoader: unknown message type '" + s + "'");
}

static Condition parse_condition(const json& c) {
    Condition cond;
    cond.variable   = parse_variable(c.at("variable").get<std::string>());
    cond.comparator = parse_comparator(c.at("comparator").get<std::string>());
    cond.threshold  = c.at("value").get<float>();
    return cond;
}

static WatchPacket parse_packet(const json& p, const WatchLoader::HookResolver& hooks) {
    WatchPacket packet;
    packet.id            = p.value("id",            packet.id);
    packet.active        = p.value("active",        packet.active);
    packet.execute_once  = p.value("execute_once",  packet.execute_once);
    packet.init_delay    = p.value("init_delay",    packet.init_delay);
    packet.recheck_delay = p.value("recheck_delay", packet.recheck_delay);

    if (p.contains("policy"))
        packet.policy = parse_policy(p["policy"].get<std::string>());

    if (p.contains("conditions")) {
        for (const auto& c : p["conditions"]) packet.conditions.push_back(parse_condition(c));
    }

    ActionSet& a = packet.actions;
    if (p.contains("message_type"))
        a.severity = parse_severity(p["message_type"].get<std::string>());
    a.message            = p.value("message",         a.message);
    a.capture_screenshot = p.value("screenshot",      a.capture_screenshot);
    a.screenshot_name    = p.value("screenshot_name", a.screenshot_name);
    a.break_execution    = p.value("break",           a.break_execution);

    if (p.contains("hooks")) {
        for (const auto& h : p["hooks"]) {
            const std::string name = h.get<std::string>();
            EventHook hook = hooks ? hooks(name) : EventHook{};
            if (!hook) throw std::runtime_error("WatchLoader: unknown hook '" + name + "'");
            a.event_hooks.push_back(std::move(hook));
        }
    }

    if (packet.init_delay < 0.0f || packet.recheck_delay < 0.0f)
        throw std::runtime_error("WatchLoader: packet " + std::to_string(packet.id) +
                                 " has a negative delay");
    return packet;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool WatchLoader::load_from_string(DebugEngine& engine, const std::string& json_str,
                                   const HookResolver& hooks, std::string* error) {
    try {
        json doc = json::parse(json_str);

        std::vector<WatchPacket> packets;
        for (const auto& packet_json : doc.at("packets")) {
            packets.push_back(parse_packet(packet_json, hooks));
        }

        if (doc.contains("message_prefix"))
            engine.set_message_prefix(doc["message_prefix"].get<std::string>());
        for (auto& packet : packets) engine.add(std::move(packet));
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool WatchLoader::load(DebugEngine& engine, const std::string& path,
                       const HookResolver& hooks, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "WatchLoader: cannot open '" + path + "'";
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(engine, content, hooks, error);
}

} // namespace watch
