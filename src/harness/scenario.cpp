#include "scenario.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static std::optional<std::string> opt_string(const YAML::Node& node, const char* key) {
    if (node[key] && node[key].IsScalar()) return node[key].as<std::string>();
    return std::nullopt;
}

static std::optional<int> opt_int(const YAML::Node& node, const char* key) {
    if (node[key] && node[key].IsScalar()) return node[key].as<int>();
    return std::nullopt;
}

static Command parse_command(const YAML::Node& node) {
    Command c;
    c.cmd = opt_string(node, "cmd");
    c.in = opt_string(node, "in");
    if (auto out = opt_string(node, "out")) c.out = *out;
    if (auto err = opt_string(node, "err")) c.err = *err;
    if (auto exit = opt_int(node, "exit")) c.exit = *exit;
    if (auto waits = opt_int(node, "waits")) c.waits = *waits;
    return c;
}

static SessionSpec parse_session_spec(const YAML::Node& node) {
    SessionSpec spec;
    spec.target.host = opt_string(node, "host");
    spec.target.user = opt_string(node, "user");
    spec.target.port = opt_int(node, "port");

    if (node["commands"] && node["commands"].IsSequence()) {
        for (const auto& cmd : node["commands"]) {
            spec.commands.push_back(parse_command(cmd));
        }
    }

    spec.cmd = opt_string(node, "cmd");
    spec.out = opt_string(node, "out");
    spec.err = opt_string(node, "err");
    spec.in = opt_string(node, "in");
    spec.exit = opt_int(node, "exit");
    spec.waits = opt_int(node, "waits");
    return spec;
}

Result<std::vector<Session>> parse_scenario(const std::string& yaml_text) {
    using R = Result<std::vector<Session>>;

    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return R::Err(fmt::format("Invalid scenario YAML: {}", e.what()));
    }

    std::vector<Session> sessions;
    if (!root || root.IsNull()) {
        sessions.push_back(Session());
        return R::Ok(std::move(sessions));
    }
    if (!root.IsMap()) {
        return R::Err("Scenario must be a mapping at the top level");
    }

    try {
        if (root["sessions"]) {
            if (root["commands"] || parse_session_spec(root).has_shorthand()) {
                return R::Err("Scenario can't combine 'sessions' with top-level commands");
            }
            if (!root["sessions"].IsSequence()) {
                return R::Err("'sessions' must be a list");
            }
            int index = 0;
            for (const auto& node : root["sessions"]) {
                index++;
                if (!node.IsMap()) {
                    return R::Err(fmt::format("session {}: must be a mapping", index));
                }
                auto session = Session::from_spec(parse_session_spec(node));
                if (session.is_err()) {
                    return R::Err(fmt::format("session {}: {}", index, session.error));
                }
                sessions.push_back(std::move(session.value));
            }
        } else {
            auto session = Session::from_spec(parse_session_spec(root));
            if (session.is_err()) return R::Err(session.error);
            sessions.push_back(std::move(session.value));
        }
    } catch (const YAML::Exception& e) {
        return R::Err(fmt::format("Invalid scenario value: {}", e.what()));
    }

    if (sessions.empty()) sessions.push_back(Session());
    sshfake_log(fmt::format("Scenario: parsed {} session(s)", sessions.size()));
    return R::Ok(std::move(sessions));
}

Result<std::vector<Session>> load_scenario(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<std::vector<Session>>::Err("Cannot read scenario file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_scenario(buffer.str());
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}
