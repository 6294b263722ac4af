#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "session.hpp"

// Scripted sessions declared in YAML.
//
//   sessions:
//     - host: web1
//       user: deploy
//       port: 2222
//       commands:
//         - cmd: whoami
//           out: "deploy\n"
//         - cmd: uname
//           out: "Linux\n"
//           waits: 2
//     - host: db1
//       cmd: "ls /"          # single-command shorthand
//
// The top level may instead carry `commands:` (one anonymous session) or the
// shorthand keys cmd/out/err/in/exit/waits directly. An empty document means
// one default session. Giving both `commands` and shorthand keys on the same
// session is an error.

Result<std::vector<Session>> parse_scenario(const std::string& yaml_text);
Result<std::vector<Session>> load_scenario(const std::filesystem::path& path);
