#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>

static std::string env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return "";
    std::string v(raw);
    auto start = v.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    v = v.substr(start, v.find_last_not_of(" \t\r\n") - start + 1);
    return v;
}

bool sshfake_log_enabled() {
    std::string v = env_value(LOG_ENABLE_ENV);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string sshfake_log_path() {
    std::string custom = env_value(LOG_PATH_ENV);
    if (!custom.empty()) return custom;
    return (platform::temp_dir() / LOG_FILE_NAME).string();
}

void sshfake_log(const std::string& msg) {
    if (!sshfake_log_enabled()) return;

    std::ofstream out(sshfake_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void sshfake_log_exec(const std::string& label, const std::string& cmd,
                      const ExecResult& r) {
    if (!sshfake_log_enabled()) return;
    sshfake_log(fmt::format("{} CMD: {}", label, cmd));
    sshfake_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, LOG_PREVIEW_CHARS)));
    if (!r.stderr_data.empty())
        sshfake_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_PREVIEW_CHARS)));
}
