#include "environment_guard.hpp"
#include <algorithm>
#include <cstdlib>

#ifdef _WIN32
static void set_env(const std::string& name, const std::string& value) {
    _putenv_s(name.c_str(), value.c_str());
}
static void unset_env(const std::string& name) {
    _putenv_s(name.c_str(), "");
}
#else
static void set_env(const std::string& name, const std::string& value) {
    setenv(name.c_str(), value.c_str(), 1);
}
static void unset_env(const std::string& name) {
    unsetenv(name.c_str());
}
#endif

EnvironmentGuard::EnvironmentGuard(std::vector<std::string> names) {
    for (const auto& name : names) remember(name);
}

EnvironmentGuard::~EnvironmentGuard() {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        if (it->value) set_env(it->name, *it->value);
        else unset_env(it->name);
    }
}

void EnvironmentGuard::remember(const std::string& name) {
    bool known = std::any_of(saved_.begin(), saved_.end(),
                             [&](const Saved& s) { return s.name == name; });
    if (known) return;
    const char* raw = std::getenv(name.c_str());
    saved_.push_back(Saved{name, raw ? std::optional<std::string>(raw) : std::nullopt});
}

void EnvironmentGuard::set(const std::string& name, const std::string& value) {
    remember(name);
    set_env(name, value);
}

void EnvironmentGuard::unset(const std::string& name) {
    remember(name);
    unset_env(name);
}
