#pragma once

#include <optional>
#include <string>
#include <vector>

// Snapshots the named environment variables and restores them (including
// unsetting ones that did not exist) when destroyed.
class EnvironmentGuard {
public:
    explicit EnvironmentGuard(std::vector<std::string> names);
    ~EnvironmentGuard();

    EnvironmentGuard(const EnvironmentGuard&) = delete;
    EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;

    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);

private:
    struct Saved {
        std::string name;
        std::optional<std::string> value;
    };
    std::vector<Saved> saved_;

    void remember(const std::string& name);
};
