#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct Call {
    std::string name;
    std::vector<std::string> args;

    bool operator==(const Call& other) const {
        return name == other.name && args == other.args;
    }
};

// Render a call as name("arg", "arg") for failure messages.
std::string describe_call(const Call& call);

// Ordered record of every call made against a fake.
class CallLog {
public:
    void record(const std::string& name, std::vector<std::string> args = {});

    std::size_t count(const std::string& name) const;
    std::vector<Call> calls(const std::string& name) const;
    std::optional<Call> last(const std::string& name) const;

    const std::vector<Call>& all() const { return calls_; }

private:
    std::vector<Call> calls_;
};
