#include "call_log.hpp"
#include <algorithm>
#include <fmt/format.h>

std::string describe_call(const Call& call) {
    std::string args;
    for (std::size_t i = 0; i < call.args.size(); i++) {
        if (i > 0) args += ", ";
        args += fmt::format("{:?}", call.args[i]);
    }
    return call.name + "(" + args + ")";
}

void CallLog::record(const std::string& name, std::vector<std::string> args) {
    calls_.push_back(Call{name, std::move(args)});
}

std::size_t CallLog::count(const std::string& name) const {
    return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
        [&](const Call& c) { return c.name == name; }));
}

std::vector<Call> CallLog::calls(const std::string& name) const {
    std::vector<Call> out;
    for (const auto& c : calls_) {
        if (c.name == name) out.push_back(c);
    }
    return out;
}

std::optional<Call> CallLog::last(const std::string& name) const {
    for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
        if (it->name == name) return *it;
    }
    return std::nullopt;
}
