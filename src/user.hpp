#pragma once

#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace shareflow {

constexpr size_t MaxDisplayNameLength = 50;

struct User {
    ClientId id;
    std::string name;
    bool isHost = false;
    TimePoint joinedAt;
};

// Trims surrounding whitespace and drops control characters. Returns nullopt
// when the result is empty or longer than MaxDisplayNameLength code points.
std::optional<std::string> SanitizeDisplayName(std::string_view raw);

void to_json(nlohmann::json& j, const User& user);

} // namespace shareflow
