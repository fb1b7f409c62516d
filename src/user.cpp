#include "user.hpp"

#include "envelope.hpp"

namespace shareflow {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsControl(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

} // namespace

std::optional<std::string> SanitizeDisplayName(std::string_view raw) {
    size_t start = 0;
    while (start < raw.size() && IsSpace(raw[start])) ++start;

    size_t end = raw.size();
    while (end > start && IsSpace(raw[end - 1])) --end;

    std::string name;
    name.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        if (!IsControl(static_cast<unsigned char>(raw[i]))) {
            name.push_back(raw[i]);
        }
    }

    if (name.empty() || Utf8Length(name) > MaxDisplayNameLength) {
        return std::nullopt;
    }
    return name;
}

void to_json(nlohmann::json& j, const User& user) {
    j = {
        {"id", user.id},
        {"name", user.name},
        {"isHost", user.isHost},
        {"joinedAt", FormatTimestamp(user.joinedAt)},
    };
}

} // namespace shareflow
