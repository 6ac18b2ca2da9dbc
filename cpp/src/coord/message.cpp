/**
 * @file message.cpp
 * @brief Message JSON mapping and inbox ordering.
 */
#include "message.hpp"

#include <algorithm>
#include <tuple>

namespace ctxhub::coord
{

const char *to_string(Priority p) noexcept
{
    switch (p)
    {
    case Priority::Urgent:
        return "urgent";
    case Priority::High:
        return "high";
    case Priority::Normal:
        return "normal";
    case Priority::Low:
        return "low";
    }
    return "normal";
}

std::optional<Priority> parse_priority(std::string_view s) noexcept
{
    if (s == "urgent")
        return Priority::Urgent;
    if (s == "high")
        return Priority::High;
    if (s == "normal")
        return Priority::Normal;
    if (s == "low")
        return Priority::Low;
    return std::nullopt;
}

nlohmann::json Message::to_json() const
{
    return {{"id", id},
            {"from", from},
            {"to", to},
            {"type", type},
            {"subject", subject},
            {"content", content},
            {"priority", to_string(priority)},
            {"created_at", created_at},
            {"read_at", read_at ? nlohmann::json(*read_at) : nlohmann::json(nullptr)}};
}

std::optional<Message> Message::from_json(const nlohmann::json &j)
{
    if (!j.is_object() || !j.contains("id") || !j["id"].is_number_unsigned())
        return std::nullopt;

    auto str = [&j](const char *key) -> std::string
    {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
    };

    Message m;
    m.id = j["id"].get<uint64_t>();
    m.from = str("from");
    m.to = str("to");
    m.type = str("type");
    m.subject = str("subject");
    m.content = str("content");
    m.priority = parse_priority(str("priority")).value_or(Priority::Normal);
    m.created_at = str("created_at");
    if (j.contains("read_at") && j["read_at"].is_string())
        m.read_at = j["read_at"].get<std::string>();
    return m;
}

void sort_for_inbox(std::vector<Message> &messages)
{
    std::sort(messages.begin(), messages.end(),
              [](const Message &a, const Message &b)
              {
                  return std::tie(a.priority, a.created_at, a.id) <
                         std::tie(b.priority, b.created_at, b.id);
              });
}

} // namespace ctxhub::coord
