#pragma once
/**
 * @file message.hpp
 * @brief Handoff message record and priority levels.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ctxhub::coord
{

/// Declaration order is inbox order: urgent first.
enum class Priority
{
    Urgent = 0,
    High = 1,
    Normal = 2,
    Low = 3
};

const char *to_string(Priority p) noexcept;
/// nullopt for anything other than low/normal/high/urgent.
std::optional<Priority> parse_priority(std::string_view s) noexcept;

struct Message
{
    uint64_t id{0};
    std::string from;
    std::string to; ///< A context id or "all"
    std::string type{"info"};
    std::string subject;
    std::string content;
    Priority priority{Priority::Normal};
    std::string created_at;
    std::optional<std::string> read_at;

    [[nodiscard]] bool is_read() const noexcept { return read_at.has_value(); }

    nlohmann::json to_json() const;

    /**
     * @brief Decodes one log entry.
     * @details Unknown priorities rank as normal. An entry that is not an object
     *          or has no numeric id yields nullopt.
     */
    static std::optional<Message> from_json(const nlohmann::json &j);
};

/// Priority first (urgent..low), then created_at ascending, then id.
void sort_for_inbox(std::vector<Message> &messages);

} // namespace ctxhub::coord
