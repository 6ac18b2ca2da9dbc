/**
 * @file message_store.cpp
 * @brief FileMessageStore and the retention rule.
 */
#include "message_store.hpp"

#include "ctxhub_service.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <numeric>
#include <regex>

namespace ctxhub::coord
{
namespace fs = std::filesystem;

namespace
{
void set_code(std::error_code *err_code, std::error_code value)
{
    if (err_code != nullptr)
    {
        *err_code = value;
    }
}

std::error_code corrupt_code()
{
    return std::make_error_code(std::errc::illegal_byte_sequence);
}

uint64_t entry_id(const nlohmann::json &e)
{
    if (e.is_object() && e.contains("id") && e["id"].is_number_unsigned())
        return e["id"].get<uint64_t>();
    return 0;
}

bool entry_is_read(const nlohmann::json &e)
{
    return !e.is_object() || (e.contains("read_at") && e["read_at"].is_string());
}

// Highest `"id": N` that still appears in an unparsable log.
uint64_t scan_highest_id(const fs::path &file)
{
    std::ifstream in(file);
    if (!in)
        return 0;
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    static const std::regex kIdField(R"re("id"\s*:\s*([0-9]{1,19}))re");
    uint64_t highest = 0;
    for (std::sregex_iterator it(text.begin(), text.end(), kIdField), end; it != end; ++it)
        highest = std::max<uint64_t>(highest, std::stoull((*it)[1].str()));
    return highest;
}
} // namespace

size_t apply_retention(nlohmann::json &log, size_t max_messages)
{
    if (max_messages == 0 || !log.is_array() || log.size() <= max_messages)
        return 0;

    const size_t excess = log.size() - max_messages;
    std::vector<size_t> order(log.size());
    std::iota(order.begin(), order.end(), size_t{0});
    // Read before unread, each group oldest first.
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b)
                     {
                         const bool ra = entry_is_read(log[a]);
                         const bool rb = entry_is_read(log[b]);
                         if (ra != rb)
                             return ra;
                         return entry_id(log[a]) < entry_id(log[b]);
                     });

    std::vector<bool> drop(log.size(), false);
    for (size_t i = 0; i < excess; ++i)
        drop[order[i]] = true;

    nlohmann::json kept = nlohmann::json::array();
    for (size_t i = 0; i < log.size(); ++i)
    {
        if (!drop[i])
            kept.push_back(std::move(log[i]));
    }
    log = std::move(kept);
    return excess;
}

FileMessageStore::FileMessageStore(std::filesystem::path log_file, size_t max_messages)
    : m_store(std::move(log_file)), m_max_messages(max_messages)
{
}

bool FileMessageStore::quarantine_corrupt_log()
{
    const uint64_t highest = scan_highest_id(path());
    const fs::path aside =
        fs::path(path().string() + ".corrupt-" + std::to_string(platform::get_pid()) + "-" +
                 std::to_string(platform::monotonic_time_ns()));
    std::error_code ec;
    fs::rename(path(), aside, ec);
    if (ec)
    {
        LOGGER_ERROR("[mailbox] cannot move corrupt log '{}' aside: {}", path().string(),
                     ec.message());
        return false;
    }
    LOGGER_ERROR("[mailbox] message log '{}' was corrupt; moved to '{}', starting a new log",
                 path().string(), aside.string());
    m_id_floor = std::max(m_id_floor, highest);
    return true;
}

std::optional<Message> FileMessageStore::append(Message draft, std::error_code *err_code)
{
    std::optional<Message> stored;
    bool not_an_array = false;

    auto mutator = [&](nlohmann::json &doc)
    {
        if (!doc.is_array())
        {
            not_an_array = true;
            return false;
        }
        uint64_t max_id = m_id_floor;
        for (const auto &e : doc)
            max_id = std::max(max_id, entry_id(e));

        Message m = draft;
        m.id = max_id + 1;
        if (m.created_at.empty())
            m.created_at = format_tools::iso_timestamp(std::chrono::system_clock::now());
        doc.push_back(m.to_json());

        const size_t dropped = apply_retention(doc, m_max_messages);
        if (dropped > 0)
            LOGGER_INFO("[mailbox] retention dropped {} old message(s)", dropped);
        stored = std::move(m);
        return true;
    };

    for (int attempt = 0; attempt < 2; ++attempt)
    {
        std::error_code ec;
        not_an_array = false;
        stored.reset();
        const bool ok = m_store.with_json_write(nlohmann::json::array(), mutator, &ec);
        if (ok)
        {
            set_code(err_code, {});
            return stored;
        }
        const bool corrupt = not_an_array || ec == corrupt_code();
        if (!corrupt || attempt > 0 || !quarantine_corrupt_log())
        {
            set_code(err_code, corrupt ? corrupt_code() : ec);
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::vector<Message> FileMessageStore::all(std::error_code *err_code) const
{
    std::error_code ec;
    const nlohmann::json doc = m_store.read_or(nlohmann::json::array(), &ec);
    std::vector<Message> out;
    if (ec)
    {
        set_code(err_code, ec);
        return out;
    }
    if (!doc.is_array())
    {
        set_code(err_code, corrupt_code());
        LOGGER_ERROR("[mailbox] message log '{}' is not a JSON array; treating it as empty",
                     path().string());
        return out;
    }

    out.reserve(doc.size());
    for (const auto &e : doc)
    {
        auto m = Message::from_json(e);
        if (!m)
        {
            LOGGER_WARN("[mailbox] skipping malformed entry in '{}'", path().string());
            continue;
        }
        out.push_back(std::move(*m));
    }
    set_code(err_code, {});
    return out;
}

std::vector<Message> FileMessageStore::inbox(std::string_view context, bool unread_only,
                                             std::error_code *err_code) const
{
    std::vector<Message> out;
    for (auto &m : all(err_code))
    {
        if (m.to != context && m.to != "all")
            continue;
        if (unread_only && m.is_read())
            continue;
        out.push_back(std::move(m));
    }
    sort_for_inbox(out);
    return out;
}

bool FileMessageStore::mark_read(uint64_t id, std::error_code *err_code)
{
    bool changed = false;
    std::error_code ec;
    m_store.with_json_write(
        nlohmann::json::array(),
        [&](nlohmann::json &doc)
        {
            if (!doc.is_array())
                return false;
            for (auto &e : doc)
            {
                if (entry_id(e) != id)
                    continue;
                if (e.contains("read_at") && e["read_at"].is_string())
                    return false;
                e["read_at"] = format_tools::iso_timestamp(std::chrono::system_clock::now());
                changed = true;
                return true;
            }
            return false;
        },
        &ec);
    set_code(err_code, ec);
    if (changed && !ec)
        LOGGER_DEBUG("[mailbox] message {} marked read", id);
    return changed && !ec;
}

} // namespace ctxhub::coord
