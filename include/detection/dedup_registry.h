#pragma once
/**
 * @file dedup_registry.h
 * @brief At-most-once bookkeeping for reported log entries
 */

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace log_watchdog::detect {

/// Key used for headers that leave nothing after normalization.
inline constexpr const char* kNoKey = "nokey";

/**
 * @brief Key from a "Day N, HH:MM:SS" timestamp anywhere in @p text
 *
 * Case-insensitive; ':' or ';' separate time fields and ',' or ';' follow
 * the day. Result format: "d<day>-t<HHMMSS>".
 *
 * @return Key, or nullopt if no timestamp is legible
 */
std::optional<std::string> headerKeyFromText(const std::string& text);

/**
 * @brief Key from raw header text
 *
 * Lowercased, everything outside [a-z0-9:;] removed, truncated to 64 chars.
 * An empty result maps to kNoKey.
 */
std::string headerKeyFromLine(const std::string& headerText);

/**
 * @brief Preferred timestamp key from the resolved text, else header key
 */
std::string canonicalKey(const std::string& resolvedText, const std::string& fallbackHeaderText);

/**
 * @brief Hex content hash of trimmed text (content dedup mode)
 */
std::string contentKey(const std::string& text);

/**
 * @brief Keys already reported during this watch run
 *
 * Keys are never evicted: a log line is shown once and reported once.
 */
class DedupRegistry {
public:
    DedupRegistry() = default;

    bool seen(const std::string& key) const { return m_keys.count(key) != 0; }
    void mark(const std::string& key) { m_keys.insert(key); }

    size_t size() const { return m_keys.size(); }
    void clear() { m_keys.clear(); }

private:
    std::unordered_set<std::string> m_keys;
};

/**
 * @brief Small time-to-live set for content dedup
 *
 * Expired keys are dropped lazily on lookup; when over capacity the oldest
 * insertion is dropped.
 */
class TtlSet {
public:
    using Clock = std::chrono::steady_clock;

    explicit TtlSet(int ttlSeconds = 60, size_t maxEntries = 512);

    void add(const std::string& key) { add(key, Clock::now()); }
    void add(const std::string& key, Clock::time_point now);

    bool contains(const std::string& key) { return contains(key, Clock::now()); }
    bool contains(const std::string& key, Clock::time_point now);

    size_t size() const { return m_entries.size(); }

private:
    std::chrono::seconds m_ttl;
    size_t m_maxEntries;
    std::deque<std::pair<std::string, Clock::time_point>> m_entries;  // (key, expiresAt)
};

} // namespace log_watchdog::detect
