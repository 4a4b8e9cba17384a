#pragma once
/**
 * @file trigger_resolver.h
 * @brief Ordered trigger evaluation against entry text
 */

#include "types.h"

#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace log_watchdog::detect {

struct KeywordRule {
    std::string keyword;    ///< Case-insensitive substring
};

struct RegexRule {
    std::string pattern;    ///< Pattern as configured
    std::regex re;          ///< Compiled case-insensitive
};

using TriggerRule = std::variant<KeywordRule, RegexRule>;

/**
 * @brief Trigger with its rule resolved at load time
 */
struct Trigger {
    std::string name;
    TriggerRule rule;
    MentionMode mentionMode = MentionMode::NONE;
    std::string mentionCustom;
    std::string prefix;
    std::string suffix;

    const std::string& pattern() const;
};

/**
 * @brief Result of resolving one text
 */
struct TriggerMatch {
    const Trigger* trigger = nullptr;   ///< Owned by the TriggerSet
    std::string matchedPattern;
    bool legacy = false;

    explicit operator bool() const { return trigger != nullptr; }
};

/**
 * @brief Immutable set of configured and legacy triggers
 *
 * Evaluation order:
 * 1. configured triggers in order, first match wins (empty patterns skipped);
 * 2. legacy keywords (case-insensitive substring);
 * 3. legacy regex patterns.
 * A legacy hit returns a synthesized "Legacy" trigger with no mention,
 * prefix or suffix.
 */
class TriggerSet {
public:
    TriggerSet() = default;

    /**
     * @brief Build and precompile triggers
     *
     * Malformed regex triggers and legacy patterns are dropped with a warning.
     */
    TriggerSet(const std::vector<TriggerConfig>& triggers,
               const std::vector<std::string>& legacyKeywords,
               const std::vector<std::string>& legacyPatterns);

    TriggerMatch resolve(const std::string& text) const;

    const std::vector<Trigger>& triggers() const { return m_triggers; }
    size_t legacyKeywordCount() const { return m_keywords.size(); }
    size_t legacyPatternCount() const { return m_patterns.size(); }

private:
    std::vector<Trigger> m_triggers;
    std::vector<std::string> m_keywords;
    std::vector<RegexRule> m_patterns;
    Trigger m_legacy;
};

/**
 * @brief Mention text for a trigger
 *
 * NONE -> "", HERE -> "@here", EVERYONE -> "@everyone",
 * CUSTOM -> trimmed custom string as written.
 */
std::string buildMention(const Trigger& trigger);

} // namespace log_watchdog::detect
