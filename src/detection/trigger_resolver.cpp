/**
 * @file trigger_resolver.cpp
 * @brief Trigger precompilation and first-match resolution
 */

#include "detection/trigger_resolver.h"
#include "detection/entry_segmenter.h"
#include "utils/logger.h"
#include "utils/string_utils.h"

namespace log_watchdog::detect {

const std::string& Trigger::pattern() const {
    if (const auto* kw = std::get_if<KeywordRule>(&rule)) return kw->keyword;
    return std::get<RegexRule>(rule).pattern;
}

TriggerSet::TriggerSet(const std::vector<TriggerConfig>& triggers,
                       const std::vector<std::string>& legacyKeywords,
                       const std::vector<std::string>& legacyPatterns) {
    for (const auto& tc : triggers) {
        if (tc.match.empty()) continue;

        Trigger t;
        t.name = tc.name;
        t.mentionMode = tc.mentionMode;
        t.mentionCustom = tc.mentionCustom;
        t.prefix = tc.prefix;
        t.suffix = tc.suffix;

        if (tc.type == MatchType::REGEX) {
            auto re = compilePattern(tc.match, true);
            if (!re) {
                logWarning("Trigger '" + tc.name + "': bad regex '" + tc.match + "', skipped");
                continue;
            }
            t.rule = RegexRule{tc.match, std::move(*re)};
        } else {
            t.rule = KeywordRule{tc.match};
        }
        m_triggers.push_back(std::move(t));
    }

    for (const auto& kw : legacyKeywords) {
        std::string k = trim(kw);
        if (!k.empty()) m_keywords.push_back(k);
    }

    for (const auto& pat : legacyPatterns) {
        auto re = compilePattern(pat, false);
        if (!re) {
            logWarning("Bad regex '" + pat + "', dropped");
            continue;
        }
        m_patterns.push_back(RegexRule{pat, std::move(*re)});
    }

    m_legacy.name = "Legacy";
    m_legacy.rule = KeywordRule{};
}

TriggerMatch TriggerSet::resolve(const std::string& text) const {
    TriggerMatch out;
    const std::string lower = toLower(text);

    for (const auto& t : m_triggers) {
        if (const auto* kw = std::get_if<KeywordRule>(&t.rule)) {
            if (lower.find(toLower(kw->keyword)) != std::string::npos) {
                out.trigger = &t;
                out.matchedPattern = kw->keyword;
                return out;
            }
        } else {
            const auto& rx = std::get<RegexRule>(t.rule);
            if (std::regex_search(text, rx.re)) {
                out.trigger = &t;
                out.matchedPattern = rx.pattern;
                return out;
            }
        }
    }

    const std::string stripped = trim(text);
    const std::string strippedLower = toLower(stripped);
    for (const auto& kw : m_keywords) {
        if (strippedLower.find(toLower(kw)) != std::string::npos) {
            out.trigger = &m_legacy;
            out.matchedPattern = kw;
            out.legacy = true;
            return out;
        }
    }
    for (const auto& rx : m_patterns) {
        if (std::regex_search(stripped, rx.re)) {
            out.trigger = &m_legacy;
            out.matchedPattern = rx.pattern;
            out.legacy = true;
            return out;
        }
    }
    return out;
}

std::string buildMention(const Trigger& trigger) {
    switch (trigger.mentionMode) {
        case MentionMode::HERE:     return "@here";
        case MentionMode::EVERYONE: return "@everyone";
        case MentionMode::CUSTOM:   return trim(trigger.mentionCustom);
        case MentionMode::NONE:     break;
    }
    return "";
}

} // namespace log_watchdog::detect
