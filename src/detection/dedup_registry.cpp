/**
 * @file dedup_registry.cpp
 * @brief Dedup key derivation and seen-sets
 */

#include "detection/dedup_registry.h"
#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <functional>
#include <regex>

namespace log_watchdog::detect {

static const std::regex& timestampRegex() {
    static const std::regex re(R"(day\s*(\d{1,6})\s*[,;]\s*(\d{1,2})[:;](\d{2})[:;](\d{2}))",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::optional<std::string> headerKeyFromText(const std::string& text) {
    if (text.empty()) return std::nullopt;

    std::smatch m;
    if (!std::regex_search(text, m, timestampRegex())) return std::nullopt;

    try {
        const long day = std::stol(m[1].str());
        const int hh = std::stoi(m[2].str());
        const int mm = std::stoi(m[3].str());
        const int ss = std::stoi(m[4].str());

        char buf[48];
        std::snprintf(buf, sizeof(buf), "d%ld-t%02d%02d%02d", day, hh, mm, ss);
        return std::string(buf);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string headerKeyFromLine(const std::string& headerText) {
    std::string out;
    out.reserve(64);
    for (char c : headerText) {
        char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        bool keep = (l >= 'a' && l <= 'z') || (l >= '0' && l <= '9') || l == ':' || l == ';';
        if (!keep) continue;
        out.push_back(l);
        if (out.size() == 64) break;
    }
    return out.empty() ? std::string(kNoKey) : out;
}

std::string canonicalKey(const std::string& resolvedText, const std::string& fallbackHeaderText) {
    if (auto key = headerKeyFromText(resolvedText)) return *key;
    return headerKeyFromLine(fallbackHeaderText);
}

std::string contentKey(const std::string& text) {
    const size_t h = std::hash<std::string>{}(trim(text));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016zx", h);
    return std::string(buf);
}

TtlSet::TtlSet(int ttlSeconds, size_t maxEntries)
    : m_ttl((std::max)(0, ttlSeconds)), m_maxEntries((std::max)(size_t{1}, maxEntries)) {}

void TtlSet::add(const std::string& key, Clock::time_point now) {
    m_entries.emplace_back(key, now + m_ttl);
    while (m_entries.size() > m_maxEntries) {
        m_entries.pop_front();
    }
}

bool TtlSet::contains(const std::string& key, Clock::time_point now) {
    while (!m_entries.empty() && m_entries.front().second < now) {
        m_entries.pop_front();
    }
    for (const auto& e : m_entries) {
        if (e.first == key && e.second >= now) return true;
    }
    return false;
}

} // namespace log_watchdog::detect
