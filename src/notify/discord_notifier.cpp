/**
 * @file discord_notifier.cpp
 * @brief Discord webhook delivery
 */

#include "notify/discord_notifier.h"
#include "utils/string_utils.h"

#include <curl/curl.h>

#include <cstdlib>
#include <mutex>

namespace log_watchdog {

using json = nlohmann::json;

namespace {

size_t curlWriteCb(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

json buildAllowedMentionsJson(const AllowedMentions& am) {
    json payload;
    payload["parse"] = json::array();
    if (am.everyone) payload["parse"].push_back("everyone");
    if (am.roles)    payload["parse"].push_back("roles");
    if (am.users)    payload["parse"].push_back("users");
    if (!am.roleIds.empty()) payload["roles"] = am.roleIds;
    if (!am.userIds.empty()) payload["users"] = am.userIds;
    return payload;
}

json buildPayloadJson(const std::string& content, const AllowedMentions& am) {
    json payload;
    payload["content"] = content;
    payload["allowed_mentions"] = buildAllowedMentionsJson(am);
    return payload;
}

DiscordWebhookNotifier::DiscordWebhookNotifier(std::string webhookUrl, long timeoutSec)
    : m_webhookUrl(trim(webhookUrl)), m_timeoutSec(timeoutSec) {
    ensureCurlGlobalInit();
}

DiscordWebhookNotifier::~DiscordWebhookNotifier() = default;

std::string DiscordWebhookNotifier::resolveUrl() const {
    if (!m_webhookUrl.empty()) return m_webhookUrl;
    const char* env = std::getenv("DISCORD_WEBHOOK_URL");
    return env ? trim(env) : std::string{};
}

bool DiscordWebhookNotifier::send(const NotificationMessage& message) {
    m_lastError.clear();

    const std::string url = resolveUrl();
    if (url.empty()) {
        m_lastError = "Discord webhook URL not set (config or DISCORD_WEBHOOK_URL)";
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        m_lastError = "curl init failed";
        return false;
    }

    const std::string body = buildPayloadJson(message.content, message.allowedMentions).dump();
    std::string response;
    struct curl_slist* headers = nullptr;
    curl_mime* mime = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSec);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    if (!message.image.empty()) {
        mime = curl_mime_init(curl);

        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, "payload_json");
        curl_mime_data(part, body.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        curl_mime_filename(part, message.filename.c_str());
        curl_mime_type(part, "image/png");
        curl_mime_data(part, reinterpret_cast<const char*>(message.image.data()), message.image.size());

        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    if (mime) curl_mime_free(mime);
    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        m_lastError = std::string("curl failed: ") + curl_easy_strerror(res);
        return false;
    }
    if (httpCode < 200 || httpCode >= 300) {
        m_lastError = "HTTP " + std::to_string(httpCode) + ": " + response.substr(0, 200);
        return false;
    }
    return true;
}

} // namespace log_watchdog
