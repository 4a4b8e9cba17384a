#pragma once
/**
 * @file discord_notifier.h
 * @brief Discord webhook notifier (libcurl)
 */

#include "notify/notifier.h"

#include <nlohmann/json.hpp>
#include <string>

namespace log_watchdog {

/**
 * @brief Discord "allowed_mentions" object
 *
 * {"parse": ["everyone","roles","users"], "roles": [...], "users": [...]}
 * "roles"/"users" id lists are only present when non-empty.
 */
nlohmann::json buildAllowedMentionsJson(const AllowedMentions& am);

/**
 * @brief Webhook message payload: {"content": ..., "allowed_mentions": ...}
 */
nlohmann::json buildPayloadJson(const std::string& content, const AllowedMentions& am);

/**
 * @brief Posts messages to a Discord webhook
 *
 * Text-only messages are sent as application/json. Messages with an image
 * are sent as multipart/form-data with a "payload_json" part and a "file"
 * part (image/png).
 */
class DiscordWebhookNotifier : public Notifier {
public:
    /**
     * @param webhookUrl Webhook URL; empty = DISCORD_WEBHOOK_URL environment variable
     * @param timeoutSec Request timeout
     */
    explicit DiscordWebhookNotifier(std::string webhookUrl, long timeoutSec = 15);
    ~DiscordWebhookNotifier() override;

    DiscordWebhookNotifier(const DiscordWebhookNotifier&) = delete;
    DiscordWebhookNotifier& operator=(const DiscordWebhookNotifier&) = delete;

    bool send(const NotificationMessage& message) override;
    const std::string& getLastError() const override { return m_lastError; }

    /**
     * @brief Configured URL, or the environment fallback
     */
    std::string resolveUrl() const;

private:
    std::string m_webhookUrl;
    long m_timeoutSec;
    std::string m_lastError;
};

} // namespace log_watchdog
