#pragma once
/**
 * @file notifier.h
 * @brief Notification sink interface
 */

#include "types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace log_watchdog {

/**
 * @brief One outgoing notification
 */
struct NotificationMessage {
    std::string content;                ///< Message text (may contain mentions)
    std::vector<uint8_t> image;         ///< PNG bytes, empty = text only
    std::string filename = "image.png"; ///< Attachment name
    AllowedMentions allowedMentions;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    /**
     * @brief Deliver a notification
     * @return false on failure (see getLastError())
     */
    virtual bool send(const NotificationMessage& message) = 0;

    virtual const std::string& getLastError() const = 0;
};

} // namespace log_watchdog
