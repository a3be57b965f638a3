/**
 * @file notification.hpp
 * @brief Defines notification strategies for KronVault.
 *
 * Provides the interface and the Telegram implementation for sending backup status
 * notifications.
 *
 * @note Requires libcurl.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param message Message to send.
     * @return Result<void> Success or a Backup-kind error.
     */
    virtual Result<void> notify(const std::string& message) = 0;
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API sendMessage call.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config Bot token and chat id.
     */
    explicit TelegramNotificationStrategy(const TelegramConfig& config);

    Result<void> notify(const std::string& message) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

#endif // NOTIFICATION_HPP
