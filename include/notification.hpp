/**
 * @file notification.hpp
 * @brief Failure notifications for unattended save runs.
 *
 * @note Requires libcurl for the Telegram Bot API.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <memory>
#include <string>
#include <json/json.h>

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Delivers a message on the configured channel.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
};

/**
 * @brief Sends messages to a Telegram chat through a bot.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @param config JSON object with bot_token and chat_id.
     * @throws std::runtime_error If either key is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

/**
 * @brief Builds the notifier described by a "telegram" config section.
 *
 * @return A notifier, or nullptr when the section is absent or empty.
 */
std::unique_ptr<NotificationStrategy> makeNotifier(const Json::Value& telegramConfig);

#endif // NOTIFICATION_HPP
