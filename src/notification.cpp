#include "notification.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {

size_t discardBody([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config.get("bot_token", "").asString()), chatId(config.get("chat_id", "").asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram notifications need both bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(curl, message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return std::unexpected("Failed to escape notification text");
    }
    std::string url = "https://api.telegram.org/bot" + botToken + "/sendMessage?chat_id=" + chatId +
                      "&text=" + escaped;
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("Failed to send Telegram notification: ") + curl_easy_strerror(res));
    }
    return {};
}

std::unique_ptr<NotificationStrategy> makeNotifier(const Json::Value& telegramConfig) {
    if (telegramConfig.isNull() || (telegramConfig.isObject() && telegramConfig.empty())) {
        return nullptr;
    }
    return std::make_unique<TelegramNotificationStrategy>(telegramConfig);
}
