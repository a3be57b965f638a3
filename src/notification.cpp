#include "notification.hpp"
#include <curl/curl.h>
#include <fmt/format.h>

namespace {

size_t discardBody([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const TelegramConfig& config)
    : botToken(config.botToken), chatId(config.chatId) {}

Result<void> TelegramNotificationStrategy::notify(const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(BackupError::backup("Failed to initialize CURL"));
    }

    char* escaped = curl_easy_escape(curl, message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return std::unexpected(BackupError::backup("Failed to encode Telegram message"));
    }
    std::string url = fmt::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escaped);
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(BackupError::backup(
            fmt::format("Failed to send Telegram notification: {}", curl_easy_strerror(res))));
    }
    if (status >= 400) {
        return std::unexpected(BackupError::backup(
            fmt::format("Telegram API rejected notification with HTTP {}", status)));
    }
    return {};
}
