#include "telegram_client.hpp"

#include <curl/curl.h>
#include <fstream>

using json = nlohmann::json;

namespace {

constexpr long kRequestTimeoutS = 60;
constexpr long kDownloadTimeoutS = 600;

size_t append_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t file_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

// Keeps the remote extension; the decoder sniffs the format anyway.
std::string local_name(const std::string& file_path) {
    auto name = std::filesystem::path(file_path).filename().string();
    return name.empty() ? "audio" : name;
}

} // namespace

std::string encode_request(const json& params) {
    return params.dump(-1, ' ', false, json::error_handler_t::replace);
}

TelegramClient::TelegramClient(std::string token, std::string api_url, uint32_t poll_timeout_s)
    : token_(std::move(token)), api_url_(std::move(api_url)), poll_timeout_s_(poll_timeout_s) {}

std::expected<json, std::string>
TelegramClient::call(const std::string& method, const json& params, long timeout_s,
                     std::stop_token stop) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = api_url_ + "/bot" + token_ + "/" + method;
    std::string body = encode_request(params);
    std::string response_body;

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        // The URL carries the token; never echo it.
        return std::unexpected(method + ": " + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);
        if (!j.value("ok", false)) {
            return std::unexpected(method + ": " + j.value("description", std::string("request failed")));
        }
        return j.contains("result") ? j["result"] : json{};
    } catch (const json::exception& e) {
        return std::unexpected(method + ": response parse error: " + e.what());
    }
}

std::expected<std::vector<Update>, std::string>
TelegramClient::get_updates(int64_t offset, std::stop_token stop) {
    json params = {
        {"offset", offset},
        {"timeout", poll_timeout_s_},
        {"allowed_updates", json::array({"message"})},
    };
    auto result = call("getUpdates", params, static_cast<long>(poll_timeout_s_) + 10, stop);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_updates(*result);
}

std::expected<std::filesystem::path, std::string>
TelegramClient::fetch_file(const std::string& source_id, const std::filesystem::path& dest_dir) {
    auto info = call("getFile", {{"file_id", source_id}}, kRequestTimeoutS);
    if (!info) {
        return std::unexpected("file download failed: " + info.error());
    }

    std::string file_path = info->value("file_path", "");
    if (file_path.empty()) {
        return std::unexpected("file download failed: getFile returned no file_path");
    }

    auto dest = dest_dir / local_name(file_path);
    std::ofstream out(dest, std::ios::binary);
    if (!out.is_open()) {
        return std::unexpected("file download failed: cannot create " + dest.string());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("file download failed: curl_easy_init failed");
    }

    std::string url = api_url_ + "/file/bot" + token_ + "/" + file_path;
    long http_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, file_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kDownloadTimeoutS);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);
    out.close();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("file download failed: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        return std::unexpected("file download failed: HTTP " + std::to_string(http_code));
    }
    return dest;
}

std::expected<MessageId, std::string>
TelegramClient::send_message(ChatId chat, const std::string& text,
                             std::optional<MessageId> reply_to) {
    json params = {{"chat_id", chat}, {"text", text}};
    if (reply_to) {
        params["reply_to_message_id"] = *reply_to;
        params["allow_sending_without_reply"] = true;
    }

    auto result = call("sendMessage", params, kRequestTimeoutS);
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->value("message_id", MessageId{0});
}

std::expected<void, std::string>
TelegramClient::edit_message(ChatId chat, MessageId message, const std::string& text) {
    auto result = call("editMessageText",
                       {{"chat_id", chat}, {"message_id", message}, {"text", text}},
                       kRequestTimeoutS);
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<void, std::string>
TelegramClient::delete_message(ChatId chat, MessageId message) {
    auto result = call("deleteMessage", {{"chat_id", chat}, {"message_id", message}},
                       kRequestTimeoutS);
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}
