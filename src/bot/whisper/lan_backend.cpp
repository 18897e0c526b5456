#include "lan_backend.hpp"

#include "audio/ffmpeg_decoder.hpp"
#include "audio/wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

LanBackend::LanBackend(std::string url, std::string api_format, std::string language,
                       std::string model)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), model_(std::move(model)) {}

std::expected<std::vector<int16_t>, std::string>
LanBackend::load_audio(const std::filesystem::path& file) {
    return audio::decode_file(file, kModelSampleRate);
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(const std::filesystem::path& file) {
    auto samples = load_audio(file);
    if (!samples) {
        return std::unexpected(samples.error());
    }
    if (samples->empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = static_cast<double>(samples->size()) / kModelSampleRate;
    auto wav_data = wav::encode(*samples, kModelSampleRate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, model_.c_str(), CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    if (!language_.empty() && language_ != "auto") {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language_.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;
    long http_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("whisper server request failed: ") + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                            : err.is_object() ? err.value("message", err.dump())
                            : err.dump();
            return std::unexpected("whisper server error: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected whisper response (HTTP " +
                                   std::to_string(http_code) + "): " + response_body);
        }

        return TranscriptResult{
            .text = j["text"].get<std::string>(),
            .duration_s = duration_s,
            .processing_s = processing_s,
        };
    } catch (const json::exception& e) {
        return std::unexpected(std::string("whisper response parse error: ") + e.what());
    }
}
