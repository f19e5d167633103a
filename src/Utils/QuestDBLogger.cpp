#include "Utils/QuestDBLogger.hpp"
#include <iostream>
#include <utility>
#include <stdexcept>
#include <curl/curl.h>

namespace {

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

QuestDBLogger::QuestDBLogger(std::string base_url) : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();

    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

QuestDBLogger::~QuestDBLogger() {
    if (curl_handle_) curl_easy_cleanup(curl_handle_);
    curl_global_cleanup();
}

std::string QuestDBLogger::insert_statement(const std::string& command, long duration_ms) {
    std::string quoted;
    quoted.reserve(command.size());
    for (char c : command) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    return "INSERT INTO execution_times(ts, methodName, durationMs) "
           "VALUES(systimestamp(), '" + quoted + "', " + std::to_string(duration_ms) + ")";
}

void QuestDBLogger::log(const std::string& command, long duration_ms) {
    const std::string query = insert_statement(command, duration_ms);

    char* escaped = curl_easy_escape(curl_handle_, query.c_str(), static_cast<int>(query.length()));
    if (!escaped) {
        std::cerr << "[QUESTDB] Failed to encode query for " << command << "\n";
        return;
    }

    const std::string url = base_url_ + "/exec?query=" + std::string(escaped);
    curl_free(escaped);

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT_MS, 2000L);

    const CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        std::cerr << "[QUESTDB] Insert failed: " << curl_easy_strerror(res) << "\n";
    }
}
