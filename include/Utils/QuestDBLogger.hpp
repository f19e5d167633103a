#pragma once
#include "ILogger.hpp"
#include <curl/curl.h>
#include <string>

// Inserts every sample into the QuestDB table
// execution_times(ts, methodName, durationMs) through the HTTP /exec endpoint.
class QuestDBLogger : public ILogger {
public:
    // `base_url` such as "http://localhost:9000".
    explicit QuestDBLogger(std::string base_url);
    ~QuestDBLogger() override;

    QuestDBLogger(const QuestDBLogger&) = delete;
    QuestDBLogger& operator=(const QuestDBLogger&) = delete;

    void log(const std::string& command, long duration_ms) override;

    // SQL for one sample; single quotes in `command` are doubled.
    static std::string insert_statement(const std::string& command, long duration_ms);

private:
    CURL* curl_handle_;
    std::string base_url_;
};
