#include "executor/judge0.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace arbiter::judge0 {
using namespace std;
using namespace nlohmann;

json build_request_body(const execution_request &request) {
    return {{"source_code", request.source_code},
            {"language_id", request.language_id},
            {"stdin", request.stdin_text},
            {"expected_output", request.expected_output},
            {"cpu_time_limit", request.time_limit_ms / 1000.0},
            {"memory_limit", request.memory_limit_kb}};
}

static string optional_string(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string())
        throw executor_protocol_error(fmt::format("Field {} of Judge0 response is not a string", key));
    return j.at(key).get<string>();
}

static double optional_seconds(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return 0;
    auto &value = j.at(key);
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        // Judge0 使用字符串表示时间，比如 "0.012"
        try {
            return boost::lexical_cast<double>(value.get<string>());
        } catch (boost::bad_lexical_cast &) {
            throw executor_protocol_error(fmt::format("Field {} of Judge0 response is not a number: {}", key, value.dump()));
        }
    }
    throw executor_protocol_error(fmt::format("Field {} of Judge0 response has unexpected type", key));
}

static int optional_int(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return 0;
    auto &value = j.at(key);
    if (value.is_number()) return static_cast<int>(value.get<double>());
    throw executor_protocol_error(fmt::format("Field {} of Judge0 response is not a number", key));
}

execution_outcome parse_response(long http_code, const string &body) {
    if (http_code < 200 || http_code >= 300)
        throw executor_unreachable(fmt::format("Judge0 responded with HTTP {}: {}", http_code, body.substr(0, 256)));

    json j;
    try {
        j = json::parse(body);
    } catch (json::parse_error &e) {
        throw executor_protocol_error(fmt::format("Judge0 response is not JSON: {}", e.what()));
    }

    if (!j.is_object() || !j.count("status") || !j.at("status").is_object() ||
        !j.at("status").count("id") || !j.at("status").at("id").is_number_integer())
        throw executor_protocol_error("Judge0 response does not contain status.id: " + j.dump());

    execution_outcome outcome;
    outcome.status_id = j.at("status").at("id").get<int>();
    outcome.status_description = optional_string(j.at("status"), "description");
    outcome.stdout_text = optional_string(j, "stdout");
    outcome.stderr_text = optional_string(j, "stderr");
    outcome.compile_output = optional_string(j, "compile_output");
    outcome.time = optional_seconds(j, "time");
    outcome.memory_kb = optional_int(j, "memory");
    outcome.exit_code = optional_int(j, "exit_code");
    return outcome;
}

client::client(const server::backend &config) : config(config) {}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

execution_outcome client::execute(const execution_request &request) {
    string url = fmt::format("{}/submissions?base64_encoded=false&wait=true", config.url);
    string payload = build_request_body(request).dump();
    string response;
    long http_code = 0;

    CURL *curl = curl_easy_init();
    if (!curl) throw executor_unreachable("Unable to initialize curl");

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!config.auth_token.empty())
        headers = curl_slist_append(headers, ("X-Auth-Token: " + config.auth_token).c_str());

    // 等待时间必须比测试点的时间限制更长，因为评测后端可能需要排队
    long timeout = request.time_limit_ms + BACKEND_OVERHEAD_MS;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)payload.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)BACKEND_CONNECT_TIMEOUT_MS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw executor_unreachable(fmt::format("Unable to reach Judge0 at {}: {}", config.url, curl_easy_strerror(res)));

    if (DEBUG)
        LOG(INFO) << "Judge0 request " << payload << " responded " << http_code << ' ' << response;

    return parse_response(http_code, response);
}

}  // namespace arbiter::judge0
