#include "server/common/config.hpp"
#include <stdexcept>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, database &db) {
    j.at("host").get_to(db.host);
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
    if (j.count("timeout"))
        j.at("timeout").get_to(db.timeout);
    else
        db.timeout = 5;
}

void from_json(const json &j, backend &config) {
    j.at("url").get_to(config.url);
    if (j.count("auth_token"))
        j.at("auth_token").get_to(config.auth_token);
    else
        config.auth_token = "";
    while (!config.url.empty() && config.url.back() == '/')
        config.url.pop_back();
}

failure_policy parse_failure_policy(const string &literal) {
    if (literal == "stop-on-first-failure")
        return failure_policy::STOP_ON_FIRST_FAILURE;
    else if (literal == "run-all")
        return failure_policy::RUN_ALL;
    throw invalid_argument("Unrecognized failure policy " + literal);
}

void from_json(const json &j, runner &config) {
    if (j.count("policy"))
        config.policy = parse_failure_policy(j.at("policy").get<string>());
    if (j.count("max_retries"))
        j.at("max_retries").get_to(config.max_retries);
    if (config.max_retries < 0)
        throw invalid_argument("max_retries must not be negative");
}

}  // namespace arbiter::server
