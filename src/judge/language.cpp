#include "judge/language.hpp"
#include <glog/logging.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

resource_limits language_config::scale(const resource_limits &limits) const {
    resource_limits scaled;
    scaled.time_limit_ms = static_cast<int>(ceil(limits.time_limit_ms * time_multiplier));
    scaled.memory_limit_kb = static_cast<int>(ceil(limits.memory_limit_kb * memory_multiplier));
    return scaled;
}

void from_json(const json &j, language_config &config) {
    j.at("code").get_to(config.code);
    j.at("backend_id").get_to(config.backend_id);
    if (j.count("aliases"))
        j.at("aliases").get_to(config.aliases);
    config.name = j.value("name", config.code);
    config.file_name = j.value("file_name", "");
    config.compiled = j.value("compiled", false);
    config.time_multiplier = j.value("time_multiplier", 1.0);
    config.memory_multiplier = j.value("memory_multiplier", 1.0);
    if (config.time_multiplier <= 0 || config.memory_multiplier <= 0)
        throw invalid_argument("Resource multipliers of language " + config.code + " must be positive");
}

// clang-format off
vector<language_config> language_registry::default_languages() {
    return {
        // code    aliases       name        judge0 id  file name     compiled  time  memory
        {"PY",   {"PYTHON"},   "Python 3", 71,        "main.py",    false,    2,    1},
        {"CPP",  {"C++"},      "C++17",    54,        "main.cpp",   true,     1,    1},
        {"JAVA", {},           "Java 17",  62,        "Main.java",  true,     2,    2},
        {"C",    {},           "C",        50,        "main.c",     true,     1,    1},
        {"JS",   {"NODE"},     "Node.js",  63,        "main.js",    false,    2,    1},
    };
}
// clang-format on

language_registry::language_registry()
    : language_registry(default_languages()) {}

language_registry::language_registry(const vector<language_config> &languages)
    : languages(languages) {
    for (size_t i = 0; i < this->languages.size(); ++i) {
        auto &lang = this->languages[i];
        if (!index.emplace(to_upper(lang.code), i).second)
            throw invalid_argument("Duplicate language " + lang.code);
        for (auto &alias : lang.aliases)
            if (!index.emplace(to_upper(alias), i).second)
                throw invalid_argument("Duplicate language alias " + alias);
    }
    LOG(INFO) << "Registered " << this->languages.size() << " languages";
}

const language_config &language_registry::find(const string &code) const {
    auto it = index.find(to_upper(code));
    if (it == index.end()) throw unsupported_language(code);
    return languages[it->second];
}

bool language_registry::supports(const string &code) const {
    return index.count(to_upper(code)) > 0;
}

}  // namespace arbiter
