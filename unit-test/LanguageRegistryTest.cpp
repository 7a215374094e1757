#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/language.hpp"

using namespace std;
using namespace arbiter;
using namespace nlohmann;

TEST(LanguageRegistryTest, DefaultLanguages) {
    language_registry registry;
    EXPECT_EQ(54, registry.find("CPP").backend_id);
    EXPECT_EQ(71, registry.find("PY").backend_id);
    EXPECT_EQ(62, registry.find("JAVA").backend_id);
    EXPECT_EQ(50, registry.find("C").backend_id);
    EXPECT_EQ(63, registry.find("JS").backend_id);
}

TEST(LanguageRegistryTest, CaseInsensitiveAndAliases) {
    language_registry registry;
    EXPECT_EQ(&registry.find("PY"), &registry.find("python"));
    EXPECT_EQ(&registry.find("PY"), &registry.find("Python"));
    EXPECT_EQ(&registry.find("CPP"), &registry.find("c++"));
    EXPECT_TRUE(registry.supports("java"));
}

TEST(LanguageRegistryTest, UnsupportedLanguage) {
    language_registry registry;
    EXPECT_FALSE(registry.supports("BRAINFUCK"));
    try {
        registry.find("BRAINFUCK");
        FAIL() << "unsupported_language expected";
    } catch (unsupported_language &ex) {
        EXPECT_EQ("BRAINFUCK", ex.language);
    }
}

TEST(LanguageRegistryTest, ScaleLimits) {
    language_registry registry;
    resource_limits limits;
    limits.time_limit_ms = 1000;
    limits.memory_limit_kb = 262144;

    auto java = registry.find("JAVA").scale(limits);
    EXPECT_EQ(2000, java.time_limit_ms);
    EXPECT_EQ(524288, java.memory_limit_kb);

    auto cpp = registry.find("CPP").scale(limits);
    EXPECT_EQ(1000, cpp.time_limit_ms);
    EXPECT_EQ(262144, cpp.memory_limit_kb);
}

TEST(LanguageRegistryTest, FromJson) {
    json j = json::parse(R"([
        {"code": "GO", "backend_id": 60, "time_multiplier": 1.5, "aliases": ["GOLANG"]},
        {"code": "RUST", "backend_id": 73}
    ])");
    language_registry registry(j.get<vector<language_config>>());
    EXPECT_EQ(60, registry.find("golang").backend_id);
    EXPECT_EQ(1500, registry.find("GO").scale(resource_limits()).time_limit_ms);
    EXPECT_EQ(1.0, registry.find("RUST").memory_multiplier);
    EXPECT_FALSE(registry.supports("CPP"));
}

TEST(LanguageRegistryTest, RejectsInvalidConfiguration) {
    json negative = json::parse(R"({"code": "GO", "backend_id": 60, "time_multiplier": 0})");
    EXPECT_THROW(negative.get<language_config>(), invalid_argument);

    language_config a, b;
    a.code = "GO";
    b.code = "go";
    EXPECT_THROW(language_registry({a, b}), invalid_argument);
}
