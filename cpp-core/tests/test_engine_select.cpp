/**
 * @file test_engine_select.cpp
 * @brief Unit tests for engine selection and configuration.
 */

#include "dualffi/engine.h"
#include "dualffi/error.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dualffi;

namespace {

EngineFactory unavailable(const std::string& reason, int* calls = nullptr) {
    return [reason, calls](const EngineConfig&) -> std::unique_ptr<Engine> {
        if (calls) ++*calls;
        throw EngineUnavailable(reason);
    };
}

}  // namespace

TEST(SelectEngine, FallsBackToNextCandidate) {
    int calls = 0;
    std::vector<EngineFactory> candidates = {
        unavailable("declarative backend missing", &calls),
        make_dynamic_engine,
    };

    auto engine = select_engine(candidates, EngineConfig{});
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->kind(), EngineKind::Dynamic);
    EXPECT_EQ(calls, 1);
}

TEST(SelectEngine, FirstAvailableWins) {
    int later_calls = 0;
    std::vector<EngineFactory> candidates = {
        make_dynamic_engine,
        unavailable("never asked", &later_calls),
    };

    auto engine = select_engine(candidates, EngineConfig{});
    EXPECT_EQ(engine->kind(), EngineKind::Dynamic);
    EXPECT_EQ(later_calls, 0);
}

TEST(SelectEngine, AllUnavailableIsFatal) {
    std::vector<EngineFactory> candidates = {
        unavailable("first"),
        unavailable("second"),
    };

    try {
        select_engine(candidates, EngineConfig{});
        FAIL() << "expected FFIEngineError";
    } catch (const FFIEngineError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("first"), std::string::npos);
        EXPECT_NE(message.find("second"), std::string::npos);
    }
}

TEST(SelectEngine, NoCandidatesIsFatal) {
    EXPECT_THROW(select_engine({}, EngineConfig{}), FFIEngineError);
}

TEST(SelectEngine, OtherFailuresPropagate) {
    std::vector<EngineFactory> candidates = {
        [](const EngineConfig&) -> std::unique_ptr<Engine> {
            throw std::logic_error("broken backend");
        },
        make_dynamic_engine,
    };

    EXPECT_THROW(select_engine(candidates, EngineConfig{}), std::logic_error);
}

TEST(SelectEngine, DynamicPreferenceSkipsDeclarative) {
    EngineConfig config;
    config.preference = EngineConfig::Preference::Dynamic;

    auto engine = select_engine(default_engine_factories(), config);
    EXPECT_EQ(engine->kind(), EngineKind::Dynamic);
}

TEST(SelectEngine, AutoPrefersDeclarative) {
    auto engine = select_engine(default_engine_factories(), EngineConfig{});
#if DUALFFI_WITH_DECLARATIVE
    EXPECT_EQ(engine->kind(), EngineKind::Declarative);
#else
    EXPECT_EQ(engine->kind(), EngineKind::Dynamic);
#endif
}

TEST(SelectEngine, DeclarativePreference) {
    EngineConfig config;
    config.preference = EngineConfig::Preference::Declarative;

#if DUALFFI_WITH_DECLARATIVE
    EXPECT_EQ(select_engine(default_engine_factories(), config)->kind(),
              EngineKind::Declarative);
#else
    EXPECT_THROW(select_engine(default_engine_factories(), config), FFIEngineError);
#endif
}

TEST(EngineConfig, ParsePreference) {
    EXPECT_EQ(EngineConfig::parse_preference(nullptr), EngineConfig::Preference::Auto);
    EXPECT_EQ(EngineConfig::parse_preference(""), EngineConfig::Preference::Auto);
    EXPECT_EQ(EngineConfig::parse_preference("auto"), EngineConfig::Preference::Auto);
    EXPECT_EQ(EngineConfig::parse_preference("declarative"),
              EngineConfig::Preference::Declarative);
    EXPECT_EQ(EngineConfig::parse_preference("dynamic"), EngineConfig::Preference::Dynamic);
    EXPECT_EQ(EngineConfig::parse_preference("fastest"), EngineConfig::Preference::Auto);
}

TEST(EngineConfig, FromEnvironment) {
    ASSERT_EQ(setenv("DUALFFI_ENGINE", "dynamic", 1), 0);
    EXPECT_EQ(EngineConfig::from_environment().preference, EngineConfig::Preference::Dynamic);

    ASSERT_EQ(unsetenv("DUALFFI_ENGINE"), 0);
    EXPECT_EQ(EngineConfig::from_environment().preference, EngineConfig::Preference::Auto);
}

TEST(ActiveEngine, SelectedOnce) {
    const Engine& first = active_engine();
    const Engine& second = active_engine();

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(engine_kind(), first.kind());
    EXPECT_STREQ(engine_name(), to_string(first.kind()));
}
