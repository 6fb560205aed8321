/**
 * @file engine.cpp
 * @brief Engine selection, configuration and the process-wide engine.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/engine.h"
#include "dualffi/dynamic_engine.h"
#include "dualffi/error.h"

#if DUALFFI_WITH_DECLARATIVE
#include "dualffi/declarative_engine.h"
#endif

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace dualffi {

const char* to_string(EngineKind kind) noexcept {
    switch (kind) {
        case EngineKind::Declarative: return "declarative";
        case EngineKind::Dynamic:     return "dynamic";
    }
    return "unknown";
}

EngineConfig::Preference EngineConfig::parse_preference(const char* text) noexcept {
    if (!text || *text == '\0' || std::strcmp(text, "auto") == 0) {
        return Preference::Auto;
    }
    if (std::strcmp(text, "declarative") == 0) {
        return Preference::Declarative;
    }
    if (std::strcmp(text, "dynamic") == 0) {
        return Preference::Dynamic;
    }
    fprintf(stderr, "EngineConfig: ignoring unknown DUALFFI_ENGINE value '%s'\n", text);
    return Preference::Auto;
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    config.preference = parse_preference(std::getenv("DUALFFI_ENGINE"));
    return config;
}

std::unique_ptr<Engine> make_declarative_engine(const EngineConfig& config) {
    if (config.preference == EngineConfig::Preference::Dynamic) {
        throw EngineUnavailable("declarative engine disabled by configuration");
    }
#if DUALFFI_WITH_DECLARATIVE
    return std::make_unique<DeclarativeEngine>();
#else
    throw EngineUnavailable("declarative engine not compiled in");
#endif
}

std::unique_ptr<Engine> make_dynamic_engine(const EngineConfig& config) {
    if (config.preference == EngineConfig::Preference::Declarative) {
        throw EngineUnavailable("dynamic engine disabled by configuration");
    }
    return std::make_unique<DynamicEngine>();
}

std::vector<EngineFactory> default_engine_factories() {
    return {make_declarative_engine, make_dynamic_engine};
}

std::unique_ptr<Engine> select_engine(const std::vector<EngineFactory>& candidates,
                                      const EngineConfig& config) {
    std::string reasons;
    for (const auto& factory : candidates) {
        try {
            if (auto engine = factory(config)) {
                return engine;
            }
            reasons += "; factory returned no engine";
        } catch (const EngineUnavailable& e) {
            fprintf(stderr, "select_engine: %s\n", e.what());
            reasons += "; ";
            reasons += e.what();
        }
    }
    throw FFIEngineError("no foreign-call engine could be instantiated" + reasons);
}

const Engine& active_engine() {
    static const std::unique_ptr<Engine> engine =
        select_engine(default_engine_factories(), EngineConfig::from_environment());
    return *engine;
}

EngineKind engine_kind() {
    return active_engine().kind();
}

const char* engine_name() {
    return active_engine().name();
}

}  // namespace dualffi
