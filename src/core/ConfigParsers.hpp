/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 * Out-of-range numbers are clamped rather than rejected.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace vb {

class ConfigParsers {
public:
    static bool parseDebug(const toml::table& tbl, bool fallback);
    static void parseEngine(const toml::table& tbl, EngineConfig& cfg);
    static void parseSession(const toml::table& tbl, SessionSettings& cfg);
    static void parseCapture(const toml::table& tbl, CaptureConfig& cfg);
    static void parseUI(const toml::table& tbl, UIConfig& cfg);

    static toml::table serialize(const EngineConfig& engine,
                                 const SessionSettings& session,
                                 const CaptureConfig& capture,
                                 const UIConfig& ui,
                                 bool debug);
};

} // namespace vb
