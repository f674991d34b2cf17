#pragma once

#include "avfcomp/Config.hpp"
#include "avfcomp/Json.hpp"

#include <string>

namespace avfcomp {

// JSON and environment helpers for CodecConfig.
//
// JSON files use merge semantics: missing keys leave the existing value
// unchanged, unknown keys are an error. Field names are snake_case:
//
//   {
//     "backend": "lzma",
//     "level": -1,
//     "verify": true,
//     "log": "avfcomp.log",
//     "log_keep": 3,
//     "quiet": false
//   }

std::string CodecConfigToJson(const CodecConfig& cfg, int indentSpaces = 2);

bool ApplyCodecConfigJson(const JsonValue& root, CodecConfig& ioCfg, std::string& outError);

bool LoadCodecConfigJsonFile(const std::string& path, CodecConfig& ioCfg, std::string& outError);

// AVFCOMP_BACKEND and AVFCOMP_LOG. Unset variables leave the config unchanged.
bool ApplyCodecConfigEnv(CodecConfig& ioCfg, std::string& outError);

} // namespace avfcomp
