#include "avfcomp/ConfigIO.hpp"

#include "avfcomp/Env.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace avfcomp {

namespace {

const char* const kKnownKeys[] = {"backend", "level", "verify", "log", "log_keep", "quiet"};

bool IsKnownKey(const std::string& key)
{
  for (const char* k : kKnownKeys) {
    if (key == k) return true;
  }
  return false;
}

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyInt(const JsonValue& root, const char* key, int lo, int hi, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber() || std::isfinite(v->numberValue) == 0) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double d = v->numberValue;
  if (d != std::floor(d) || d < lo || d > hi) {
    err = std::string("key '") + key + "' must be an integer in " + std::to_string(lo) + ".." + std::to_string(hi);
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

} // namespace

std::string CodecConfigToJson(const CodecConfig& cfg, int indentSpaces)
{
  const std::string pad(static_cast<std::size_t>(indentSpaces < 0 ? 0 : indentSpaces), ' ');
  std::ostringstream oss;
  oss << "{\n";
  oss << pad << "\"backend\": \"" << BackendName(cfg.backend) << "\",\n";
  oss << pad << "\"level\": " << cfg.level << ",\n";
  oss << pad << "\"verify\": " << (cfg.verify ? "true" : "false") << ",\n";
  oss << pad << "\"log\": \"" << JsonEscape(cfg.logPath) << "\",\n";
  oss << pad << "\"log_keep\": " << cfg.logKeep << ",\n";
  oss << pad << "\"quiet\": " << (cfg.quiet ? "true" : "false") << "\n";
  oss << "}\n";
  return oss.str();
}

bool ApplyCodecConfigJson(const JsonValue& root, CodecConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }
  for (const auto& kv : root.objectValue) {
    if (!IsKnownKey(kv.first)) {
      outError = "unknown config key '" + kv.first + "'";
      return false;
    }
  }

  // Apply into a copy so a bad file leaves the config untouched.
  CodecConfig cfg = ioCfg;

  std::string backendName;
  if (!ApplyString(root, "backend", backendName, outError)) return false;
  if (!backendName.empty() && !ParseBackend(backendName, cfg.backend)) {
    outError = "unknown backend '" + backendName + "'";
    return false;
  }

  if (!ApplyInt(root, "level", -1, 9, cfg.level, outError)) return false;
  if (!ApplyBool(root, "verify", cfg.verify, outError)) return false;
  if (!ApplyString(root, "log", cfg.logPath, outError)) return false;
  if (!ApplyInt(root, "log_keep", 0, 100, cfg.logKeep, outError)) return false;
  if (!ApplyBool(root, "quiet", cfg.quiet, outError)) return false;

  ioCfg = cfg;
  return true;
}

bool LoadCodecConfigJsonFile(const std::string& path, CodecConfig& ioCfg, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "unable to open config file: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();

  JsonValue root;
  if (!ParseJson(ss.str(), root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!ApplyCodecConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ApplyCodecConfigEnv(CodecConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (const auto backend = GetEnvVar("AVFCOMP_BACKEND")) {
    if (!ParseBackend(*backend, ioCfg.backend)) {
      outError = "AVFCOMP_BACKEND: unknown backend '" + *backend + "'";
      return false;
    }
  }
  if (const auto log = GetEnvVar("AVFCOMP_LOG")) {
    ioCfg.logPath = *log;
  }
  return true;
}

} // namespace avfcomp
