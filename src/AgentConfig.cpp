#include "AgentConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace {

void validate(const AgentConfig& cfg) {
  if (cfg.delay_ms < 0) throw std::runtime_error("delay_ms must not be negative");
  if (cfg.sample_count < 0) throw std::runtime_error("sample_count must not be negative");
  if (cfg.baud == 0) throw std::runtime_error("baud must be positive");
}

int env_int(const char* name, const char* value) {
  try {
    size_t used = 0;
    int v = std::stoi(value, &used);
    if (used != std::string(value).size()) throw std::invalid_argument(value);
    return v;
  } catch (const std::logic_error&) {
    throw std::runtime_error(std::string("Environment variable ") + name +
                             " is not an integer: " + value);
  }
}

}  // namespace

ReplayConfig AgentConfig::replay() const {
  ReplayConfig rc;
  rc.accelerometer_file = accelerometer_file;
  rc.gps_file = gps_file;
  rc.delay = std::chrono::milliseconds(delay_ms);
  rc.user_id = user_id;
  return rc;
}

AgentConfig parse_config(const json& j) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");

  AgentConfig cfg;
  try {
    std::string mode = j.value("mode", std::string("replay"));
    if (mode == "replay") {
      cfg.mode = SourceMode::Replay;
    } else if (mode == "uart") {
      cfg.mode = SourceMode::Uart;
    } else {
      throw std::runtime_error("Unknown mode '" + mode + "' (expected replay or uart)");
    }

    cfg.port               = j.value("port", cfg.port);
    cfg.baud               = j.value("baud", cfg.baud);
    cfg.accelerometer_file = j.value("accelerometer_file", cfg.accelerometer_file);
    cfg.gps_file           = j.value("gps_file", cfg.gps_file);
    cfg.delay_ms           = j.value("delay_ms", cfg.delay_ms);
    cfg.user_id            = j.value("user_id", cfg.user_id);
    cfg.output_file        = j.value("output_file", cfg.output_file);
    cfg.sample_count       = j.value("sample_count", cfg.sample_count);
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("Bad config value: ") + e.what());
  }

  validate(cfg);
  return cfg;
}

AgentConfig load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Could not parse config " + path + ": " + e.what());
  }
  return parse_config(j);
}

void apply_env_overrides(AgentConfig& cfg) {
  if (const char* v = std::getenv("PORT")) cfg.port = v;
  if (const char* v = std::getenv("FILE")) cfg.output_file = v;
  if (const char* v = std::getenv("DELAY_MS")) cfg.delay_ms = env_int("DELAY_MS", v);
  if (const char* v = std::getenv("USER_ID")) cfg.user_id = env_int("USER_ID", v);
  validate(cfg);
}
