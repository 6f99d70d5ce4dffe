#pragma once
#include "CsvReplaySource.hpp"

#include <nlohmann/json.hpp>

#include <string>

enum class SourceMode { Replay, Uart };

struct AgentConfig {
  SourceMode mode = SourceMode::Replay;

  // UART
  std::string port = "/dev/ttyUSB0";
  unsigned baud = 115200;

  // replay
  std::string accelerometer_file = "data/accelerometer.csv";
  std::string gps_file = "data/gps.csv";
  int delay_ms = 0;
  int user_id = 1;

  // uart_saver
  std::string output_file = "savefile.csv";
  int sample_count = 500;

  ReplayConfig replay() const;
};

// Every key is optional; unknown keys are ignored.
// Throws std::runtime_error on a bad value or type.
AgentConfig parse_config(const nlohmann::json& j);
AgentConfig load_config(const std::string& path);

// PORT, FILE, DELAY_MS and USER_ID override the file values.
void apply_env_overrides(AgentConfig& cfg);
