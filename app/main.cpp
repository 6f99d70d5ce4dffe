#include "AgentConfig.hpp"
#include "CsvReplaySource.hpp"
#include "ReadingJson.hpp"
#include "SourceError.hpp"
#include "UartSource.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

using nlohmann::json;

namespace {

int run_replay(const AgentConfig& cfg) {
  CsvReplaySource source(cfg.replay());
  source.start();

  std::cerr << "Replaying " << cfg.accelerometer_file << " + " << cfg.gps_file
            << " (delay " << cfg.delay_ms << " ms)\n";

  // Replay never ends; a bad row only costs that one reading
  for (;;) {
    AggregatedReading r;
    try {
      r = source.read();
    } catch (const SourceError& e) {
      if (e.code() != SourceErrc::MalformedRow) throw;
      std::cerr << "Skipping row: " << e.what() << "\n";
      continue;
    }

    // JSON line for the downstream consumer
    std::cout << json(r).dump() << std::endl;
  }
}

int run_uart(const AgentConfig& cfg) {
  UartSource source(cfg.port, cfg.baud);
  source.open();

  std::cerr << "Opened serial port " << cfg.port << " @ " << cfg.baud << "\n";

  // Serial timing is driven by the device, so no manual sleeps here
  Sample s;
  while (source.next(s)) {
    json j = s;
    j["user_id"] = cfg.user_id;
    std::cout << j.dump() << std::endl;
  }

  std::cerr << "Serial stream ended after " << source.frames_decoded() << " frames ("
            << source.bytes_consumed() << " bytes)\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    AgentConfig cfg = argc > 1 ? load_config(argv[1]) : AgentConfig{};
    apply_env_overrides(cfg);

    if (cfg.mode == SourceMode::Uart) {
      return run_uart(cfg);
    }
    return run_replay(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
