#include "AgentConfig.hpp"
#include "SampleCsvWriter.hpp"
#include "UartSource.hpp"

#include <iostream>

// Captures sample_count UART samples into output_file as x,y,z CSV.
int main(int argc, char** argv) {
  try {
    AgentConfig cfg = argc > 1 ? load_config(argv[1]) : AgentConfig{};
    apply_env_overrides(cfg);

    UartSource source(cfg.port, cfg.baud);
    source.open();

    SampleCsvWriter writer(cfg.output_file);

    Sample s;
    for (int i = 0; i < cfg.sample_count; ++i) {
      if (!source.next(s)) {
        std::cerr << "Serial stream ended early\n";
        break;
      }
      writer.write(s);
    }

    writer.close();
    source.close();

    std::cerr << "Saved " << writer.rows_written() << " samples to "
              << cfg.output_file << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
