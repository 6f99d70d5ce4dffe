#pragma once
#include <stdexcept>
#include <string>

enum class SourceErrc {
  NotFound,         // file or port path missing at start/open
  NotStarted,       // read before start()/open()
  NotConfigured,    // UART source built without a port
  MalformedRow,     // CSV row with too few or non-numeric cells
  StreamExhausted,  // UART link hit end-of-stream
  EmptySource,      // CSV file has no data rows at all
};

const char* to_string(SourceErrc code);

class SourceError : public std::runtime_error {
public:
  SourceError(SourceErrc code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

  SourceErrc code() const { return code_; }

private:
  SourceErrc code_;
};
