#include "SourceError.hpp"

const char* to_string(SourceErrc code) {
  switch (code) {
    case SourceErrc::NotFound:        return "NotFound";
    case SourceErrc::NotStarted:      return "NotStarted";
    case SourceErrc::NotConfigured:   return "NotConfigured";
    case SourceErrc::MalformedRow:    return "MalformedRow";
    case SourceErrc::StreamExhausted: return "StreamExhausted";
    case SourceErrc::EmptySource:     return "EmptySource";
  }
  return "Unknown";
}
