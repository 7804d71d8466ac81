#include "fusionflex/result.hpp"

namespace fusionflex {

const char* to_string(Result r) {
  switch (r) {
    case Result::Ok:                return "ok";
    case Result::OutOfRange:        return "out_of_range";
    case Result::UnsupportedSource: return "unsupported_source";
    case Result::NotConnected:      return "not_connected";
    case Result::SendFailed:        return "send_failed";
    case Result::TransportFailed:   return "transport_failed";
  }
  return "unknown";
}

} // namespace fusionflex
