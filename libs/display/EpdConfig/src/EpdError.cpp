#include "EpdError.h"

const char* epdErrorName(const EpdError error) {
  switch (error) {
    case EpdError::None:
      return "None";
    case EpdError::ConfigError:
      return "ConfigError";
    case EpdError::BusyTimeout:
      return "BusyTimeout";
    case EpdError::TransportError:
      return "TransportError";
    case EpdError::InitFailed:
      return "InitFailed";
    case EpdError::NotReady:
      return "NotReady";
    case EpdError::OutOfBounds:
      return "OutOfBounds";
  }
  return "Unknown";
}
