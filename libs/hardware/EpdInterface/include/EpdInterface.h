#pragma once
#include <cstddef>
#include <cstdint>

// Bus status codes. Implementations may return any other non-zero value for bus specific failures.
constexpr int EPD_BUS_OK = 0;
constexpr int EPD_BUS_ERR_INVALID_ARG = -1;
constexpr int EPD_BUS_ERR_NOT_STARTED = -2;

// Physical link to the display controller.
// Implementations own the pins and the serial bus. The driver always issues a
// command byte first (D/C in command state) followed by zero or more data bytes
// (D/C in data state). Not thread safe.
class EpdInterface {
 public:
  virtual ~EpdInterface() = default;

  // Configure pins and bus, called once before the first reset
  virtual int begin() = 0;

  virtual int sendCommand(uint8_t command) = 0;
  virtual int sendData(const uint8_t* data, size_t length) = 0;
  int sendData(const uint8_t data) { return sendData(&data, 1); }

  // Drive RST, low holds the controller in reset
  virtual void setResetLine(bool high) = 0;

  // True while the controller reports BUSY
  virtual bool readBusyLine() = 0;

  // Blocking delay used for reset hold times and busy poll backoff
  virtual void delayMs(uint32_t ms) = 0;
};
