#pragma once
#include <Arduino.h>

#include "EpdInterface.h"

// 3-wire SPI (BS1 high): no D/C pin. Every byte goes out as a 9-bit word whose
// first bit is the D/C flag (0 command, 1 data), so it is bit-banged on GPIOs.
class Epd3WireInterface : public EpdInterface {
 public:
  Epd3WireInterface(int8_t sclk, int8_t sda, int8_t cs, int8_t rst, int8_t busy);

  int begin() override;
  int sendCommand(uint8_t command) override;
  int sendData(const uint8_t* data, size_t length) override;
  using EpdInterface::sendData;
  void setResetLine(bool high) override;
  bool readBusyLine() override;
  void delayMs(uint32_t ms) override;

  // 9-bit word as shifted out: D/C flag in bit 8, then the byte
  static uint16_t encodeWord(bool isData, uint8_t value);

 private:
  void writeWord(bool isData, uint8_t value);

  int8_t _sclk, _sda, _cs, _rst, _busy;
  bool started = false;
};
