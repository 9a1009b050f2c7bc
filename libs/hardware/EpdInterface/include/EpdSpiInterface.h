#pragma once
#include <Arduino.h>
#include <SPI.h>

#include "EpdInterface.h"

#ifndef EPD_SPI_FREQUENCY_HZ
#define EPD_SPI_FREQUENCY_HZ 20000000
#endif
// Linux spidev rejects transfers above 4096 bytes by default
#ifndef EPD_SPI_MAX_TRANSFER_BYTES
#define EPD_SPI_MAX_TRANSFER_BYTES 4096
#endif

// 4-wire SPI (BS1 low): hardware SPI plus D/C, RST and BUSY pins
class EpdSpiInterface : public EpdInterface {
 public:
  EpdSpiInterface(int8_t sclk, int8_t mosi, int8_t cs, int8_t dc, int8_t rst, int8_t busy,
                  uint32_t frequencyHz = EPD_SPI_FREQUENCY_HZ);

  int begin() override;
  int sendCommand(uint8_t command) override;
  int sendData(const uint8_t* data, size_t length) override;
  using EpdInterface::sendData;
  void setResetLine(bool high) override;
  bool readBusyLine() override;
  void delayMs(uint32_t ms) override;

  // Length of the transfer starting at `offset` in a `length` byte payload, 0 once done
  static size_t chunkLength(size_t offset, size_t length);

 private:
  void writeBytes(const uint8_t* data, size_t length);

  int8_t _sclk, _mosi, _cs, _dc, _rst, _busy;
  uint32_t _frequencyHz;
  SPISettings spiSettings;
  bool started = false;
};
