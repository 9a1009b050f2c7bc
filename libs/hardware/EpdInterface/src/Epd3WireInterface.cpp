#include "Epd3WireInterface.h"

Epd3WireInterface::Epd3WireInterface(int8_t sclk, int8_t sda, int8_t cs, int8_t rst, int8_t busy)
    : _sclk(sclk), _sda(sda), _cs(cs), _rst(rst), _busy(busy) {
  if (Serial) Serial.printf("[%lu] Epd3WireInterface: SCLK=%d, SDA=%d, CS=%d, RST=%d, BUSY=%d\n", millis(), sclk, sda,
                            cs, rst, busy);
}

int Epd3WireInterface::begin() {
  pinMode(_sclk, OUTPUT);
  pinMode(_sda, OUTPUT);
  pinMode(_cs, OUTPUT);
  pinMode(_rst, OUTPUT);
  pinMode(_busy, INPUT);

  digitalWrite(_cs, HIGH);
  digitalWrite(_sclk, LOW);
  digitalWrite(_rst, HIGH);

  if (Serial) Serial.printf("[%lu]   3-wire GPIO pins configured\n", millis());
  started = true;
  return EPD_BUS_OK;
}

uint16_t Epd3WireInterface::encodeWord(const bool isData, const uint8_t value) {
  return static_cast<uint16_t>((isData ? 0x100 : 0x000) | value);
}

// Mode 0, sampled on the rising edge, bit 8 (D/C) first
void Epd3WireInterface::writeWord(const bool isData, const uint8_t value) {
  const uint16_t word = encodeWord(isData, value);
  for (uint16_t bit = 0x100; bit != 0; bit >>= 1) {
    digitalWrite(_sda, (word & bit) ? HIGH : LOW);
    digitalWrite(_sclk, HIGH);
    digitalWrite(_sclk, LOW);
  }
}

int Epd3WireInterface::sendCommand(const uint8_t command) {
  if (!started) return EPD_BUS_ERR_NOT_STARTED;

  digitalWrite(_cs, LOW);
  writeWord(false, command);
  digitalWrite(_cs, HIGH);
  return EPD_BUS_OK;
}

int Epd3WireInterface::sendData(const uint8_t* data, const size_t length) {
  if (!data && length > 0) return EPD_BUS_ERR_INVALID_ARG;
  if (!started) return EPD_BUS_ERR_NOT_STARTED;

  digitalWrite(_cs, LOW);
  for (size_t i = 0; i < length; i++) {
    writeWord(true, data[i]);
  }
  digitalWrite(_cs, HIGH);
  return EPD_BUS_OK;
}

void Epd3WireInterface::setResetLine(const bool high) { digitalWrite(_rst, high ? HIGH : LOW); }

bool Epd3WireInterface::readBusyLine() { return digitalRead(_busy) == HIGH; }

void Epd3WireInterface::delayMs(const uint32_t ms) { delay(ms); }
