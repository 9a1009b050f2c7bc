#include "EpdAddressing.h"

bool epdToPhysical(const uint32_t x, const uint32_t y, const EpdDimensions& dimensions, const EpdRotation rotation,
                   uint32_t* physX, uint32_t* physY) {
  const uint32_t rows = dimensions.rows;
  const uint32_t cols = dimensions.cols;

  switch (rotation) {
    case EpdRotation::Rotate0:
      if (x >= cols || y >= rows) return false;
      *physX = x;
      *physY = y;
      return true;
    case EpdRotation::Rotate90:
      // 90 degrees clockwise: logical portrait rows x cols
      if (x >= rows || y >= cols) return false;
      *physX = y;
      *physY = rows - 1 - x;
      return true;
    case EpdRotation::Rotate180:
      if (x >= cols || y >= rows) return false;
      *physX = cols - 1 - x;
      *physY = rows - 1 - y;
      return true;
    case EpdRotation::Rotate270:
      // 90 degrees counter-clockwise
      if (x >= rows || y >= cols) return false;
      *physX = cols - 1 - y;
      *physY = x;
      return true;
  }
  return false;
}

bool epdPixelAddress(const uint32_t x, const uint32_t y, const EpdDimensions& dimensions, const EpdRotation rotation,
                     EpdPixelAddress& address) {
  uint32_t physX = 0;
  uint32_t physY = 0;
  if (!epdToPhysical(x, y, dimensions, rotation, &physX, &physY)) {
    return false;
  }

  const uint32_t index = physY * dimensions.cols + physX;
  address.byteOffset = index / 8;
  address.bitMask = static_cast<uint8_t>(0x80 >> (index % 8));  // MSB first
  return true;
}
