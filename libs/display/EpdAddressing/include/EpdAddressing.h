#pragma once
#include <cstdint>

#include "EpdConfig.h"

// Location of one pixel in a packed 1bpp framebuffer
struct EpdPixelAddress {
  uint32_t byteOffset = 0;
  uint8_t bitMask = 0;
};

// Map a logical coordinate to the physical panel coordinate for `rotation`.
// Logical bounds are cols x rows for Rotate0/180 and rows x cols for Rotate90/270.
// Returns false (outputs untouched) when (x, y) is outside the logical bounds.
bool epdToPhysical(uint32_t x, uint32_t y, const EpdDimensions& dimensions, EpdRotation rotation, uint32_t* physX,
                   uint32_t* physY);

// Byte offset and bit mask of logical pixel (x, y).
// Pixels are packed row-major in native orientation, most significant bit first,
// which is the SSD1677 RAM layout with X/Y increment data entry.
// Returns false (address untouched) for out-of-bounds coordinates.
bool epdPixelAddress(uint32_t x, uint32_t y, const EpdDimensions& dimensions, EpdRotation rotation,
                     EpdPixelAddress& address);
