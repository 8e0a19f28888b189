#pragma once
#include "models/table.h++"
#include <span>

namespace Stowage {
  // Rows are stored as FlexBuffers vectors
  auto encode_row(const Row& row) -> std::vector<uint8_t>;
  // Throws RowShapeError if the buffer is not a valid encoded row
  auto decode_row(std::span<const uint8_t> data) -> Row;
}
