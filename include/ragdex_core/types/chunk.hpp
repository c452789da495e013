#pragma once

#include <string>

namespace ragdex_core {

struct Chunk {
  std::string content;
  int chunk_index = 0;
};

}  // namespace ragdex_core
