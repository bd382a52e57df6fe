#pragma once

#include <cstdint>
#include <string>

namespace inkvault::db::model {

/*
  Review status of one image.

  done      - reviewer finished the image
  ink_found - the image carries annotations worth keeping
*/

struct StatusRecord {
  std::string image_name;

  bool done      = false;
  bool ink_found = false;

  // wall clock (epoch ms), 0 if never written
  int64_t last_updated_ms = 0;
};

struct StatusCounts {
  uint64_t total     = 0;
  uint64_t done      = 0;
  uint64_t ink_found = 0;
};

} // namespace inkvault::db::model
