#include "xfer/stats.hpp"

namespace xfer {

double FileStats::mb_per_sec() const {
  if (seconds <= 0.0) return 0.0;
  return (double)length / seconds / (1024.0 * 1024.0);
}

} // namespace xfer
