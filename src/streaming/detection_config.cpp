#include "streaming/detection_config.h"

#include <chrono>
#include <cmath>

#include "util/exception.h"

namespace pitchtrack {

double wall_clock_ms() {
  using namespace std::chrono;
  return duration<double, std::milli>(system_clock::now().time_since_epoch()).count();
}

void check_confidence(float value) {
  PITCHTRACK_CHECK_MSG(value >= 0.0f && value <= 1.0f, ErrorCode::InvalidParameter,
                       "Confidence threshold must be in [0, 1]");
}

void check_a4_reference(float hz) {
  PITCHTRACK_CHECK_MSG(std::isfinite(hz) && hz > 0.0f, ErrorCode::InvalidParameter,
                       "A4 reference must be a positive frequency");
}

}  // namespace pitchtrack
