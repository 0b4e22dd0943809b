#pragma once

#include "spme/matching/match_config.h"

namespace spme::matching {

inline double text_threshold_preset() {
  return 0.70;
}

inline double image_threshold_preset() {
  return 0.85;
}

inline double hybrid_threshold_preset() {
  return 0.75;
}

inline double threshold_preset(const MatchMode mode) {
  switch (mode) {
    case MatchMode::kText:
      return text_threshold_preset();
    case MatchMode::kImage:
      return image_threshold_preset();
    case MatchMode::kHybrid:
      return hybrid_threshold_preset();
  }
  return hybrid_threshold_preset();
}

// Strict preset for catalogues where false merges are expensive.
inline MatchConfig strict_hybrid_preset() {
  MatchConfig config;
  config.mode = MatchMode::kHybrid;
  config.threshold = 0.85;
  config.auto_confirm_threshold = 0.90;
  return config;
}

}  // namespace spme::matching
