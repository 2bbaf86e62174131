#ifndef STYLETREE_CORE_CONFIG_H
#define STYLETREE_CORE_CONFIG_H

#include <cstddef>

namespace styletree::core::config {

inline constexpr const char kProgramName[] = "styletree";
inline constexpr const char kVersionString[] = "styletree 0.1.0";

// Deepest element nesting the markup parser accepts before failing.
inline constexpr std::size_t kMaxNestingDepth = 512;

}  // namespace styletree::core::config

#endif  // STYLETREE_CORE_CONFIG_H
