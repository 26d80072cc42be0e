#pragma once

#include "vnb/pch.h"

namespace vnb {

struct BoundingBox {
  glm::vec3 min_{0.0f};
  glm::vec3 max_{0.0f};

  BoundingBox() = default;
  BoundingBox(const glm::vec3 &minPoint, const glm::vec3 &maxPoint)
      : min_(minPoint), max_(maxPoint) {}

  [[nodiscard]] glm::vec3 center() const { return (min_ + max_) * 0.5f; }
  [[nodiscard]] glm::vec3 extent() const { return max_ - min_; }

  void expand(const glm::vec3 &point) {
    min_ = glm::min(min_, point);
    max_ = glm::max(max_, point);
  }

  bool operator==(const BoundingBox &) const = default;
};

} // namespace vnb
