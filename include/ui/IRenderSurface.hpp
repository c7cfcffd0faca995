#pragma once
#include "model/Dashboard.hpp"

namespace devmon::ui {

// Draws a frame from a read-only view of the dashboard.
class IRenderSurface {
public:
  virtual ~IRenderSurface() = default;
  virtual void render(const devmon::model::DashboardState& state) = 0;
};

} // namespace devmon::ui
