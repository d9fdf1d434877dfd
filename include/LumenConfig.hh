// Compile-time defaults shared by the tracer and the scheduler

#pragma once

#include <cstddef>

namespace Lumen {
  constexpr double PI = 3.14159265358979;

  // lower bound of every intersection query, suppresses shadow acne
  constexpr double EPSILON = 1e-3;

  constexpr int MAX_BOUNCES = 50;

  // rows rendered by one work item of the scheduler
  constexpr unsigned LINES_PER_WORK = 50;

  constexpr int MAX_REJECTION_TRIES = 1000;
} // namespace Lumen
