#pragma once

#include <Eigen/Dense>

#include <chrono>
#include <string>
#include <vector>

namespace hypersens {
  std::chrono::time_point<std::chrono::steady_clock> tic();
  double toc(std::chrono::time_point<std::chrono::steady_clock> const& tic);

  std::string vectorToString(Eigen::VectorXd const& v);
  std::string ordersToString(std::vector<int> const& orders);
}  // namespace hypersens
