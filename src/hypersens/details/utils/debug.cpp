#include "hypersens/details/utils/debug.hpp"

#include <range/v3/all.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace hypersens {
  namespace views = ranges::views;

  std::chrono::time_point<std::chrono::steady_clock> tic() {
    return std::chrono::steady_clock::now();
  }

  double toc(std::chrono::time_point<std::chrono::steady_clock> const& tic) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - tic).count();
  }

  std::string vectorToString(Eigen::VectorXd const& v) {
    auto entries = views::ints(0, static_cast<int>(v.size())) |
      views::transform([&v](int i) { return fmt::format("{:.6g}", v(i)); }) |
      ranges::to<std::vector<std::string>>;
    return fmt::format("[{}]", fmt::join(entries, ", "));
  }

  std::string ordersToString(std::vector<int> const& orders) {
    return fmt::format("[{}]", fmt::join(orders, ", "));
  }
}  // namespace hypersens
