#include "ce/GameType.hpp"

namespace ce {

namespace game_type {

template <int Rank>
Explicit Explicit::from_tensors(const std::vector<Eigen::Tensor<double, Rank>>& tensors) {
  Explicit out;
  for (const auto& tensor : tensors) {
    action_count_vec_t shape;
    for (int d = 0; d < Rank; ++d) {
      shape.push_back(tensor.dimension(d));
    }
    out.shapes.push_back(shape);
    out.payoffs.push_back(Eigen::Map<const Eigen::VectorXd>(tensor.data(), tensor.size()));
  }
  return out;
}

}  // namespace game_type

inline std::string game_type_name(const GameType& game_type) {
  return std::visit([](const auto& t) { return std::string(t.kName); }, game_type);
}

}  // namespace ce
