#include "ce/SwapRegretLearner.hpp"

#include "util/Asserts.hpp"

#include <Eigen/LU>

namespace ce {

SwapRegretLearner::SwapRegretLearner(int num_actions, double learning_rate)
    : learning_rate_(learning_rate),
      log_weights_(Eigen::MatrixXd::Zero(num_actions, num_actions)),
      strategy_(Eigen::VectorXd::Constant(num_actions, 1.0 / num_actions)) {
  RELEASE_ASSERT(num_actions >= 1, "bad num_actions {}", num_actions);
}

Eigen::MatrixXd SwapRegretLearner::copy_distributions() const {
  int n = num_actions();
  Eigen::MatrixXd q(n, n);
  for (int j = 0; j < n; ++j) {
    Eigen::RowVectorXd w =
      (log_weights_.row(j).array() - log_weights_.row(j).maxCoeff()).exp().matrix();
    q.row(j) = w / w.sum();
  }
  return q;
}

void SwapRegretLearner::update(const Eigen::VectorXd& rewards) {
  DEBUG_ASSERT(rewards.size() == num_actions(), "bad rewards size {}", rewards.size());

  // log_weights_(j, b) += eta * p(j) * r(b)
  log_weights_.noalias() += learning_rate_ * strategy_ * rewards.transpose();
  strategy_ = stationary_distribution(copy_distributions());
}

Eigen::VectorXd SwapRegretLearner::stationary_distribution(const Eigen::MatrixXd& q) {
  int n = q.rows();
  RELEASE_ASSERT(n >= 1 && q.cols() == n, "bad matrix shape {}x{}", q.rows(), q.cols());

  // Solve (q^T - I) p = 0 with one equation replaced by sum(p) = 1.
  Eigen::MatrixXd a = q.transpose() - Eigen::MatrixXd::Identity(n, n);
  a.row(n - 1).setOnes();
  Eigen::VectorXd b = Eigen::VectorXd::Zero(n);
  b[n - 1] = 1;

  Eigen::FullPivLU<Eigen::MatrixXd> lu(a);
  Eigen::VectorXd p;
  if (lu.isInvertible()) {
    p = lu.solve(b);
  } else {
    // Several recurrent classes. Cesaro-average the power iterates instead.
    constexpr int kNumPowerIterations = 1000;
    Eigen::RowVectorXd x = Eigen::RowVectorXd::Constant(n, 1.0 / n);
    Eigen::RowVectorXd sum = Eigen::RowVectorXd::Zero(n);
    for (int k = 0; k < kNumPowerIterations; ++k) {
      sum += x;
      x = x * q;
    }
    p = sum.transpose();
  }

  p = p.cwiseMax(0.0);
  double total = p.sum();
  RELEASE_ASSERT(total > 0, "degenerate stationary distribution");
  return p / total;
}

}  // namespace ce
