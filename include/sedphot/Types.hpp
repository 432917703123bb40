#pragma once
#include <Eigen/Dense>
namespace sedphot {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
	using Index  = Eigen::Index;
} // namespace sedphot
