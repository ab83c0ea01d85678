#pragma once
#include <Eigen/Dense>
namespace skymodel {
	using Real    = double;
	using Index   = Eigen::Index;
	using Vector  = Eigen::VectorXd;
	using Matrix  = Eigen::MatrixXd;
	using Array2D = Eigen::ArrayXXd;     // (stokes, pixel) layout everywhere
} // namespace skymodel
