#pragma once

#include <Eigen/Dense>

using EMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using EVector = Eigen::VectorXf;
