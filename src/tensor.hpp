#ifndef TENSOR_HPP
#define TENSOR_HPP

#include <Eigen/Dense>
#include <complex>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

namespace Eigen
{
// define Tensor3dXf, Tensor3dXcf for waveforms, spectrograms etc.
typedef Tensor<float, 3> Tensor3dXf;
typedef Tensor<std::complex<float>, 3> Tensor3dXcf;

typedef Tensor<float, 4> Tensor4dXf;
typedef Tensor<std::complex<float>, 4> Tensor4dXcf;

// source-stacked spectrograms for the wiener filter
typedef Tensor<float, 5> Tensor5dXf;
typedef Tensor<std::complex<float>, 5> Tensor5dXcf;
} // namespace Eigen

#endif // TENSOR_HPP
