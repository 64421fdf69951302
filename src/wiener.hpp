#ifndef WIENER_HPP
#define WIENER_HPP

#include "dsp.hpp"
#include <tensor.hpp>

namespace stemsep
{

const float WIENER_SCALE_FACTOR = 10.0f;
const float WIENER_EPS = 1e-10f;

// targets_spectrograms: (nb_frames, nb_bins, {1, nb_channels}, nb_sources)
//     non-negative magnitude estimates
// mix_stft: (nb_frames, nb_bins, nb_channels)
// returns (nb_frames, nb_bins, nb_channels, nb_sources [+ 1 if residual])
Eigen::Tensor4dXcf wiener(const Eigen::Tensor4dXf &targets_spectrograms,
                          const Eigen::Tensor3dXcf &mix_stft,
                          int iterations = 1, bool softmask = false,
                          bool residual = false,
                          float scale_factor = WIENER_SCALE_FACTOR,
                          float eps = WIENER_EPS);

// multichannel gaussian model refined with EM
// y: initial source estimates (nb_frames, nb_bins, nb_channels, nb_sources)
// x: mixture (nb_frames, nb_bins, nb_channels)
Eigen::Tensor4dXcf expectation_maximization(const Eigen::Tensor4dXcf &y,
                                            const Eigen::Tensor3dXcf &x,
                                            int iterations = 2,
                                            float eps = WIENER_EPS);

} // namespace stemsep

#endif // WIENER_HPP
