#ifndef AUDIO_HPP
#define AUDIO_HPP

#include "dsp.hpp"
#include <Eigen/Dense>
#include <string>

namespace stemsep
{

// waveform = 2d: (channels, samples), mono files are duplicated to stereo
Eigen::MatrixXf load_audio(const std::string &filename);

void write_audio_file(const Eigen::MatrixXf &waveform,
                      const std::string &filename,
                      int sample_rate = SUPPORTED_SAMPLE_RATE);

// (channels, samples) <-> (1, channels, samples) for the separator
Eigen::Tensor3dXf to_batch(const Eigen::MatrixXf &waveform);
Eigen::MatrixXf from_batch(const Eigen::Tensor3dXf &audio, int sample = 0);

} // namespace stemsep

#endif // AUDIO_HPP
