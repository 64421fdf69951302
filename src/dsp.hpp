#ifndef DSP_HPP
#define DSP_HPP

#include <Eigen/Dense>
#include <complex>
#include <string>
#include <tensor.hpp>
#include <unsupported/Eigen/FFT>
#include <vector>

namespace stemsep
{

const int SUPPORTED_SAMPLE_RATE = 44100;
const int FFT_WINDOW_SIZE = 4096;

const int FFT_HOP_SIZE = 1024; // 25% hop i.e. 75% overlap

struct stft_config
{
    int n_fft = FFT_WINDOW_SIZE;
    int n_hop = FFT_HOP_SIZE;
    bool center = true;

    bool operator==(const stft_config &other) const
    {
        return n_fft == other.n_fft && n_hop == other.n_hop &&
               center == other.center;
    }
    bool operator!=(const stft_config &other) const
    {
        return !(*this == other);
    }
};

// periodic hann window of length window_size
std::vector<float> hann_window(int window_size);

// number of stft frames produced for a waveform of nb_timesteps samples
int stft_nb_frames(int nb_timesteps, const stft_config &cfg);

// combine magnitude and phase spectrograms into complex
Eigen::Tensor3dXcf polar_to_complex(const Eigen::Tensor3dXf &magnitude,
                                    const Eigen::Tensor3dXf &phase);

// waveform: (nb_samples, nb_channels, nb_timesteps)
// returns:  (nb_samples, nb_channels, nb_bins, nb_frames)
Eigen::Tensor4dXcf stft(const Eigen::Tensor3dXf &audio,
                        const stft_config &cfg = stft_config());

// inverse of stft, length < 0 keeps the natural length of the
// overlap-add, otherwise the output is trimmed or zero-extended to length
Eigen::Tensor3dXf istft(const Eigen::Tensor4dXcf &spec,
                        const stft_config &cfg = stft_config(),
                        int length = -1);

// complex stft (nb_samples, nb_channels, nb_bins, nb_frames) to
// magnitude ** power, permuted to (nb_frames, nb_samples, nb_channels,
// nb_bins); mono averages the channels but keeps the axis
Eigen::Tensor4dXf magnitude_spectrogram(const Eigen::Tensor4dXcf &spec,
                                        float power = 1.0f,
                                        bool mono = false);

} // namespace stemsep

#endif // DSP_HPP
