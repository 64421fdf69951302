#include "dsp.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/FFT>
#include <vector>

static constexpr float PI = 3.14159265359F;

// forward declaration of inner stft
static std::vector<std::vector<std::complex<float>>>
stft_inner(const std::vector<float> &waveform, const std::vector<float> &window,
           int nfft, int hop_size);

static std::vector<float>
istft_inner(const std::vector<std::vector<std::complex<float>>> &input,
            const std::vector<float> &window, int nfft, int hop_size);

std::vector<float> stemsep::hann_window(int window_size)
{
    // create a periodic hann window
    // by generating L+1 points and deleting the last one
    std::size_t N = window_size + 1;

    std::vector<float> window(N);
    auto floatN = (float)(N);

    for (std::size_t n = 0; n < N; ++n)
    {
        window[n] = 0.5F * (1.0F - cosf(2.0F * PI * (float)n / (floatN - 1)));
    }
    // delete the last element
    window.pop_back();
    return window;
}

// reflect padding, same as numpy/torch 'reflect' (edge sample not repeated)
static void pad_signal(std::vector<float> &signal, int n_fft)
{
    int pad = n_fft / 2;
    int n = signal.size();

    std::vector<float> padded(n + 2 * pad);
    for (int i = 0; i < pad; ++i)
    {
        padded[i] = signal[pad - i];
        padded[pad + n + i] = signal[n - 2 - i];
    }
    std::copy(signal.begin(), signal.end(), padded.begin() + pad);

    signal.swap(padded);
}

static void check_config(const stemsep::stft_config &cfg)
{
    if (cfg.n_fft <= 0 || cfg.n_fft % 2 != 0)
    {
        throw std::invalid_argument("n_fft must be a positive even number, got " +
                                    std::to_string(cfg.n_fft));
    }
    if (cfg.n_hop <= 0 || cfg.n_hop > cfg.n_fft)
    {
        throw std::invalid_argument("n_hop must be in (0, n_fft], got " +
                                    std::to_string(cfg.n_hop));
    }
}

int stemsep::stft_nb_frames(int nb_timesteps, const stft_config &cfg)
{
    int padded = cfg.center ? nb_timesteps + 2 * (cfg.n_fft / 2) : nb_timesteps;
    if (padded < cfg.n_fft)
    {
        return 0;
    }
    return 1 + (padded - cfg.n_fft) / cfg.n_hop;
}

Eigen::Tensor3dXcf stemsep::polar_to_complex(const Eigen::Tensor3dXf &magnitude,
                                             const Eigen::Tensor3dXf &phase)
{
    if (magnitude.dimension(0) != phase.dimension(0) ||
        magnitude.dimension(1) != phase.dimension(1) ||
        magnitude.dimension(2) != phase.dimension(2))
    {
        throw std::invalid_argument(
            "magnitude and phase must have the same dimensions");
    }

    // Get dimensions for convenience
    int dim1 = magnitude.dimension(0);
    int dim2 = magnitude.dimension(1);
    int dim3 = magnitude.dimension(2);

    // Initialize complex spectrogram tensor
    Eigen::Tensor3dXcf complex_spectrogram(dim1, dim2, dim3);

    // Iterate over all indices and apply the transformation
    for (int i = 0; i < dim1; ++i)
    {
        for (int j = 0; j < dim2; ++j)
        {
            for (int k = 0; k < dim3; ++k)
            {
                float mag = magnitude(i, j, k);
                float ph = phase(i, j, k);
                complex_spectrogram(i, j, k) = std::polar(mag, ph);
            }
        }
    }

    return complex_spectrogram;
}

Eigen::Tensor4dXcf stemsep::stft(const Eigen::Tensor3dXf &audio,
                                 const stft_config &cfg)
{
    check_config(cfg);

    const int nb_samples = audio.dimension(0);
    const int nb_channels = audio.dimension(1);
    const int nb_timesteps = audio.dimension(2);

    // reflect padding needs at least pad + 1 samples
    if (cfg.center && nb_timesteps <= cfg.n_fft / 2)
    {
        throw std::invalid_argument(
            "Waveform of " + std::to_string(nb_timesteps) +
            " samples is too short for reflect padding of " +
            std::to_string(cfg.n_fft / 2));
    }

    const int nb_frames = stft_nb_frames(nb_timesteps, cfg);
    if (nb_frames == 0)
    {
        throw std::invalid_argument(
            "Waveform of " + std::to_string(nb_timesteps) +
            " samples is shorter than n_fft = " + std::to_string(cfg.n_fft));
    }
    const int nb_bins = cfg.n_fft / 2 + 1;

    auto window = hann_window(cfg.n_fft);

    Eigen::Tensor4dXcf spec(nb_samples, nb_channels, nb_bins, nb_frames);

    // merge nb_samples and nb_channels for multichannel stft
#pragma omp parallel for collapse(2)
    for (int sample = 0; sample < nb_samples; ++sample)
    {
        for (int channel = 0; channel < nb_channels; ++channel)
        {
            std::vector<float> signal(nb_timesteps);
            for (int i = 0; i < nb_timesteps; ++i)
            {
                signal[i] = audio(sample, channel, i);
            }

            // apply padding equivalent to center padding with center=True
            // in torch.stft:
            // https://pytorch.org/docs/stable/generated/torch.stft.html
            if (cfg.center)
            {
                pad_signal(signal, cfg.n_fft);
            }

            auto frames = stft_inner(signal, window, cfg.n_fft, cfg.n_hop);

            for (int frame = 0; frame < nb_frames; ++frame)
            {
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    spec(sample, channel, bin, frame) = frames[frame][bin];
                }
            }
        }
    }

    return spec;
}

Eigen::Tensor3dXf stemsep::istft(const Eigen::Tensor4dXcf &spec,
                                 const stft_config &cfg, int length)
{
    check_config(cfg);

    const int nb_samples = spec.dimension(0);
    const int nb_channels = spec.dimension(1);
    const int nb_bins = spec.dimension(2);
    const int nb_frames = spec.dimension(3);

    if (nb_bins != cfg.n_fft / 2 + 1)
    {
        throw std::invalid_argument(
            "Spectrogram has " + std::to_string(nb_bins) +
            " bins, expected n_fft / 2 + 1 = " +
            std::to_string(cfg.n_fft / 2 + 1));
    }
    if (nb_frames < 1)
    {
        throw std::invalid_argument("Spectrogram has no frames");
    }

    auto window = hann_window(cfg.n_fft);

    int natural_length = cfg.n_fft + cfg.n_hop * (nb_frames - 1);
    if (cfg.center)
    {
        natural_length -= 2 * (cfg.n_fft / 2);
    }
    const int out_length = length >= 0 ? length : natural_length;

    Eigen::Tensor3dXf audio(nb_samples, nb_channels, out_length);
    audio.setZero();

#pragma omp parallel for collapse(2)
    for (int sample = 0; sample < nb_samples; ++sample)
    {
        for (int channel = 0; channel < nb_channels; ++channel)
        {
            std::vector<std::vector<std::complex<float>>> frames(
                nb_frames, std::vector<std::complex<float>>(nb_bins));

            for (int frame = 0; frame < nb_frames; ++frame)
            {
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    frames[frame][bin] = spec(sample, channel, bin, frame);
                }
            }

            std::vector<float> signal =
                istft_inner(frames, window, cfg.n_fft, cfg.n_hop);

            // drop the centering pad at the start, the tail is trimmed or
            // zero-extended to out_length
            int offset = cfg.center ? cfg.n_fft / 2 : 0;
            int ncopy = std::min(out_length, (int)signal.size() - offset);
            for (int i = 0; i < ncopy; ++i)
            {
                audio(sample, channel, i) = signal[offset + i];
            }
        }
    }

    return audio;
}

Eigen::Tensor4dXf stemsep::magnitude_spectrogram(const Eigen::Tensor4dXcf &spec,
                                                 float power, bool mono)
{
    const int nb_samples = spec.dimension(0);
    const int nb_channels = spec.dimension(1);
    const int nb_bins = spec.dimension(2);
    const int nb_frames = spec.dimension(3);

    const int nb_out_channels = mono ? 1 : nb_channels;

    // output permuted for the lstm: (nb_frames, nb_samples, nb_channels,
    // nb_bins)
    Eigen::Tensor4dXf mag(nb_frames, nb_samples, nb_out_channels, nb_bins);
    mag.setZero();

#pragma omp parallel for
    for (int frame = 0; frame < nb_frames; ++frame)
    {
        for (int sample = 0; sample < nb_samples; ++sample)
        {
            for (int channel = 0; channel < nb_channels; ++channel)
            {
                int out_channel = mono ? 0 : channel;
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    // (re^2 + im^2) ^ (power / 2)
                    float val = std::pow(std::norm(spec(sample, channel, bin, frame)),
                                         power / 2.0f);
                    mag(frame, sample, out_channel, bin) += val;
                }
            }
        }
    }

    // downmix in the mag domain
    if (mono && nb_channels > 1)
    {
        mag = mag / (float)nb_channels;
    }

    return mag;
}

static Eigen::FFT<float> get_fft_cfg()
{
    Eigen::FFT<float> cfg;
    cfg.SetFlag(Eigen::FFT<float>::Speedy);
    cfg.SetFlag(Eigen::FFT<float>::HalfSpectrum);
    cfg.SetFlag(Eigen::FFT<float>::Unscaled);
    return cfg;
}

static std::vector<std::vector<std::complex<float>>>
stft_inner(const std::vector<float> &waveform, const std::vector<float> &window,
           int nfft, int hop_size)
{
    // Check input
    if ((int)waveform.size() < nfft || (int)window.size() != nfft)
    {
        throw std::invalid_argument(
            "Waveform size must be >= nfft, window size must be == nfft.");
    }

    // Output container
    std::vector<std::vector<std::complex<float>>> output;

    // Create an FFT object
    Eigen::FFT<float> cfg = get_fft_cfg();

    std::vector<float> windowed(nfft);
    std::vector<std::complex<float>> spectrum(nfft / 2 + 1);

    // Loop over the waveform with a stride of hop_size
    for (std::size_t start = 0; start <= waveform.size() - nfft;
         start += hop_size)
    {
        // Apply window and run FFT
        for (int i = 0; i < nfft; ++i)
        {
            windowed[i] = waveform[start + i] * window[i];
        }
        cfg.fwd(spectrum, windowed);

        // Add the spectrum to output
        output.push_back(spectrum);
    }

    return output;
}

static std::vector<float>
istft_inner(const std::vector<std::vector<std::complex<float>>> &input,
            const std::vector<float> &window, int nfft, int hop_size)
{
    // Check input
    if (input.empty() || (int)input[0].size() != nfft / 2 + 1 ||
        (int)window.size() != nfft)
    {
        throw std::invalid_argument("Input size is not compatible with nfft "
                                    "or window size does not match nfft.");
    }

    // Compute the window normalization factor
    // using librosa window_sumsquare to compute the squared window
    // https://github.com/librosa/librosa/blob/main/librosa/filters.py#L1545

    int win_n = nfft + hop_size * (input.size() - 1);
    std::vector<float> x(win_n, 0.0f);

    for (int i = 0; i < (int)input.size(); ++i)
    {
        auto sample = i * hop_size;
        for (int j = sample; j < std::min(win_n, sample + nfft); ++j)
        {
            x[j] += window[j - sample] * window[j - sample];
        }
    }

    // Output container
    std::vector<float> output(win_n, 0.0f);

    // Create an FFT object
    Eigen::FFT<float> cfg = get_fft_cfg();

    std::vector<float> waveform(nfft);

    // Loop over the input with a stride of (hop_size)
    for (std::size_t frame = 0; frame < input.size(); ++frame)
    {
        std::size_t start = frame * hop_size;

        // Run iFFT
        cfg.inv(waveform, input[frame]);

        // Apply window and add to output
        for (int i = 0; i < nfft; ++i)
        {
            output[start + i] += waveform[i] * window[i] / float(nfft);
        }
    }

    for (int i = 0; i < win_n; ++i)
    {
        // x[i] is the sum of squared window values
        // https://github.com/librosa/librosa/blob/main/librosa/core/spectrum.py#L613
        // 1e-8f is a small number to avoid division by zero
        output[i] /= (x[i] + 1e-8f);
    }

    return output;
}
