#include "wiener.hpp"
#include "dsp.hpp"
#include "errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <complex>
#include <string>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

// the EM step inverts nearly singular covariances for coherent sources,
// so it runs in double precision
typedef std::complex<double> cdouble;
typedef Eigen::Tensor<cdouble, 4> Tensor4dXcd;
typedef Eigen::Tensor<cdouble, 3> Tensor3dXcd;

// Function to compute the absolute maximum value of the mixture
static float find_max_abs(const Eigen::Tensor3dXcf &data, float scale_factor)
{
    float max_val = -1.0f;
    for (int i = 0; i < data.dimension(0); ++i)
    {
        for (int j = 0; j < data.dimension(1); ++j)
        {
            for (int k = 0; k < data.dimension(2); ++k)
            {
                max_val = std::max(max_val, std::abs(data(i, j, k)));
            }
        }
    }
    return std::max(1.0f, max_val / scale_factor);
}

Eigen::Tensor4dXcf stemsep::wiener(const Eigen::Tensor4dXf &targets_spectrograms,
                                   const Eigen::Tensor3dXcf &mix_stft,
                                   int iterations, bool softmask, bool residual,
                                   float scale_factor, float eps)
{
    const int nb_frames = mix_stft.dimension(0);
    const int nb_bins = mix_stft.dimension(1);
    const int nb_channels = mix_stft.dimension(2);
    const int nb_v_channels = targets_spectrograms.dimension(2);
    const int nb_sources = targets_spectrograms.dimension(3);

    if (targets_spectrograms.dimension(0) != nb_frames ||
        targets_spectrograms.dimension(1) != nb_bins ||
        (nb_v_channels != 1 && nb_v_channels != nb_channels))
    {
        throw ShapeError(
            "target spectrograms (" +
            std::to_string(targets_spectrograms.dimension(0)) + ", " +
            std::to_string(targets_spectrograms.dimension(1)) + ", " +
            std::to_string(nb_v_channels) +
            ") do not match the mixture stft (" + std::to_string(nb_frames) +
            ", " + std::to_string(nb_bins) + ", " +
            std::to_string(nb_channels) + ")");
    }
    if (iterations < 0)
    {
        throw ConfigurationError("wiener iterations must be >= 0");
    }

    const int nb_out = nb_sources + (residual ? 1 : 0);
    Eigen::Tensor4dXcf y(nb_frames, nb_bins, nb_channels, nb_out);
    y.setZero();

    if (softmask)
    {
        // mix_stft * v_j / (eps + sum_k v_k)
        for (int frame = 0; frame < nb_frames; ++frame)
        {
            for (int bin = 0; bin < nb_bins; ++bin)
            {
                for (int channel = 0; channel < nb_channels; ++channel)
                {
                    int vc = nb_v_channels == 1 ? 0 : channel;
                    float total = eps;
                    for (int source = 0; source < nb_sources; ++source)
                    {
                        total += targets_spectrograms(frame, bin, vc, source);
                    }
                    for (int source = 0; source < nb_sources; ++source)
                    {
                        y(frame, bin, channel, source) =
                            mix_stft(frame, bin, channel) *
                            (targets_spectrograms(frame, bin, vc, source) /
                             total);
                    }
                }
            }
        }
    }
    else
    {
        // magnitude estimates with the phase of the mixture
        Eigen::Tensor3dXf mix_phase = mix_stft.unaryExpr(
            [](const std::complex<float> &c) { return std::arg(c); });

        for (int source = 0; source < nb_sources; ++source)
        {
            Eigen::Tensor3dXf magnitude(nb_frames, nb_bins, nb_channels);
            for (int frame = 0; frame < nb_frames; ++frame)
            {
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    for (int channel = 0; channel < nb_channels; ++channel)
                    {
                        int vc = nb_v_channels == 1 ? 0 : channel;
                        magnitude(frame, bin, channel) =
                            targets_spectrograms(frame, bin, vc, source);
                    }
                }
            }

            Eigen::Tensor3dXcf y_source = polar_to_complex(magnitude, mix_phase);
            y.chip(source, 3) = y_source;
        }
    }

    if (residual)
    {
        // mixture minus the sum of all other estimates, not clamped
        for (int frame = 0; frame < nb_frames; ++frame)
        {
            for (int bin = 0; bin < nb_bins; ++bin)
            {
                for (int channel = 0; channel < nb_channels; ++channel)
                {
                    std::complex<float> acc = mix_stft(frame, bin, channel);
                    for (int source = 0; source < nb_sources; ++source)
                    {
                        acc -= y(frame, bin, channel, source);
                    }
                    y(frame, bin, channel, nb_sources) = acc;
                }
            }
        }
    }

    if (iterations == 0)
    {
        return y;
    }

    // we need to refine the estimates. Scales down the estimates for
    // numerical stability
    const float max_abs = find_max_abs(mix_stft, scale_factor);

    Eigen::Tensor3dXcf x_scaled = mix_stft.unaryExpr(
        [max_abs](const std::complex<float> &c) { return c / max_abs; });
    Eigen::Tensor4dXcf y_scaled = y.unaryExpr(
        [max_abs](const std::complex<float> &c) { return c / max_abs; });

    Eigen::Tensor4dXcf refined =
        expectation_maximization(y_scaled, x_scaled, iterations, eps);

    // scale y by max_abs again
    return refined.unaryExpr(
        [max_abs](const std::complex<float> &c) { return c * max_abs; });
}

Eigen::Tensor4dXcf stemsep::expectation_maximization(const Eigen::Tensor4dXcf &y_in,
                                                     const Eigen::Tensor3dXcf &x_in,
                                                     int iterations, float eps)
{
    const int nb_frames = y_in.dimension(0);
    const int nb_bins = y_in.dimension(1);
    const int nb_channels = y_in.dimension(2);
    const int nb_sources = y_in.dimension(3);

    if (x_in.dimension(0) != nb_frames || x_in.dimension(1) != nb_bins ||
        x_in.dimension(2) != nb_channels)
    {
        throw ShapeError("source estimates and mixture disagree in shape");
    }

    Tensor4dXcd y = y_in.unaryExpr(
        [](const std::complex<float> &c) { return cdouble(c); });
    const Tensor3dXcd x = x_in.unaryExpr(
        [](const std::complex<float> &c) { return cdouble(c); });

    const Eigen::MatrixXcd regularization =
        std::sqrt((double)eps) *
        Eigen::MatrixXcd::Identity(nb_channels, nb_channels);

    // power spectral density of each source
    Eigen::Tensor<double, 3> v(nb_frames, nb_bins, nb_sources);

    // spatial covariance matrices R[source][bin]
    std::vector<std::vector<Eigen::MatrixXcd>> R(
        nb_sources, std::vector<Eigen::MatrixXcd>(nb_bins));

    for (int it = 0; it < iterations; ++it)
    {
        // update the PSD as the average spectrogram over channels
#pragma omp parallel for
        for (int frame = 0; frame < nb_frames; ++frame)
        {
            for (int bin = 0; bin < nb_bins; ++bin)
            {
                for (int source = 0; source < nb_sources; ++source)
                {
                    double sum_square = 0.0;
                    for (int channel = 0; channel < nb_channels; ++channel)
                    {
                        sum_square += std::norm(y(frame, bin, channel, source));
                    }
                    v(frame, bin, source) = sum_square / nb_channels;
                }
            }
        }

        // update the spatial covariance matrices
        for (int source = 0; source < nb_sources; ++source)
        {
#pragma omp parallel for
            for (int bin = 0; bin < nb_bins; ++bin)
            {
                Eigen::MatrixXcd acc =
                    Eigen::MatrixXcd::Zero(nb_channels, nb_channels);
                Eigen::VectorXcd y_j(nb_channels);
                double weight = eps;

                for (int frame = 0; frame < nb_frames; ++frame)
                {
                    for (int channel = 0; channel < nb_channels; ++channel)
                    {
                        y_j(channel) = y(frame, bin, channel, source);
                    }
                    acc += y_j * y_j.adjoint();
                    weight += v(frame, bin, source);
                }

                R[source][bin] = acc / weight;
            }
        }

        // separate the sources
#pragma omp parallel for
        for (int frame = 0; frame < nb_frames; ++frame)
        {
            Eigen::MatrixXcd Cxx(nb_channels, nb_channels);
            Eigen::MatrixXcd inv_Cxx(nb_channels, nb_channels);
            Eigen::MatrixXcd gain(nb_channels, nb_channels);
            Eigen::VectorXcd x_tf(nb_channels);
            Eigen::VectorXcd y_tf(nb_channels);

            for (int bin = 0; bin < nb_bins; ++bin)
            {
                // mix covariance matrix
                Cxx = regularization;
                for (int source = 0; source < nb_sources; ++source)
                {
                    Cxx += v(frame, bin, source) * R[source][bin];
                }
                inv_Cxx = Cxx.inverse();

                for (int channel = 0; channel < nb_channels; ++channel)
                {
                    x_tf(channel) = x(frame, bin, channel);
                }

                for (int source = 0; source < nb_sources; ++source)
                {
                    gain = v(frame, bin, source) * (R[source][bin] * inv_Cxx);
                    y_tf = gain * x_tf;
                    for (int channel = 0; channel < nb_channels; ++channel)
                    {
                        y(frame, bin, channel, source) = y_tf(channel);
                    }
                }
            }
        }
    }

    return y.unaryExpr([](const cdouble &c) {
        return std::complex<float>((float)c.real(), (float)c.imag());
    });
}
