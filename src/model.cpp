#include "model.hpp"
#include "dsp.hpp"
#include "errors.hpp"
#include "lstm.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

static constexpr float BN_EPS = 1e-5F;

static stemsep::batch_norm identity_batch_norm(int size)
{
    stemsep::batch_norm bn;
    bn.weight = Eigen::VectorXf::Ones(size);
    bn.bias = Eigen::VectorXf::Zero(size);
    bn.running_mean = Eigen::VectorXf::Zero(size);
    bn.running_var = Eigen::VectorXf::Ones(size);
    return bn;
}

// normalize every feature (column) with the running statistics
static void batch_norm_forward(Eigen::MatrixXf &x, const stemsep::batch_norm &bn)
{
    Eigen::RowVectorXf scale =
        (bn.weight.array() / (bn.running_var.array() + BN_EPS).sqrt())
            .matrix()
            .transpose();
    Eigen::RowVectorXf shift =
        bn.bias.transpose() -
        bn.running_mean.transpose().cwiseProduct(scale);

    x = ((x.array().rowwise() * scale.array()).rowwise() + shift.array())
            .matrix();
}

int stemsep::bandwidth_to_max_bin(int sample_rate, int n_fft, float bandwidth)
{
    // equivalent of np.linspace(0, rate / 2, n_fft // 2 + 1)
    const int nb_output_bins = n_fft / 2 + 1;
    const double step = (sample_rate / 2.0) / (nb_output_bins - 1);

    int max_bin = 0;
    for (int bin = 0; bin < nb_output_bins; ++bin)
    {
        if (bin * step <= bandwidth)
        {
            max_bin = bin + 1;
        }
    }
    return max_bin;
}

stemsep::umx_model stemsep::init_umx_model(const umx_hparams &hparams)
{
    if (hparams.nb_channels < 1 || hparams.hidden_size < 1 ||
        hparams.nb_layers < 1)
    {
        throw ConfigurationError(
            "umx model needs at least one channel, hidden unit and layer");
    }
    if (!hparams.unidirectional && hparams.hidden_size % 2 != 0)
    {
        throw ConfigurationError(
            "bidirectional umx model needs an even hidden_size, got " +
            std::to_string(hparams.hidden_size));
    }

    umx_model model;
    model.hparams = hparams;

    model.stft.n_fft = hparams.n_fft;
    model.stft.n_hop = hparams.n_hop;
    model.stft.center = true;

    model.nb_output_bins = hparams.n_fft / 2 + 1;
    model.nb_bins = hparams.max_bin > 0
                        ? std::min(hparams.max_bin, model.nb_output_bins)
                        : model.nb_output_bins;

    const int hidden = hparams.hidden_size;
    const int nb_channels = hparams.nb_channels;

    model.input_mean = Eigen::VectorXf::Zero(model.nb_bins);
    model.input_scale = Eigen::VectorXf::Ones(model.nb_bins);

    model.fc1_w = Eigen::MatrixXf::Zero(hidden, model.nb_bins * nb_channels);
    model.bn1 = identity_batch_norm(hidden);

    const int lstm_hidden = hparams.unidirectional ? hidden : hidden / 2;
    model.lstm = init_lstm(hidden, lstm_hidden, hparams.nb_layers,
                           !hparams.unidirectional);

    // the lstm output is concatenated with its input (skip connection)
    model.fc2_w = Eigen::MatrixXf::Zero(hidden, 2 * hidden);
    model.bn2 = identity_batch_norm(hidden);

    model.fc3_w =
        Eigen::MatrixXf::Zero(model.nb_output_bins * nb_channels, hidden);
    model.bn3 = identity_batch_norm(model.nb_output_bins * nb_channels);

    model.output_scale = Eigen::VectorXf::Ones(model.nb_output_bins);
    model.output_mean = Eigen::VectorXf::Ones(model.nb_output_bins);

    return model;
}

void stemsep::set_input_statistics(umx_model &model, const Eigen::VectorXf &mean,
                                   const Eigen::VectorXf &scale)
{
    if (mean.size() < model.nb_bins || scale.size() < model.nb_bins)
    {
        throw std::invalid_argument(
            "input statistics must cover at least " +
            std::to_string(model.nb_bins) + " bins");
    }
    model.input_mean = -mean.head(model.nb_bins);
    model.input_scale = scale.head(model.nb_bins).cwiseInverse();
}

void stemsep::freeze_umx_model(umx_model &model) { model.frozen = true; }

static Eigen::Tensor4dXf umx_inference(const stemsep::umx_model &model,
                                       const Eigen::Tensor4dXf &mix)
{
    const int nb_frames = mix.dimension(0);
    const int nb_samples = mix.dimension(1);
    const int nb_channels = mix.dimension(2);
    const int nb_spec_bins = mix.dimension(3);

    if (nb_channels != model.hparams.nb_channels ||
        nb_spec_bins != model.nb_output_bins)
    {
        throw stemsep::ShapeError(
            "umx model expects " + std::to_string(model.hparams.nb_channels) +
            " channels and " + std::to_string(model.nb_output_bins) +
            " bins, got " + std::to_string(nb_channels) + " channels and " +
            std::to_string(nb_spec_bins) + " bins");
    }

    const int nb_bins = model.nb_bins;
    const int nb_output_bins = model.nb_output_bins;
    const int rows = nb_frames * nb_samples;

    // crop, shift and scale, flattened to
    // (nb_frames*nb_samples, nb_channels*nb_bins)
    Eigen::MatrixXf x(rows, nb_channels * nb_bins);

#pragma omp parallel for
    for (int frame = 0; frame < nb_frames; ++frame)
    {
        for (int sample = 0; sample < nb_samples; ++sample)
        {
            for (int channel = 0; channel < nb_channels; ++channel)
            {
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    x(frame * nb_samples + sample, channel * nb_bins + bin) =
                        (mix(frame, sample, channel, bin) +
                         model.input_mean(bin)) *
                        model.input_scale(bin);
                }
            }
        }
    }

    // encode to (nb_frames*nb_samples, hidden_size)
    Eigen::MatrixXf h = x * model.fc1_w.transpose();
    batch_norm_forward(h, model.bn1);

    // squash range to [-1, 1]
    h = h.array().tanh().matrix();

    Eigen::MatrixXf lstm_out =
        stemsep::lstm_forward(model.lstm, h, nb_frames, nb_samples);

    // lstm skip connection
    Eigen::MatrixXf cat(rows, h.cols() + lstm_out.cols());
    cat << h, lstm_out;

    // first dense stage + batch norm
    Eigen::MatrixXf y = cat * model.fc2_w.transpose();
    batch_norm_forward(y, model.bn2);

    y = y.cwiseMax(0.0f);

    // second dense stage + batch norm
    y = y * model.fc3_w.transpose();
    batch_norm_forward(y, model.bn3);

    // reshape back to (nb_frames, nb_samples, nb_channels, nb_output_bins),
    // apply output scaling, relu and use as a gain on the full-band mix
    Eigen::Tensor4dXf out(nb_frames, nb_samples, nb_channels, nb_output_bins);

#pragma omp parallel for
    for (int frame = 0; frame < nb_frames; ++frame)
    {
        for (int sample = 0; sample < nb_samples; ++sample)
        {
            for (int channel = 0; channel < nb_channels; ++channel)
            {
                for (int bin = 0; bin < nb_output_bins; ++bin)
                {
                    float gain = y(frame * nb_samples + sample,
                                   channel * nb_output_bins + bin) *
                                     model.output_scale(bin) +
                                 model.output_mean(bin);
                    out(frame, sample, channel, bin) =
                        std::max(gain, 0.0f) * mix(frame, sample, channel, bin);
                }
            }
        }
    }

    return out;
}

Eigen::Tensor4dXf stemsep::umx_forward(const umx_model &model,
                                       const Eigen::Tensor3dXf &audio)
{
    if (model.hparams.input_is_spectrogram)
    {
        throw std::invalid_argument(
            "umx model was built for spectrogram input, got a waveform");
    }

    Eigen::Tensor4dXcf spec = stft(audio, model.stft);
    Eigen::Tensor4dXf mix = magnitude_spectrogram(
        spec, model.hparams.power, model.hparams.nb_channels == 1);

    return umx_inference(model, mix);
}

Eigen::Tensor4dXf stemsep::umx_forward(const umx_model &model,
                                       const Eigen::Tensor4dXf &spectrogram)
{
    if (!model.hparams.input_is_spectrogram)
    {
        throw std::invalid_argument(
            "umx model was built for waveform input, got a spectrogram");
    }

    return umx_inference(model, spectrogram);
}

stemsep::UmxEstimator::UmxEstimator(umx_model model) : model_(std::move(model))
{
}

Eigen::Tensor4dXf
stemsep::UmxEstimator::estimate(const Eigen::Tensor3dXf &audio) const
{
    return umx_forward(model_, audio);
}
