// gtest cases for the lstm and the umx magnitude estimator

#include "dsp.hpp"
#include "errors.hpp"
#include "lstm.hpp"
#include "model.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>

static Eigen::Tensor3dXf random_waveform(int nb_samples, int nb_channels,
                                         int nb_timesteps)
{
    Eigen::Tensor3dXf audio(nb_samples, nb_channels, nb_timesteps);
    for (int s = 0; s < nb_samples; ++s)
    {
        for (int c = 0; c < nb_channels; ++c)
        {
            for (int i = 0; i < nb_timesteps; ++i)
            {
                audio(s, c, i) = 2.0f * (float)rand() / (float)RAND_MAX - 1.0f;
            }
        }
    }
    return audio;
}

// a small network so the tests stay fast
static stemsep::umx_hparams small_hparams()
{
    stemsep::umx_hparams hparams;
    hparams.n_fft = 512;
    hparams.n_hop = 128;
    hparams.hidden_size = 16;
    hparams.nb_layers = 2;
    return hparams;
}

static float sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }

TEST(LSTM, SingleStepMatchesHandComputed)
{
    stemsep::lstm_params lstm = stemsep::init_lstm(1, 1, 1, false);
    lstm.layers[0][0].w_ih.setOnes();

    Eigen::MatrixXf input(1, 1);
    input << 1.0f;

    Eigen::MatrixXf out = stemsep::lstm_forward(lstm, input, 1, 1);

    // all four gates see a pre-activation of 1
    float c = sigmoid(1.0f) * std::tanh(1.0f);
    float h = sigmoid(1.0f) * std::tanh(c);

    ASSERT_EQ(out.rows(), 1);
    ASSERT_EQ(out.cols(), 1);
    EXPECT_NEAR(out(0, 0), h, 1e-6);
}

TEST(LSTM, ReverseDirectionRunsBackwards)
{
    stemsep::lstm_params lstm = stemsep::init_lstm(1, 1, 1, true);
    lstm.layers[0][1].w_ih.setOnes();

    // frame 0 is silent, frame 1 excites the reverse cell first
    Eigen::MatrixXf input(2, 1);
    input << 0.0f, 1.0f;

    Eigen::MatrixXf out = stemsep::lstm_forward(lstm, input, 2, 1);

    ASSERT_EQ(out.rows(), 2);
    ASSERT_EQ(out.cols(), 2);

    // the forward cell has zero weights and never leaves its zero state
    EXPECT_NEAR(out(0, 0), 0.0f, 1e-7);
    EXPECT_NEAR(out(1, 0), 0.0f, 1e-7);

    float c1 = sigmoid(1.0f) * std::tanh(1.0f);
    float h1 = sigmoid(1.0f) * std::tanh(c1);
    EXPECT_NEAR(out(1, 1), h1, 1e-6);

    // zero gates at frame 0: the cell state decays by the forget gate
    float c0 = 0.5f * c1;
    float h0 = 0.5f * std::tanh(c0);
    EXPECT_NEAR(out(0, 1), h0, 1e-6);
}

TEST(LSTM, BatchedSamplesAreIndependent)
{
    stemsep::lstm_params lstm = stemsep::init_lstm(3, 4, 2, true);
    for (auto &layer : lstm.layers)
    {
        for (auto &cell : layer)
        {
            cell.w_ih.setRandom();
            cell.w_hh.setRandom();
            cell.b_ih.setRandom();
        }
    }

    const int nb_frames = 5;
    Eigen::MatrixXf a = Eigen::MatrixXf::Random(nb_frames, 3);
    Eigen::MatrixXf b = Eigen::MatrixXf::Random(nb_frames, 3);

    // interleave frame-major: row = frame * nb_samples + sample
    Eigen::MatrixXf both(2 * nb_frames, 3);
    for (int t = 0; t < nb_frames; ++t)
    {
        both.row(2 * t) = a.row(t);
        both.row(2 * t + 1) = b.row(t);
    }

    Eigen::MatrixXf out_a = stemsep::lstm_forward(lstm, a, nb_frames, 1);
    Eigen::MatrixXf out_b = stemsep::lstm_forward(lstm, b, nb_frames, 1);
    Eigen::MatrixXf out = stemsep::lstm_forward(lstm, both, nb_frames, 2);

    ASSERT_EQ(out.cols(), 8);
    for (int t = 0; t < nb_frames; ++t)
    {
        for (int k = 0; k < 8; ++k)
        {
            EXPECT_NEAR(out(2 * t, k), out_a(t, k), 1e-5);
            EXPECT_NEAR(out(2 * t + 1, k), out_b(t, k), 1e-5);
        }
    }
}

TEST(LSTM, TopologyAndShapeChecks)
{
    stemsep::lstm_params lstm = stemsep::init_lstm(8, 4, 3, true);

    ASSERT_EQ(lstm.layers.size(), 3u);
    EXPECT_EQ(lstm.layers[0][0].w_ih.rows(), 16);
    EXPECT_EQ(lstm.layers[0][0].w_ih.cols(), 8);
    EXPECT_EQ(lstm.layers[1][1].w_ih.cols(), 8);
    EXPECT_EQ(lstm.layers[2][0].w_hh.cols(), 4);
    EXPECT_FLOAT_EQ(lstm.dropout, 0.4f);

    EXPECT_FLOAT_EQ(stemsep::init_lstm(8, 4, 1, true).dropout, 0.0f);

    Eigen::MatrixXf wrong = Eigen::MatrixXf::Zero(6, 7);
    EXPECT_THROW(stemsep::lstm_forward(lstm, wrong, 3, 2), std::invalid_argument);
}

TEST(UMX_Model, BandwidthToMaxBin)
{
    EXPECT_EQ(stemsep::bandwidth_to_max_bin(44100, 4096, 16000.0f), 1487);
    EXPECT_EQ(stemsep::bandwidth_to_max_bin(44100, 4096, 0.0f), 1);
    EXPECT_EQ(stemsep::bandwidth_to_max_bin(44100, 4096, 22050.0f), 2049);
}

TEST(UMX_Model, InitShapes)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.max_bin = 100;

    stemsep::umx_model model = stemsep::init_umx_model(hparams);

    EXPECT_EQ(model.nb_output_bins, 257);
    EXPECT_EQ(model.nb_bins, 100);
    EXPECT_EQ(model.fc1_w.rows(), 16);
    EXPECT_EQ(model.fc1_w.cols(), 200);
    EXPECT_EQ(model.fc2_w.cols(), 32);
    EXPECT_EQ(model.fc3_w.rows(), 514);
    EXPECT_EQ(model.lstm.hidden_size, 8);
    EXPECT_EQ(model.input_mean.size(), 100);
    EXPECT_EQ(model.output_mean.size(), 257);
    EXPECT_EQ(model.stft.n_fft, 512);
    EXPECT_EQ(model.stft.n_hop, 128);
    EXPECT_FALSE(model.frozen);

    // max_bin past the spectrum is clamped
    hparams.max_bin = 10000;
    EXPECT_EQ(stemsep::init_umx_model(hparams).nb_bins, 257);

    hparams.unidirectional = true;
    EXPECT_EQ(stemsep::init_umx_model(hparams).lstm.hidden_size, 16);
}

TEST(UMX_Model, InitRejectsInvalidHyperparameters)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.hidden_size = 15;
    EXPECT_THROW(stemsep::init_umx_model(hparams), stemsep::ConfigurationError);

    hparams = small_hparams();
    hparams.nb_layers = 0;
    EXPECT_THROW(stemsep::init_umx_model(hparams), stemsep::ConfigurationError);
}

// default parameters make the network an identity on the mixture magnitude
TEST(UMX_Model, DefaultModelReturnsMixMagnitude)
{
    stemsep::umx_model model = stemsep::init_umx_model(small_hparams());

    Eigen::Tensor3dXf audio = random_waveform(2, 2, 3000);
    Eigen::Tensor4dXf out = stemsep::umx_forward(model, audio);

    Eigen::Tensor4dXf mix = stemsep::magnitude_spectrogram(
        stemsep::stft(audio, model.stft), 1.0f, false);

    const int nb_frames = stemsep::stft_nb_frames(3000, model.stft);
    ASSERT_EQ(out.dimension(0), nb_frames);
    ASSERT_EQ(out.dimension(1), 2);
    ASSERT_EQ(out.dimension(2), 2);
    ASSERT_EQ(out.dimension(3), 257);

    for (int f = 0; f < nb_frames; ++f)
    {
        for (int s = 0; s < 2; ++s)
        {
            for (int c = 0; c < 2; ++c)
            {
                for (int b = 0; b < 257; ++b)
                {
                    EXPECT_FLOAT_EQ(out(f, s, c, b), mix(f, s, c, b));
                }
            }
        }
    }
}

TEST(UMX_Model, RandomWeightsGiveNonNegativeMagnitudes)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.max_bin = 64;
    stemsep::umx_model model = stemsep::init_umx_model(hparams);

    model.fc1_w.setRandom();
    model.fc2_w.setRandom();
    model.fc3_w.setRandom();
    model.output_mean.setRandom();
    model.output_scale.setRandom();
    for (auto &layer : model.lstm.layers)
    {
        for (auto &cell : layer)
        {
            cell.w_ih.setRandom();
            cell.w_hh.setRandom();
        }
    }

    Eigen::Tensor3dXf audio = random_waveform(1, 2, 4000);
    Eigen::Tensor4dXf out = stemsep::umx_forward(model, audio);

    ASSERT_EQ(out.dimension(3), 257);

    bool any_positive = false;
    for (Eigen::Index i = 0; i < out.size(); ++i)
    {
        ASSERT_GE(out.data()[i], 0.0f);
        ASSERT_TRUE(std::isfinite(out.data()[i]));
        any_positive = any_positive || out.data()[i] > 0.0f;
    }
    EXPECT_TRUE(any_positive);
}

TEST(UMX_Model, MonoModelDownmixes)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.nb_channels = 1;
    stemsep::umx_model model = stemsep::init_umx_model(hparams);

    Eigen::Tensor3dXf audio = random_waveform(1, 2, 2048);
    Eigen::Tensor4dXf out = stemsep::umx_forward(model, audio);

    Eigen::Tensor4dXf mix = stemsep::magnitude_spectrogram(
        stemsep::stft(audio, model.stft), 1.0f, true);

    ASSERT_EQ(out.dimension(2), 1);
    for (Eigen::Index i = 0; i < out.size(); ++i)
    {
        EXPECT_FLOAT_EQ(out.data()[i], mix.data()[i]);
    }
}

TEST(UMX_Model, SpectrogramInput)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.input_is_spectrogram = true;
    stemsep::umx_model model = stemsep::init_umx_model(hparams);

    Eigen::Tensor4dXf spec(6, 1, 2, 257);
    spec.setConstant(0.25f);

    Eigen::Tensor4dXf out = stemsep::umx_forward(model, spec);
    ASSERT_EQ(out.dimension(0), 6);
    EXPECT_FLOAT_EQ(out(3, 0, 1, 100), 0.25f);

    // a spectrogram model does not take waveforms, and vice versa
    EXPECT_THROW(stemsep::umx_forward(model, random_waveform(1, 2, 2048)),
                 std::invalid_argument);

    stemsep::umx_model waveform_model = stemsep::init_umx_model(small_hparams());
    EXPECT_THROW(stemsep::umx_forward(waveform_model, spec),
                 std::invalid_argument);

    Eigen::Tensor4dXf wrong_bins(6, 1, 2, 100);
    wrong_bins.setZero();
    EXPECT_THROW(stemsep::umx_forward(model, wrong_bins), stemsep::ShapeError);

    Eigen::Tensor4dXf wrong_channels(6, 1, 3, 257);
    wrong_channels.setZero();
    EXPECT_THROW(stemsep::umx_forward(model, wrong_channels),
                 stemsep::ShapeError);
}

TEST(UMX_Model, InputStatistics)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.max_bin = 10;
    stemsep::umx_model model = stemsep::init_umx_model(hparams);

    Eigen::VectorXf mean = Eigen::VectorXf::Constant(257, 2.0f);
    Eigen::VectorXf scale = Eigen::VectorXf::Constant(257, 4.0f);
    stemsep::set_input_statistics(model, mean, scale);

    ASSERT_EQ(model.input_mean.size(), 10);
    ASSERT_EQ(model.input_scale.size(), 10);
    EXPECT_FLOAT_EQ(model.input_mean(3), -2.0f);
    EXPECT_FLOAT_EQ(model.input_scale(3), 0.25f);

    Eigen::VectorXf too_short = Eigen::VectorXf::Ones(5);
    EXPECT_THROW(stemsep::set_input_statistics(model, too_short, scale),
                 std::invalid_argument);
}

TEST(UMX_Estimator, ForwardsToModelAndFreezes)
{
    stemsep::umx_hparams hparams = small_hparams();
    hparams.sample_rate = 22050;
    stemsep::UmxEstimator estimator(stemsep::init_umx_model(hparams));

    EXPECT_EQ(estimator.sample_rate(), 22050);
    EXPECT_EQ(estimator.stft_params().n_fft, 512);
    EXPECT_FALSE(estimator.model().frozen);

    estimator.freeze();
    EXPECT_TRUE(estimator.model().frozen);

    Eigen::Tensor3dXf audio = random_waveform(1, 2, 1024);
    Eigen::Tensor4dXf a = estimator.estimate(audio);
    Eigen::Tensor4dXf b = stemsep::umx_forward(estimator.model(), audio);

    ASSERT_EQ(a.size(), b.size());
    for (Eigen::Index i = 0; i < a.size(); ++i)
    {
        EXPECT_FLOAT_EQ(a.data()[i], b.data()[i]);
    }
}
