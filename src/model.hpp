#ifndef MODEL_HPP
#define MODEL_HPP

#include "dsp.hpp"
#include "lstm.hpp"
#include <Eigen/Dense>
#include <tensor.hpp>

namespace stemsep
{

struct umx_hparams
{
    int n_fft = FFT_WINDOW_SIZE;
    int n_hop = FFT_HOP_SIZE;
    int hidden_size = 512;
    int nb_channels = 2;
    int sample_rate = SUPPORTED_SAMPLE_RATE;
    int nb_layers = 3;
    bool unidirectional = false;
    float power = 1.0f;
    // number of input bins the network sees, 0 means the full band
    int max_bin = 0;
    // skip the stft when the caller already provides a magnitude spectrogram
    bool input_is_spectrogram = false;
};

// BatchNorm1d in inference mode
struct batch_norm
{
    Eigen::VectorXf weight;
    Eigen::VectorXf bias;
    Eigen::VectorXf running_mean;
    Eigen::VectorXf running_var;
};

struct umx_model
{
    umx_hparams hparams;

    int nb_bins = 0;        // cropped input bins
    int nb_output_bins = 0; // n_fft / 2 + 1

    stft_config stft;

    // per-bin input normalization: (x + input_mean) * input_scale
    Eigen::VectorXf input_mean;
    Eigen::VectorXf input_scale;

    // weights in torch orientation (out_features, in_features), no biases
    Eigen::MatrixXf fc1_w;
    batch_norm bn1;

    lstm_params lstm;

    Eigen::MatrixXf fc2_w;
    batch_norm bn2;

    Eigen::MatrixXf fc3_w;
    batch_norm bn3;

    Eigen::VectorXf output_scale;
    Eigen::VectorXf output_mean;

    // parameters are read-only once frozen
    bool frozen = false;
};

// number of bins whose centre frequency is <= bandwidth (Hz)
int bandwidth_to_max_bin(int sample_rate, int n_fft, float bandwidth);

// allocate a model with default parameters: zero input mean, unit scales,
// identity batch norms and zero weights
umx_model init_umx_model(const umx_hparams &hparams);

// raw dataset statistics: input_mean = -mean, input_scale = 1 / scale,
// both cropped to the model's nb_bins
void set_input_statistics(umx_model &model, const Eigen::VectorXf &mean,
                          const Eigen::VectorXf &scale);

void freeze_umx_model(umx_model &model);

// waveform: (nb_samples, nb_channels, nb_timesteps)
// returns the estimated magnitude (nb_frames, nb_samples, nb_channels,
// nb_output_bins)
Eigen::Tensor4dXf umx_forward(const umx_model &model,
                              const Eigen::Tensor3dXf &audio);

// spectrogram: (nb_frames, nb_samples, nb_channels, nb_output_bins), only
// for models built with input_is_spectrogram
Eigen::Tensor4dXf umx_forward(const umx_model &model,
                              const Eigen::Tensor4dXf &spectrogram);

// a per-target magnitude estimator as seen by the Separator
class SourceEstimator
{
  public:
    virtual ~SourceEstimator() = default;

    // mixture waveform (nb_samples, nb_channels, nb_timesteps) to
    // magnitude (nb_frames, nb_samples, nb_channels, nb_bins)
    virtual Eigen::Tensor4dXf estimate(const Eigen::Tensor3dXf &audio) const = 0;

    virtual int sample_rate() const = 0;
    virtual stft_config stft_params() const = 0;
    virtual void freeze() = 0;
};

class UmxEstimator : public SourceEstimator
{
  public:
    explicit UmxEstimator(umx_model model);

    Eigen::Tensor4dXf estimate(const Eigen::Tensor3dXf &audio) const override;

    int sample_rate() const override { return model_.hparams.sample_rate; }
    stft_config stft_params() const override { return model_.stft; }
    void freeze() override { freeze_umx_model(model_); }

    const umx_model &model() const { return model_; }

  private:
    umx_model model_;
};

} // namespace stemsep

#endif // MODEL_HPP
