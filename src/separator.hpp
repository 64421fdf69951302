#ifndef SEPARATOR_HPP
#define SEPARATOR_HPP

#include "dsp.hpp"
#include "model.hpp"
#include <map>
#include <memory>
#include <string>
#include <tensor.hpp>
#include <utility>
#include <vector>

namespace stemsep
{

struct separator_config
{
    // EM iterations of the wiener filter, 0 only applies the masks
    int niter = 1;
    bool softmask = false;
    // name of an extra "everything else" target, empty for none
    std::string residual;
    // number of frames filtered together, 0 filters the whole signal
    int batch_size = 0;
};

// positional command-line options [niter] [residual name]
separator_config parse_separator_options(const std::vector<std::string> &options);

typedef std::vector<std::pair<std::string, std::unique_ptr<SourceEstimator>>>
    target_list;

// target name -> (nb_samples, nb_channels, nb_timesteps)
typedef std::map<std::string, Eigen::Tensor3dXf> estimates_map;

class Separator
{
  public:
    // targets are kept in the given order, which is the source order of
    // the wiener filter
    explicit Separator(target_list targets,
                       separator_config config = separator_config());

    // audio: (nb_samples, nb_channels, nb_timesteps) at sample_rate()
    estimates_map separate(const Eigen::Tensor3dXf &audio) const;

    void freeze();

    int sample_rate() const { return sample_rate_; }
    const stft_config &stft_params() const { return stft_; }
    const separator_config &config() const { return config_; }

    // registered targets followed by the residual, if any
    std::vector<std::string> target_names() const;

  private:
    target_list targets_;
    separator_config config_;

    // shared by every target, validated at construction
    int sample_rate_;
    stft_config stft_;
};

target_list make_umx_targets(std::vector<std::pair<std::string, umx_model>> models);

// sum estimates into named groups, e.g. accompaniment = drums + bass + other
estimates_map
aggregate(const estimates_map &estimates,
          const std::vector<std::pair<std::string, std::vector<std::string>>>
              &groups);

} // namespace stemsep

#endif // SEPARATOR_HPP
