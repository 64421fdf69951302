#ifndef WEIGHTS_HPP
#define WEIGHTS_HPP

#include "model.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stemsep
{

// "ssep"
const uint32_t WEIGHTS_MAGIC = 0x73736570;

// read one target from a weight file:
// uint32 magic, uint32 hidden_size, nb_channels, n_fft, n_hop, nb_layers,
// unidirectional, power, sample_rate, bandwidth (Hz, 0 = full band), then
// until EOF: int32 n_dims, int32 name_len, int32 dims[n_dims], name,
// float32 data in row-major order
umx_model load_umx_model(const std::string &path);

// supplies a fully populated model per target name
class WeightsProvider
{
  public:
    virtual ~WeightsProvider() = default;
    virtual umx_model load(const std::string &target) const = 0;
};

// <model_dir>/<target>*.bin, first match in sorted order
class LocalWeightsProvider : public WeightsProvider
{
  public:
    explicit LocalWeightsProvider(std::string model_dir);
    umx_model load(const std::string &target) const override;

  private:
    std::string model_dir_;
};

// pretrained models by name, resolved against a local cache directory
class RegistryWeightsProvider : public WeightsProvider
{
  public:
    RegistryWeightsProvider(std::string model_name, std::string cache_dir);
    umx_model load(const std::string &target) const override;

    static const std::vector<std::string> &known_models();

  private:
    std::string model_name_;
    std::string cache_dir_;
};

// a local directory if model_name exists on disk, the registry otherwise
std::unique_ptr<WeightsProvider>
make_weights_provider(const std::string &model_name,
                      const std::string &cache_dir);

std::vector<std::pair<std::string, umx_model>>
load_models(const std::vector<std::string> &targets,
            const std::string &model_name, const std::string &cache_dir);

} // namespace stemsep

#endif // WEIGHTS_HPP
