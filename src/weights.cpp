#include "weights.hpp"
#include "errors.hpp"
#include "model.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

// destination of a named tensor inside umx_model
struct tensor_slot
{
    Eigen::MatrixXf *matrix = nullptr;
    Eigen::VectorXf *vector = nullptr;
};

using file_ptr = std::unique_ptr<FILE, decltype(&fclose)>;

void add_batch_norm(std::map<std::string, tensor_slot> &slots,
                    const std::string &prefix, stemsep::batch_norm &bn)
{
    slots[prefix + ".weight"].vector = &bn.weight;
    slots[prefix + ".bias"].vector = &bn.bias;
    slots[prefix + ".running_mean"].vector = &bn.running_mean;
    slots[prefix + ".running_var"].vector = &bn.running_var;
}

// state dict names of the reference network
std::map<std::string, tensor_slot> tensor_slots(stemsep::umx_model &model)
{
    std::map<std::string, tensor_slot> slots;

    slots["input_mean"].vector = &model.input_mean;
    slots["input_scale"].vector = &model.input_scale;
    slots["output_mean"].vector = &model.output_mean;
    slots["output_scale"].vector = &model.output_scale;

    slots["fc1.weight"].matrix = &model.fc1_w;
    slots["fc2.weight"].matrix = &model.fc2_w;
    slots["fc3.weight"].matrix = &model.fc3_w;

    add_batch_norm(slots, "bn1", model.bn1);
    add_batch_norm(slots, "bn2", model.bn2);
    add_batch_norm(slots, "bn3", model.bn3);

    const int nb_directions = model.lstm.bidirectional ? 2 : 1;
    for (int layer = 0; layer < model.lstm.nb_layers; ++layer)
    {
        for (int direction = 0; direction < nb_directions; ++direction)
        {
            std::string suffix = "_l" + std::to_string(layer) +
                                 (direction == 1 ? "_reverse" : "");
            stemsep::lstm_cell &cell = model.lstm.layers[layer][direction];
            slots["lstm.weight_ih" + suffix].matrix = &cell.w_ih;
            slots["lstm.weight_hh" + suffix].matrix = &cell.w_hh;
            slots["lstm.bias_ih" + suffix].vector = &cell.b_ih;
            slots["lstm.bias_hh" + suffix].vector = &cell.b_hh;
        }
    }

    return slots;
}

void read_exact(FILE *f, void *dst, size_t size, size_t count,
                const std::string &what)
{
    if (fread(dst, size, count, f) != count)
    {
        throw std::runtime_error("truncated weight file while reading " + what);
    }
}

// populate a matrix or vector from row-major float data in the file
size_t load_single_tensor(FILE *f, const std::string &name,
                          const tensor_slot &slot, int32_t n_dims,
                          const int32_t ne[2])
{
    int32_t rows = 0;
    int32_t cols = 0;
    if (slot.matrix != nullptr)
    {
        rows = slot.matrix->rows();
        cols = slot.matrix->cols();
    }
    else
    {
        rows = slot.vector->size();
        cols = 1;
    }

    const int32_t expected_dims = slot.matrix != nullptr ? 2 : 1;
    if (n_dims != expected_dims || ne[0] != rows || ne[1] != cols)
    {
        fprintf(stderr, "%s: tensor '%s' has wrong size in model file\n",
                __func__, name.c_str());
        fprintf(stderr,
                "%s: model file shape: [%d, %d], stemsep shape: [%d, %d]\n",
                __func__, ne[0], ne[1], rows, cols);
        throw std::runtime_error("tensor '" + name +
                                 "' has wrong size in model file");
    }

    std::vector<float> buf((size_t)rows * cols);
    read_exact(f, buf.data(), sizeof(float), buf.size(), name);

    if (slot.matrix != nullptr)
    {
        *slot.matrix =
            Eigen::Map<Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic,
                                     Eigen::RowMajor>>(buf.data(), rows, cols);
    }
    else
    {
        *slot.vector = Eigen::Map<Eigen::VectorXf>(buf.data(), rows);
    }

    return buf.size() * sizeof(float);
}

} // namespace

stemsep::umx_model stemsep::load_umx_model(const std::string &path)
{
    fprintf(stderr, "%s: loading model from %s\n", __func__, path.c_str());

    const auto t_start_us =
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count();

    file_ptr f(fopen(path.c_str(), "rb"), &fclose);
    if (!f)
    {
        fprintf(stderr, "%s: failed to open %s\n", __func__, path.c_str());
        throw ModelNotFoundError(ModelNotFoundError::LocalPath,
                                 "cannot open weight file " + path);
    }

    uint32_t magic = 0;
    read_exact(f.get(), &magic, sizeof(uint32_t), 1, "magic");
    if (magic != WEIGHTS_MAGIC)
    {
        fprintf(stderr, "%s: invalid model data (bad magic)\n", __func__);
        throw std::runtime_error("invalid model data (bad magic) in " + path);
    }

    // hidden_size, nb_channels, n_fft, n_hop, nb_layers, unidirectional,
    // power, sample_rate, bandwidth
    uint32_t header[9];
    read_exact(f.get(), header, sizeof(uint32_t), 9, "header");

    umx_hparams hparams;
    hparams.hidden_size = header[0];
    hparams.nb_channels = header[1];
    hparams.n_fft = header[2];
    hparams.n_hop = header[3];
    hparams.nb_layers = header[4];
    hparams.unidirectional = header[5] != 0;
    hparams.power = (float)header[6];
    hparams.sample_rate = header[7];
    hparams.max_bin =
        header[8] > 0 ? bandwidth_to_max_bin(hparams.sample_rate, hparams.n_fft,
                                             (float)header[8])
                      : 0;

    std::cout << "Loading umx model with hidden size " << hparams.hidden_size
              << ", " << hparams.nb_channels << " channels, max bin "
              << hparams.max_bin << std::endl;

    umx_model model = init_umx_model(hparams);
    auto slots = tensor_slots(model);
    std::map<std::string, bool> loaded;

    size_t total_size = 0;

    for (;;)
    {
        int32_t n_dims = 0;
        int32_t length = 0;

        // a clean end of file is only allowed between two tensors
        if (fread(&n_dims, sizeof(int32_t), 1, f.get()) != 1)
        {
            if (feof(f.get()))
            {
                break;
            }
            throw std::runtime_error("failed to read " + path);
        }
        read_exact(f.get(), &length, sizeof(int32_t), 1, "name length");

        if (n_dims < 1 || n_dims > 2 || length <= 0)
        {
            throw std::runtime_error("corrupt tensor record in " + path);
        }

        int32_t ne[2] = {1, 1};
        read_exact(f.get(), ne, sizeof(int32_t), n_dims, "dims");

        std::string name(length, '\0');
        read_exact(f.get(), &name[0], sizeof(char), length, "name");

        auto it = slots.find(name);
        if (it == slots.end())
        {
            fprintf(stderr, "%s: unknown tensor %s\n", __func__, name.c_str());
            throw std::runtime_error("unknown tensor '" + name + "' in " + path);
        }

        total_size += load_single_tensor(f.get(), name, it->second, n_dims, ne);
        loaded[name] = true;
    }

    for (const auto &slot : slots)
    {
        if (!loaded.count(slot.first))
        {
            fprintf(stderr, "%s: missing tensor %s\n", __func__,
                    slot.first.c_str());
            throw std::runtime_error("tensor '" + slot.first +
                                     "' missing from " + path);
        }
    }

    const auto t_end_us =
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count();

    printf("Loaded model (%zu tensors, %6.2f MB) in %f s\n", loaded.size(),
           total_size / 1024.0 / 1024.0,
           (float)(t_end_us - t_start_us) / 1000000.0f);

    return model;
}

stemsep::LocalWeightsProvider::LocalWeightsProvider(std::string model_dir)
    : model_dir_(std::move(model_dir))
{
}

stemsep::umx_model
stemsep::LocalWeightsProvider::load(const std::string &target) const
{
    if (!std::filesystem::is_directory(model_dir_))
    {
        throw ModelNotFoundError(ModelNotFoundError::LocalPath,
                                 "model directory " + model_dir_ +
                                     " does not exist");
    }

    // equivalent of glob("<target>*.bin"), sorted so the choice is stable
    std::vector<std::string> candidates;
    for (const auto &entry : std::filesystem::directory_iterator(model_dir_))
    {
        std::string filename = entry.path().filename().string();
        if (entry.is_regular_file() && filename.rfind(target, 0) == 0 &&
            entry.path().extension() == ".bin")
        {
            candidates.push_back(entry.path().string());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    if (candidates.empty())
    {
        throw ModelNotFoundError(ModelNotFoundError::LocalPath,
                                 "no weights for target '" + target +
                                     "' in " + model_dir_);
    }

    std::cout << "Discovered model file " << candidates.front()
              << " for target " << target << std::endl;

    return load_umx_model(candidates.front());
}

stemsep::RegistryWeightsProvider::RegistryWeightsProvider(std::string model_name,
                                                          std::string cache_dir)
    : model_name_(std::move(model_name)), cache_dir_(std::move(cache_dir))
{
    const auto &known = known_models();
    if (std::find(known.begin(), known.end(), model_name_) == known.end())
    {
        throw ModelNotFoundError(ModelNotFoundError::UnknownRegistryName,
                                 "model '" + model_name_ +
                                     "' is neither a local path nor a known "
                                     "pretrained model");
    }
}

const std::vector<std::string> &stemsep::RegistryWeightsProvider::known_models()
{
    static const std::vector<std::string> names = {"umxhq", "umx", "umxl"};
    return names;
}

stemsep::umx_model
stemsep::RegistryWeightsProvider::load(const std::string &target) const
{
    std::filesystem::path dir = std::filesystem::path(cache_dir_) / model_name_;
    if (!std::filesystem::is_directory(dir))
    {
        throw ModelNotFoundError(ModelNotFoundError::Unavailable,
                                 "pretrained model '" + model_name_ +
                                     "' is not available in " + dir.string());
    }

    try
    {
        return LocalWeightsProvider(dir.string()).load(target);
    }
    catch (const ModelNotFoundError &e)
    {
        throw ModelNotFoundError(ModelNotFoundError::Unavailable, e.what());
    }
}

std::unique_ptr<stemsep::WeightsProvider>
stemsep::make_weights_provider(const std::string &model_name,
                               const std::string &cache_dir)
{
    if (std::filesystem::exists(model_name))
    {
        return std::make_unique<LocalWeightsProvider>(model_name);
    }
    // model path does not exist, use the registry
    return std::make_unique<RegistryWeightsProvider>(model_name, cache_dir);
}

std::vector<std::pair<std::string, stemsep::umx_model>>
stemsep::load_models(const std::vector<std::string> &targets,
                     const std::string &model_name, const std::string &cache_dir)
{
    auto provider = make_weights_provider(model_name, cache_dir);

    std::vector<std::pair<std::string, umx_model>> models;
    for (const auto &target : targets)
    {
        models.emplace_back(target, provider->load(target));
    }
    return models;
}
