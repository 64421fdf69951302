// gtest cases for the weight file loader and the weight providers

#include "errors.hpp"
#include "model.hpp"
#include "weights.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{

struct weight_file
{
    uint32_t magic = stemsep::WEIGHTS_MAGIC;
    uint32_t hidden_size = 16;
    uint32_t nb_channels = 2;
    uint32_t n_fft = 512;
    uint32_t n_hop = 128;
    uint32_t nb_layers = 1;
    uint32_t unidirectional = 0;
    uint32_t power = 1;
    uint32_t sample_rate = 44100;
    uint32_t bandwidth = 0;

    // bins seen by fc1, must agree with bandwidth
    int nb_bins = 257;

    // tensor to leave out, and one to add that the model does not know
    std::string skip;
    std::string extra;

    // stop writing after this many tensors, mid-record
    int truncate_after = -1;
};

std::vector<std::pair<std::string, std::vector<int32_t>>>
tensor_layout(const weight_file &w)
{
    const int32_t H = w.hidden_size;
    const int32_t C = w.nb_channels;
    const int32_t O = w.n_fft / 2 + 1;
    const int32_t lstm_h = w.unidirectional ? H : H / 2;
    const int nb_directions = w.unidirectional ? 1 : 2;

    std::vector<std::pair<std::string, std::vector<int32_t>>> layout = {
        {"input_mean", {w.nb_bins}},
        {"input_scale", {w.nb_bins}},
        {"fc1.weight", {H, w.nb_bins * C}},
        {"bn1.weight", {H}},
        {"bn1.bias", {H}},
        {"bn1.running_mean", {H}},
        {"bn1.running_var", {H}},
    };

    for (uint32_t layer = 0; layer < w.nb_layers; ++layer)
    {
        int32_t input = layer == 0 ? H : nb_directions * lstm_h;
        for (int direction = 0; direction < nb_directions; ++direction)
        {
            std::string suffix = "_l" + std::to_string(layer) +
                                 (direction == 1 ? "_reverse" : "");
            layout.push_back({"lstm.weight_ih" + suffix, {4 * lstm_h, input}});
            layout.push_back({"lstm.weight_hh" + suffix, {4 * lstm_h, lstm_h}});
            layout.push_back({"lstm.bias_ih" + suffix, {4 * lstm_h}});
            layout.push_back({"lstm.bias_hh" + suffix, {4 * lstm_h}});
        }
    }

    std::vector<std::pair<std::string, std::vector<int32_t>>> tail = {
        {"fc2.weight", {H, 2 * H}},
        {"bn2.weight", {H}},
        {"bn2.bias", {H}},
        {"bn2.running_mean", {H}},
        {"bn2.running_var", {H}},
        {"fc3.weight", {O * C, H}},
        {"bn3.weight", {O * C}},
        {"bn3.bias", {O * C}},
        {"bn3.running_mean", {O * C}},
        {"bn3.running_var", {O * C}},
        {"output_scale", {O}},
        {"output_mean", {O}},
    };
    layout.insert(layout.end(), tail.begin(), tail.end());

    if (!w.extra.empty())
    {
        layout.push_back({w.extra, {4}});
    }

    return layout;
}

// element i of every tensor holds i / 1000, in row-major order
void write_weight_file(const fs::path &path, const weight_file &w)
{
    FILE *f = fopen(path.string().c_str(), "wb");
    ASSERT_NE(f, nullptr);

    uint32_t header[10] = {w.magic,          w.hidden_size, w.nb_channels,
                           w.n_fft,          w.n_hop,       w.nb_layers,
                           w.unidirectional, w.power,       w.sample_rate,
                           w.bandwidth};
    fwrite(header, sizeof(uint32_t), 10, f);

    int written = 0;
    for (const auto &tensor : tensor_layout(w))
    {
        if (tensor.first == w.skip)
        {
            continue;
        }

        int32_t n_dims = tensor.second.size();
        int32_t length = tensor.first.size();
        fwrite(&n_dims, sizeof(int32_t), 1, f);
        fwrite(&length, sizeof(int32_t), 1, f);
        fwrite(tensor.second.data(), sizeof(int32_t), n_dims, f);
        fwrite(tensor.first.data(), sizeof(char), length, f);

        if (written == w.truncate_after)
        {
            break;
        }

        size_t count = 1;
        for (int32_t d : tensor.second)
        {
            count *= d;
        }
        std::vector<float> data(count);
        for (size_t i = 0; i < count; ++i)
        {
            data[i] = (float)i / 1000.0f;
        }
        fwrite(data.data(), sizeof(float), count, f);
        ++written;
    }

    fclose(f);
}

class WeightsTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("stemsep_weights_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST_F(WeightsTest, LoadsEveryTensorRowMajor)
{
    write_weight_file(dir_ / "vocals-0123abcd.bin", weight_file());

    stemsep::LocalWeightsProvider provider(dir_.string());
    stemsep::umx_model model = provider.load("vocals");

    EXPECT_EQ(model.hparams.hidden_size, 16);
    EXPECT_EQ(model.hparams.nb_channels, 2);
    EXPECT_EQ(model.hparams.n_fft, 512);
    EXPECT_EQ(model.hparams.n_hop, 128);
    EXPECT_EQ(model.hparams.sample_rate, 44100);
    EXPECT_EQ(model.nb_bins, 257);
    EXPECT_EQ(model.nb_output_bins, 257);

    // fc1.weight is (16, 514)
    EXPECT_FLOAT_EQ(model.fc1_w(1, 2), (514 + 2) / 1000.0f);
    EXPECT_FLOAT_EQ(model.fc1_w(15, 513), (15 * 514 + 513) / 1000.0f);

    // fc3.weight is (514, 16)
    EXPECT_FLOAT_EQ(model.fc3_w(3, 1), (3 * 16 + 1) / 1000.0f);

    EXPECT_FLOAT_EQ(model.bn2.running_var(7), 0.007f);
    EXPECT_FLOAT_EQ(model.input_scale(256), 0.256f);
    EXPECT_FLOAT_EQ(model.output_mean(10), 0.010f);

    // weight_hh_l0_reverse is (32, 8)
    const stemsep::lstm_cell &reverse = model.lstm.layers[0][1];
    EXPECT_FLOAT_EQ(reverse.w_hh(2, 5), (2 * 8 + 5) / 1000.0f);
    EXPECT_FLOAT_EQ(reverse.b_hh(31), 0.031f);
}

TEST_F(WeightsTest, BandwidthCropsInputBins)
{
    weight_file w;
    w.bandwidth = 16000;
    // bins of 44100 / 512 Hz up to 16 kHz
    w.nb_bins = 186;
    w.nb_layers = 2;
    write_weight_file(dir_ / "drums.bin", w);

    stemsep::umx_model model = stemsep::load_umx_model((dir_ / "drums.bin").string());

    EXPECT_EQ(model.nb_bins, 186);
    EXPECT_EQ(model.fc1_w.cols(), 372);
    EXPECT_EQ(model.lstm.nb_layers, 2);
    EXPECT_EQ(model.lstm.layers[1][0].w_ih.cols(), 16);
}

TEST_F(WeightsTest, FirstSortedMatchWins)
{
    weight_file a;
    a.sample_rate = 22050;
    write_weight_file(dir_ / "bass-a.bin", a);
    write_weight_file(dir_ / "bass-b.bin", weight_file());
    // not a weight file
    write_weight_file(dir_ / "bass-0.txt", weight_file());

    stemsep::umx_model model = stemsep::LocalWeightsProvider(dir_.string()).load("bass");
    EXPECT_EQ(model.hparams.sample_rate, 22050);
}

TEST_F(WeightsTest, LoadModelsFromLocalDirectory)
{
    write_weight_file(dir_ / "vocals.bin", weight_file());
    write_weight_file(dir_ / "other.bin", weight_file());

    auto models = stemsep::load_models({"vocals", "other"}, dir_.string(),
                                       (dir_ / "cache").string());

    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0].first, "vocals");
    EXPECT_EQ(models[1].first, "other");
    EXPECT_EQ(models[1].second.hparams.hidden_size, 16);
}

TEST_F(WeightsTest, MissingLocalWeights)
{
    try
    {
        stemsep::LocalWeightsProvider((dir_ / "nope").string()).load("vocals");
        FAIL() << "expected ModelNotFoundError";
    }
    catch (const stemsep::ModelNotFoundError &e)
    {
        EXPECT_EQ(e.kind(), stemsep::ModelNotFoundError::LocalPath);
    }

    write_weight_file(dir_ / "vocals.bin", weight_file());
    try
    {
        stemsep::LocalWeightsProvider(dir_.string()).load("drums");
        FAIL() << "expected ModelNotFoundError";
    }
    catch (const stemsep::ModelNotFoundError &e)
    {
        EXPECT_EQ(e.kind(), stemsep::ModelNotFoundError::LocalPath);
    }
}

TEST_F(WeightsTest, RegistryNames)
{
    const auto &known = stemsep::RegistryWeightsProvider::known_models();
    EXPECT_NE(std::find(known.begin(), known.end(), "umxhq"), known.end());

    try
    {
        stemsep::make_weights_provider("not-a-pretrained-model",
                                       dir_.string());
        FAIL() << "expected ModelNotFoundError";
    }
    catch (const stemsep::ModelNotFoundError &e)
    {
        EXPECT_EQ(e.kind(), stemsep::ModelNotFoundError::UnknownRegistryName);
    }

    // known name, nothing in the cache
    auto provider = stemsep::make_weights_provider("umxhq", dir_.string());
    try
    {
        provider->load("vocals");
        FAIL() << "expected ModelNotFoundError";
    }
    catch (const stemsep::ModelNotFoundError &e)
    {
        EXPECT_EQ(e.kind(), stemsep::ModelNotFoundError::Unavailable);
    }
}

TEST_F(WeightsTest, RegistryResolvesFromCache)
{
    fs::create_directories(dir_ / "umxl");
    write_weight_file(dir_ / "umxl" / "vocals-f00d.bin", weight_file());

    stemsep::RegistryWeightsProvider provider("umxl", dir_.string());
    stemsep::umx_model model = provider.load("vocals");
    EXPECT_EQ(model.nb_output_bins, 257);

    // cached model without this target
    try
    {
        provider.load("bass");
        FAIL() << "expected ModelNotFoundError";
    }
    catch (const stemsep::ModelNotFoundError &e)
    {
        EXPECT_EQ(e.kind(), stemsep::ModelNotFoundError::Unavailable);
    }
}

TEST_F(WeightsTest, RejectsCorruptFiles)
{
    const std::string path = (dir_ / "vocals.bin").string();

    weight_file bad_magic;
    bad_magic.magic = 0x67676d6c;
    write_weight_file(path, bad_magic);
    EXPECT_THROW(stemsep::load_umx_model(path), std::runtime_error);

    weight_file missing;
    missing.skip = "bn3.running_var";
    write_weight_file(path, missing);
    EXPECT_THROW(stemsep::load_umx_model(path), std::runtime_error);

    weight_file unknown;
    unknown.extra = "decoder.weight";
    write_weight_file(path, unknown);
    EXPECT_THROW(stemsep::load_umx_model(path), std::runtime_error);

    weight_file truncated;
    truncated.truncate_after = 3;
    write_weight_file(path, truncated);
    EXPECT_THROW(stemsep::load_umx_model(path), std::runtime_error);

    // full band header, tensors laid out for a cropped band
    weight_file wrong_shape;
    wrong_shape.nb_bins = 100;
    write_weight_file(path, wrong_shape);
    EXPECT_THROW(stemsep::load_umx_model(path), std::runtime_error);
}
