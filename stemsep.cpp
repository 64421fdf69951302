#include "audio.hpp"
#include "dsp.hpp"
#include "errors.hpp"
#include "separator.hpp"
#include "weights.hpp"
#include <Eigen/Core>
#include <Eigen/Dense>
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace stemsep;

static std::string default_cache_dir()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path p = home != nullptr ? home : ".";
    return (p / ".cache" / "stemsep").string();
}

int main(int argc, const char **argv)
{
    if (argc < 4 || argc > 6)
    {
        std::cerr << "Usage: " << argv[0]
                  << " <model dir or name> <wav file> <out dir> [niter] "
                     "[residual name]"
                  << std::endl;
        return 1;
    }

    std::cout << "stemsep.cpp Main driver program" << std::endl;

    // load model passed as argument
    std::string model_name = argv[1];

    // load audio passed as argument
    std::string wav_file = argv[2];

    // output dir passed as argument
    std::string out_dir = argv[3];

    // init parallelism for eigen
    Eigen::initParallel();

    // set eigen nb threads to physical cores minus 1
    int nb_cores = std::thread::hardware_concurrency();
    std::cout << "Number of physical cores: " << nb_cores << std::endl;
    Eigen::setNbThreads(std::max(1, nb_cores - 1));

    try
    {
        separator_config config = parse_separator_options(
            std::vector<std::string>(argv + 4, argv + argc));

        Eigen::MatrixXf audio = load_audio(wav_file);

        std::vector<std::string> targets = {"vocals", "drums", "bass", "other"};
        auto models = load_models(targets, model_name, default_cache_dir());

        Separator separator(make_umx_targets(std::move(models)), config);
        separator.freeze();

        std::cout << "Separating " << audio.cols() << " samples into "
                  << separator.target_names().size() << " targets"
                  << std::endl;

        estimates_map estimates = separator.separate(to_batch(audio));

        std::filesystem::path p = out_dir;
        // make sure the directory exists
        std::filesystem::create_directories(p);

        for (const auto &estimate : estimates)
        {
            auto p_target = p / (estimate.first + ".wav");

            std::cout << "Writing wav file " << p_target << std::endl;

            write_audio_file(from_batch(estimate.second), p_target.string(),
                             separator.sample_rate());
        }
    }
    catch (const ConfigurationError &e)
    {
        std::cerr << "[ERROR] invalid configuration: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0]
                  << " <model dir or name> <wav file> <out dir> [niter] "
                     "[residual name]"
                  << std::endl;
        return 1;
    }
    catch (const ModelNotFoundError &e)
    {
        std::cerr << "[ERROR] model not found: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
