#include "separator.hpp"
#include "dsp.hpp"
#include "errors.hpp"
#include "wiener.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/CXX11/Tensor>
#include <utility>

stemsep::separator_config
stemsep::parse_separator_options(const std::vector<std::string> &options)
{
    if (options.size() > 2)
    {
        throw ConfigurationError("expected at most [niter] [residual name]");
    }

    separator_config config;
    if (!options.empty())
    {
        std::size_t consumed = 0;
        try
        {
            config.niter = std::stoi(options[0], &consumed);
        }
        catch (const std::logic_error &)
        {
            consumed = 0;
        }
        if (consumed == 0 || consumed != options[0].size() || config.niter < 0)
        {
            throw ConfigurationError("niter must be a non-negative integer, got '" +
                                     options[0] + "'");
        }
    }
    if (options.size() > 1)
    {
        config.residual = options[1];
    }
    return config;
}

stemsep::Separator::Separator(target_list targets, separator_config config)
    : targets_(std::move(targets)), config_(std::move(config))
{
    if (targets_.empty())
    {
        throw ConfigurationError("Separator needs at least one target");
    }
    if (config_.niter < 0 || config_.batch_size < 0)
    {
        throw ConfigurationError("niter and batch_size must be >= 0");
    }

    // every target must agree with the first one on the transform and
    // sample rate, since a single mixture stft is shared by all of them
    sample_rate_ = targets_.front().second->sample_rate();
    stft_ = targets_.front().second->stft_params();

    for (std::size_t i = 0; i < targets_.size(); ++i)
    {
        const auto &name = targets_[i].first;
        const auto &estimator = targets_[i].second;

        if (!estimator)
        {
            throw ConfigurationError("target '" + name + "' has no estimator");
        }
        if (estimator->sample_rate() != sample_rate_)
        {
            throw ConfigurationError(
                "target '" + name + "' has sample rate " +
                std::to_string(estimator->sample_rate()) + ", expected " +
                std::to_string(sample_rate_));
        }
        if (estimator->stft_params() != stft_)
        {
            throw ConfigurationError("target '" + name +
                                     "' uses a different stft configuration");
        }
        for (std::size_t k = 0; k < i; ++k)
        {
            if (targets_[k].first == name)
            {
                throw ConfigurationError("duplicate target '" + name + "'");
            }
        }
        if (name == config_.residual)
        {
            throw ConfigurationError("residual name '" + name +
                                     "' collides with a target");
        }
    }
}

std::vector<std::string> stemsep::Separator::target_names() const
{
    std::vector<std::string> names;
    for (const auto &target : targets_)
    {
        names.push_back(target.first);
    }
    if (!config_.residual.empty())
    {
        names.push_back(config_.residual);
    }
    return names;
}

void stemsep::Separator::freeze()
{
    for (auto &target : targets_)
    {
        target.second->freeze();
    }
}

stemsep::estimates_map
stemsep::Separator::separate(const Eigen::Tensor3dXf &audio) const
{
    const std::vector<std::string> names = target_names();
    const bool residual = !config_.residual.empty();

    if (names.size() == 1 && config_.niter > 0)
    {
        throw ConfigurationError(
            "Cannot use EM if only one target is estimated. Provide two "
            "targets or create an additional one with a residual");
    }

    const int nb_samples = audio.dimension(0);
    const int nb_timesteps = audio.dimension(2);
    const int nb_targets = targets_.size();

    // (nb_frames, nb_samples, nb_channels, nb_bins, nb_targets)
    Eigen::Tensor5dXf spectrograms;

    for (int j = 0; j < nb_targets; ++j)
    {
        std::cout << "Estimating target " << targets_[j].first << std::endl;

        // output is nb_frames, nb_samples, nb_channels, nb_bins
        Eigen::Tensor4dXf target_spectrogram =
            targets_[j].second->estimate(audio);

        if (j == 0)
        {
            spectrograms = Eigen::Tensor5dXf(
                target_spectrogram.dimension(0), target_spectrogram.dimension(1),
                target_spectrogram.dimension(2), target_spectrogram.dimension(3),
                nb_targets);
        }
        else
        {
            for (int d = 0; d < 4; ++d)
            {
                if (target_spectrogram.dimension(d) != spectrograms.dimension(d))
                {
                    throw ShapeError("target '" + targets_[j].first +
                                     "' estimate has a different shape than "
                                     "target '" +
                                     targets_[0].first + "'");
                }
            }
        }

        spectrograms.chip(j, 4) = target_spectrogram;
    }

    // (nb_samples, nb_frames, nb_bins, {1, nb_channels}, nb_targets)
    Eigen::array<int, 5> v_perm{{1, 0, 3, 2, 4}};
    Eigen::Tensor5dXf v = spectrograms.shuffle(v_perm);

    // (nb_samples, nb_channels, nb_bins, nb_frames) rearranged into
    // (nb_samples, nb_frames, nb_bins, nb_channels) for the wiener filter
    Eigen::Tensor4dXcf mix_spec = stft(audio, stft_);
    Eigen::array<int, 4> x_perm{{0, 3, 2, 1}};
    Eigen::Tensor4dXcf mix_stft = mix_spec.shuffle(x_perm);

    const int nb_frames = mix_stft.dimension(1);
    const int nb_bins = mix_stft.dimension(2);
    const int nb_channels = mix_stft.dimension(3);
    const int nb_v_channels = v.dimension(3);

    if (v.dimension(1) != nb_frames || v.dimension(2) != nb_bins)
    {
        throw ShapeError("estimates have " + std::to_string(v.dimension(1)) +
                         " frames and " + std::to_string(v.dimension(2)) +
                         " bins, mixture has " + std::to_string(nb_frames) +
                         " frames and " + std::to_string(nb_bins) + " bins");
    }
    if (nb_v_channels != 1 && nb_v_channels != nb_channels)
    {
        throw ShapeError("estimates have " + std::to_string(nb_v_channels) +
                         " channels, mixture has " +
                         std::to_string(nb_channels));
    }

    const int nb_sources = names.size();

    // (nb_samples, nb_frames, nb_bins, nb_channels, nb_sources)
    Eigen::Tensor5dXcf targets_stft(nb_samples, nb_frames, nb_bins, nb_channels,
                                    nb_sources);
    targets_stft.setZero();

    const int batch_size =
        config_.batch_size > 0 ? config_.batch_size : nb_frames;

    for (int sample = 0; sample < nb_samples; ++sample)
    {
        // independent windows [pos, t_end), the last one may be shorter
        int pos = 0;
        while (pos < nb_frames)
        {
            int t_end = std::min(nb_frames, pos + batch_size);
            int len = t_end - pos;

            Eigen::array<Eigen::Index, 4> v_offsets{{pos, 0, 0, 0}};
            Eigen::array<Eigen::Index, 4> v_extents{
                {len, nb_bins, nb_v_channels, nb_targets}};
            Eigen::Tensor4dXf v_batch =
                v.chip(sample, 0).slice(v_offsets, v_extents);

            Eigen::array<Eigen::Index, 3> x_offsets{{pos, 0, 0}};
            Eigen::array<Eigen::Index, 3> x_extents{{len, nb_bins, nb_channels}};
            Eigen::Tensor3dXcf x_batch =
                mix_stft.chip(sample, 0).slice(x_offsets, x_extents);

            Eigen::Tensor4dXcf y_batch =
                wiener(v_batch, x_batch, config_.niter, config_.softmask,
                       residual);

            for (int t = 0; t < len; ++t)
            {
                for (int bin = 0; bin < nb_bins; ++bin)
                {
                    for (int channel = 0; channel < nb_channels; ++channel)
                    {
                        for (int source = 0; source < nb_sources; ++source)
                        {
                            targets_stft(sample, pos + t, bin, channel,
                                         source) =
                                y_batch(t, bin, channel, source);
                        }
                    }
                }
            }

            pos = t_end;
        }
    }

    // getting to (nb_samples, nb_sources, nb_channels, nb_bins, nb_frames)
    Eigen::array<int, 5> out_perm{{0, 4, 3, 2, 1}};
    Eigen::Tensor5dXcf sources_stft = targets_stft.shuffle(out_perm);

    // now performing the inverse stfts, trimmed to the mixture length
    estimates_map estimates;
    for (int source = 0; source < nb_sources; ++source)
    {
        Eigen::Tensor4dXcf source_stft = sources_stft.chip(source, 1);
        estimates[names[source]] = istft(source_stft, stft_, nb_timesteps);
    }

    return estimates;
}

stemsep::target_list
stemsep::make_umx_targets(std::vector<std::pair<std::string, umx_model>> models)
{
    target_list targets;
    for (auto &model : models)
    {
        targets.emplace_back(model.first,
                             std::make_unique<UmxEstimator>(std::move(model.second)));
    }
    return targets;
}

stemsep::estimates_map stemsep::aggregate(
    const estimates_map &estimates,
    const std::vector<std::pair<std::string, std::vector<std::string>>> &groups)
{
    estimates_map out;
    for (const auto &group : groups)
    {
        if (group.second.empty())
        {
            throw ConfigurationError("group '" + group.first + "' is empty");
        }

        Eigen::Tensor3dXf sum;
        for (std::size_t i = 0; i < group.second.size(); ++i)
        {
            auto it = estimates.find(group.second[i]);
            if (it == estimates.end())
            {
                throw ConfigurationError("group '" + group.first +
                                         "' refers to unknown target '" +
                                         group.second[i] + "'");
            }
            if (i == 0)
            {
                sum = it->second;
            }
            else
            {
                bool same = true;
                for (int d = 0; d < 3; ++d)
                {
                    same = same && it->second.dimension(d) == sum.dimension(d);
                }
                if (!same)
                {
                    throw ShapeError("estimates of group '" + group.first +
                                     "' have different shapes");
                }
                sum += it->second;
            }
        }
        out[group.first] = sum;
    }
    return out;
}
