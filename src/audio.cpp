#include "audio.hpp"
#include <iostream>
#include <libnyquist/Common.h>
#include <libnyquist/Decoders.h>
#include <libnyquist/Encoders.h>
#include <memory>
#include <stdexcept>
#include <string>

using namespace nqr;

Eigen::MatrixXf stemsep::load_audio(const std::string &filename)
{
    // load a wav file with libnyquist
    std::shared_ptr<AudioData> fileData = std::make_shared<AudioData>();

    NyquistIO loader;

    loader.Load(fileData.get(), filename);

    if (fileData->sampleRate != SUPPORTED_SAMPLE_RATE)
    {
        throw std::runtime_error(
            "stemsep only supports the following sample rate (Hz): " +
            std::to_string(SUPPORTED_SAMPLE_RATE) + ", got " +
            std::to_string(fileData->sampleRate));
    }

    std::cout << "Input Samples: " << fileData->samples.size() << std::endl;
    std::cout << "Length in seconds: " << fileData->lengthSeconds << std::endl;
    std::cout << "Number of channels: " << fileData->channelCount << std::endl;

    if (fileData->channelCount != 2 && fileData->channelCount != 1)
    {
        throw std::runtime_error("stemsep only supports mono and stereo audio");
    }

    // number of samples per channel
    size_t N = fileData->samples.size() / fileData->channelCount;

    Eigen::MatrixXf ret(2, N);

    if (fileData->channelCount == 1)
    {
        // Mono case
        for (size_t i = 0; i < N; ++i)
        {
            ret(0, i) = fileData->samples[i]; // left channel
            ret(1, i) = fileData->samples[i]; // right channel
        }
    }
    else
    {
        // Stereo case
        for (size_t i = 0; i < N; ++i)
        {
            ret(0, i) = fileData->samples[2 * i];     // left channel
            ret(1, i) = fileData->samples[2 * i + 1]; // right channel
        }
    }

    return ret;
}

void stemsep::write_audio_file(const Eigen::MatrixXf &waveform,
                               const std::string &filename, int sample_rate)
{
    // create a struct to hold the audio data
    std::shared_ptr<AudioData> fileData = std::make_shared<AudioData>();

    fileData->sampleRate = sample_rate;
    fileData->channelCount = waveform.rows();

    // interleave the channels
    fileData->samples.resize(waveform.cols() * waveform.rows());

    for (Eigen::Index i = 0; i < waveform.cols(); ++i)
    {
        for (Eigen::Index ch = 0; ch < waveform.rows(); ++ch)
        {
            fileData->samples[waveform.rows() * i + ch] = waveform(ch, i);
        }
    }

    int encoderStatus =
        encode_wav_to_disk({fileData->channelCount, PCM_FLT, DITHER_TRIANGLE},
                           fileData.get(), filename);
    if (encoderStatus != EncoderError::NoError)
    {
        throw std::runtime_error("Failed to write " + filename +
                                 ", encoder status " +
                                 std::to_string(encoderStatus));
    }
    std::cout << "Wrote " << filename << std::endl;
}

Eigen::Tensor3dXf stemsep::to_batch(const Eigen::MatrixXf &waveform)
{
    Eigen::Tensor3dXf audio(1, waveform.rows(), waveform.cols());
    for (Eigen::Index ch = 0; ch < waveform.rows(); ++ch)
    {
        for (Eigen::Index i = 0; i < waveform.cols(); ++i)
        {
            audio(0, ch, i) = waveform(ch, i);
        }
    }
    return audio;
}

Eigen::MatrixXf stemsep::from_batch(const Eigen::Tensor3dXf &audio, int sample)
{
    Eigen::MatrixXf waveform(audio.dimension(1), audio.dimension(2));
    for (Eigen::Index ch = 0; ch < waveform.rows(); ++ch)
    {
        for (Eigen::Index i = 0; i < waveform.cols(); ++i)
        {
            waveform(ch, i) = audio(sample, ch, i);
        }
    }
    return waveform;
}
