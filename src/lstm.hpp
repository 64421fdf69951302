#ifndef LSTM_HPP
#define LSTM_HPP

#include <Eigen/Dense>
#include <array>
#include <vector>

namespace stemsep
{

// one direction of one layer, weights in torch orientation
// w_ih: (4*hidden, input), w_hh: (4*hidden, hidden), gate order i, f, g, o
struct lstm_cell
{
    Eigen::MatrixXf w_ih;
    Eigen::MatrixXf w_hh;
    Eigen::VectorXf b_ih;
    Eigen::VectorXf b_hh;
};

struct lstm_params
{
    int input_size = 0;
    int hidden_size = 0;
    int nb_layers = 0;
    bool bidirectional = true;
    // inter-layer dropout, only meaningful in training
    float dropout = 0.0f;

    // layers[layer][direction], direction 1 is the reverse pass
    std::vector<std::array<lstm_cell, 2>> layers;
};

// allocate zero weights for the given topology
lstm_params init_lstm(int input_size, int hidden_size, int nb_layers,
                      bool bidirectional);

// input rows are ordered (frame * nb_samples + sample), i.e. a
// (nb_frames, nb_samples, input_size) sequence flattened frame-major
// returns (nb_frames * nb_samples, nb_directions * hidden_size)
Eigen::MatrixXf lstm_forward(const lstm_params &lstm,
                             const Eigen::MatrixXf &input, int nb_frames,
                             int nb_samples);

} // namespace stemsep

#endif // LSTM_HPP
