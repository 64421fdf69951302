#include "lstm.hpp"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

static Eigen::ArrayXXf sigmoid(const Eigen::ArrayXXf &x)
{
    return ((-x).exp() + 1.0f).inverse();
}

stemsep::lstm_params stemsep::init_lstm(int input_size, int hidden_size,
                                        int nb_layers, bool bidirectional)
{
    lstm_params lstm;
    lstm.input_size = input_size;
    lstm.hidden_size = hidden_size;
    lstm.nb_layers = nb_layers;
    lstm.bidirectional = bidirectional;
    lstm.dropout = nb_layers > 1 ? 0.4f : 0.0f;

    const int nb_directions = bidirectional ? 2 : 1;

    lstm.layers.resize(nb_layers);
    for (int layer = 0; layer < nb_layers; ++layer)
    {
        // layers after the first consume the concatenated directions
        int layer_input = layer == 0 ? input_size : nb_directions * hidden_size;
        for (int direction = 0; direction < nb_directions; ++direction)
        {
            lstm_cell &cell = lstm.layers[layer][direction];
            cell.w_ih = Eigen::MatrixXf::Zero(4 * hidden_size, layer_input);
            cell.w_hh = Eigen::MatrixXf::Zero(4 * hidden_size, hidden_size);
            cell.b_ih = Eigen::VectorXf::Zero(4 * hidden_size);
            cell.b_hh = Eigen::VectorXf::Zero(4 * hidden_size);
        }
    }

    return lstm;
}

Eigen::MatrixXf stemsep::lstm_forward(const lstm_params &lstm,
                                      const Eigen::MatrixXf &input,
                                      int nb_frames, int nb_samples)
{
    if (input.rows() != (Eigen::Index)nb_frames * nb_samples ||
        input.cols() != lstm.input_size)
    {
        throw std::invalid_argument(
            "lstm input has shape (" + std::to_string(input.rows()) + ", " +
            std::to_string(input.cols()) + "), expected (" +
            std::to_string(nb_frames * nb_samples) + ", " +
            std::to_string(lstm.input_size) + ")");
    }

    const int H = lstm.hidden_size;
    const int nb_directions = lstm.bidirectional ? 2 : 1;

    Eigen::MatrixXf x = input;

    for (int layer = 0; layer < lstm.nb_layers; ++layer)
    {
        Eigen::MatrixXf out(x.rows(), nb_directions * H);

        for (int direction = 0; direction < nb_directions; ++direction)
        {
            const lstm_cell &cell = lstm.layers[layer][direction];

            // input projection of every timestep at once
            Eigen::MatrixXf gates_x = x * cell.w_ih.transpose();
            gates_x.rowwise() += (cell.b_ih + cell.b_hh).transpose();

            Eigen::MatrixXf h = Eigen::MatrixXf::Zero(nb_samples, H);
            Eigen::ArrayXXf c = Eigen::ArrayXXf::Zero(nb_samples, H);

            for (int step = 0; step < nb_frames; ++step)
            {
                int t = direction == 0 ? step : nb_frames - 1 - step;

                Eigen::MatrixXf gates =
                    gates_x.middleRows(t * nb_samples, nb_samples) +
                    h * cell.w_hh.transpose();

                Eigen::ArrayXXf i = sigmoid(gates.leftCols(H).array());
                Eigen::ArrayXXf f = sigmoid(gates.middleCols(H, H).array());
                Eigen::ArrayXXf g = gates.middleCols(2 * H, H).array().tanh();
                Eigen::ArrayXXf o = sigmoid(gates.rightCols(H).array());

                c = f * c + i * g;
                h = (o * c.tanh()).matrix();

                out.block(t * nb_samples, direction * H, nb_samples, H) = h;
            }
        }

        x = out;
    }

    return x;
}
