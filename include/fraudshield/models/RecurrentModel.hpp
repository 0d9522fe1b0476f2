#pragma once

#include "fraudshield/core/Types.hpp"

#include <string>
#include <vector>

namespace fraudshield {

// Single-layer LSTM with a sigmoid dense head. Weights use the Keras layout:
// kernel is input_size x 4*hidden, recurrent_kernel is hidden x 4*hidden,
// gate blocks ordered input, forget, cell, output.
class RecurrentModel {
public:
    struct Weights {
        std::size_t input_size = 0;
        std::size_t hidden_size = 0;
        std::size_t window = 0;

        std::vector<std::vector<double>> kernel;
        std::vector<std::vector<double>> recurrent_kernel;
        std::vector<double> bias;

        std::vector<double> output_kernel;
        double output_bias = 0.0;
    };

    // Throws ModelUnavailableError when shapes disagree.
    explicit RecurrentModel(Weights w);

    static RecurrentModel load(const std::string& path);
    static RecurrentModel parse(const std::string& json_text);

    // sequence must hold exactly window() vectors of inputSize(), oldest first.
    double probability(const std::vector<FeatureVector>& sequence) const;

    std::size_t inputSize() const { return w_.input_size; }
    std::size_t hiddenSize() const { return w_.hidden_size; }
    std::size_t window() const { return w_.window; }

private:
    Weights w_;
};

}
