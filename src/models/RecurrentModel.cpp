#include "fraudshield/models/RecurrentModel.hpp"
#include "fraudshield/models/TreeEnsemble.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <fstream>
#include <iterator>

namespace json = boost::json;

namespace fraudshield {

namespace {

void requireFinite(const std::vector<double>& v, const char* what) {
    for (double d : v) {
        if (!std::isfinite(d)) {
            throw ModelUnavailableError(std::string("sequential model: non-finite ") + what);
        }
    }
}

std::vector<double> vectorOf(const json::value& v, const char* key) {
    const json::array* arr = v.if_array();
    if (!arr) {
        throw ModelUnavailableError(std::string("sequential model: '") + key + "' must be an array");
    }
    std::vector<double> out;
    out.reserve(arr->size());
    for (const auto& e : *arr) {
        if (!e.is_number()) {
            throw ModelUnavailableError(std::string("sequential model: '") + key + "' must hold numbers");
        }
        out.push_back(e.to_number<double>());
    }
    return out;
}

std::vector<std::vector<double>> matrixOf(const json::value& v, const char* key) {
    const json::array* arr = v.if_array();
    if (!arr) {
        throw ModelUnavailableError(std::string("sequential model: '") + key + "' must be an array");
    }
    std::vector<std::vector<double>> out;
    out.reserve(arr->size());
    for (const auto& row : *arr) {
        out.push_back(vectorOf(row, key));
    }
    return out;
}

const json::value& field(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v) {
        throw ModelUnavailableError(std::string("sequential model: missing '") + key + "'");
    }
    return *v;
}

std::size_t sizeField(const json::object& o, const char* key) {
    const json::value& v = field(o, key);
    if (!v.is_number()) {
        throw ModelUnavailableError(std::string("sequential model: '") + key + "' must be a number");
    }
    const double d = v.to_number<double>();
    if (std::floor(d) != d || d < 0 || d > 1e6) {
        throw ModelUnavailableError(std::string("sequential model: '") + key + "' must be a count");
    }
    return static_cast<std::size_t>(d);
}

}

RecurrentModel::RecurrentModel(Weights w) : w_(std::move(w)) {
    const std::size_t gates = 4 * w_.hidden_size;

    if (w_.input_size == 0 || w_.hidden_size == 0 || w_.window == 0) {
        throw ModelUnavailableError("sequential model: sizes must be positive");
    }
    if (w_.kernel.size() != w_.input_size) {
        throw ModelUnavailableError("sequential model: kernel must have input_size rows");
    }
    for (const auto& row : w_.kernel) {
        if (row.size() != gates) {
            throw ModelUnavailableError("sequential model: kernel rows must have 4*hidden_size columns");
        }
        requireFinite(row, "kernel");
    }
    if (w_.recurrent_kernel.size() != w_.hidden_size) {
        throw ModelUnavailableError("sequential model: recurrent_kernel must have hidden_size rows");
    }
    for (const auto& row : w_.recurrent_kernel) {
        if (row.size() != gates) {
            throw ModelUnavailableError(
                "sequential model: recurrent_kernel rows must have 4*hidden_size columns");
        }
        requireFinite(row, "recurrent_kernel");
    }
    if (w_.bias.size() != gates) {
        throw ModelUnavailableError("sequential model: bias must have 4*hidden_size entries");
    }
    requireFinite(w_.bias, "bias");
    if (w_.output_kernel.size() != w_.hidden_size) {
        throw ModelUnavailableError("sequential model: output_kernel must have hidden_size entries");
    }
    requireFinite(w_.output_kernel, "output_kernel");
    if (!std::isfinite(w_.output_bias)) {
        throw ModelUnavailableError("sequential model: non-finite output_bias");
    }
}

double RecurrentModel::probability(const std::vector<FeatureVector>& sequence) const {
    if (sequence.size() != w_.window) {
        throw std::invalid_argument(
            "sequential model expects " + std::to_string(w_.window) +
            " steps, got " + std::to_string(sequence.size()));
    }

    const std::size_t H = w_.hidden_size;
    std::vector<double> h(H, 0.0);
    std::vector<double> c(H, 0.0);
    std::vector<double> z(4 * H);

    for (const auto& x : sequence) {
        if (x.size() != w_.input_size) {
            throw std::invalid_argument(
                "sequential model expects " + std::to_string(w_.input_size) +
                " features per step, got " + std::to_string(x.size()));
        }

        z = w_.bias;
        for (std::size_t i = 0; i < w_.input_size; ++i) {
            const double xi = x[i];
            if (xi == 0.0) continue;
            const auto& row = w_.kernel[i];
            for (std::size_t j = 0; j < z.size(); ++j) z[j] += xi * row[j];
        }
        for (std::size_t k = 0; k < H; ++k) {
            const double hk = h[k];
            if (hk == 0.0) continue;
            const auto& row = w_.recurrent_kernel[k];
            for (std::size_t j = 0; j < z.size(); ++j) z[j] += hk * row[j];
        }

        for (std::size_t k = 0; k < H; ++k) {
            const double ig = sigmoid(z[k]);
            const double fg = sigmoid(z[H + k]);
            const double cg = std::tanh(z[2 * H + k]);
            const double og = sigmoid(z[3 * H + k]);

            c[k] = fg * c[k] + ig * cg;
            h[k] = og * std::tanh(c[k]);
        }
    }

    double out = w_.output_bias;
    for (std::size_t k = 0; k < H; ++k) {
        out += w_.output_kernel[k] * h[k];
    }
    return sigmoid(out);
}

RecurrentModel RecurrentModel::parse(const std::string& json_text) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ModelUnavailableError(std::string("sequential model: ") + e.what());
    }

    const json::object* root = doc.if_object();
    if (!root) {
        throw ModelUnavailableError("sequential model: expected a JSON object");
    }

    Weights w;
    w.input_size = sizeField(*root, "input_size");
    w.hidden_size = sizeField(*root, "hidden_size");
    w.window = sizeField(*root, "window");
    w.kernel = matrixOf(field(*root, "kernel"), "kernel");
    w.recurrent_kernel = matrixOf(field(*root, "recurrent_kernel"), "recurrent_kernel");
    w.bias = vectorOf(field(*root, "bias"), "bias");
    w.output_kernel = vectorOf(field(*root, "output_kernel"), "output_kernel");

    const json::value& ob = field(*root, "output_bias");
    if (!ob.is_number()) {
        throw ModelUnavailableError("sequential model: 'output_bias' must be a number");
    }
    w.output_bias = ob.to_number<double>();

    return RecurrentModel(std::move(w));
}

RecurrentModel RecurrentModel::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ModelUnavailableError("sequential model: cannot open " + path);
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    return parse(data);
}

}
