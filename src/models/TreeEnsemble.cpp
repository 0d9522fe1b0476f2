#include "fraudshield/models/TreeEnsemble.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <fstream>
#include <iterator>

namespace json = boost::json;

namespace fraudshield {

namespace {

int integral(const json::value& v, const char* key) {
    const double d = v.to_number<double>();
    if (std::floor(d) != d || d < -1e9 || d > 1e9) {
        throw ModelUnavailableError(std::string("static model: '") + key + "' must be an integer");
    }
    return static_cast<int>(d);
}

}

double sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

TreeEnsemble::TreeEnsemble(
    std::vector<Tree> trees,
    std::size_t num_features,
    double base_margin
) : trees_(std::move(trees)),
    num_features_(num_features),
    base_margin_(base_margin) {

    if (num_features_ == 0) {
        throw ModelUnavailableError("static model: num_features must be positive");
    }
    if (!std::isfinite(base_margin_)) {
        throw ModelUnavailableError("static model: base_margin must be finite");
    }

    for (std::size_t t = 0; t < trees_.size(); ++t) {
        const auto& nodes = trees_[t].nodes;
        const std::string where = "static model: tree " + std::to_string(t);

        if (nodes.empty()) {
            throw ModelUnavailableError(where + " has no nodes");
        }

        const int n = static_cast<int>(nodes.size());
        for (int i = 0; i < n; ++i) {
            const TreeNode& nd = nodes[i];
            if (nd.isLeaf()) {
                if (nd.right >= 0 || !std::isfinite(nd.leaf)) {
                    throw ModelUnavailableError(where + " has a malformed leaf at node " +
                                                std::to_string(i));
                }
                continue;
            }
            // Children must come after their parent: no cycles, no dangling links
            if (nd.left <= i || nd.left >= n || nd.right <= i || nd.right >= n) {
                throw ModelUnavailableError(where + " has a bad child link at node " +
                                            std::to_string(i));
            }
            if (nd.feature < 0 || static_cast<std::size_t>(nd.feature) >= num_features_) {
                throw ModelUnavailableError(where + " splits on unknown feature " +
                                            std::to_string(nd.feature));
            }
            if (!std::isfinite(nd.threshold)) {
                throw ModelUnavailableError(where + " has a non-finite threshold");
            }
        }
    }
}

double TreeEnsemble::leafValue(const Tree& t, const FeatureVector& x) const {
    int i = 0;
    while (!t.nodes[i].isLeaf()) {
        const TreeNode& nd = t.nodes[i];
        const double v = x[static_cast<std::size_t>(nd.feature)];
        if (!std::isfinite(v)) {
            i = nd.default_left ? nd.left : nd.right;
        } else {
            i = (v < nd.threshold) ? nd.left : nd.right;
        }
    }
    return t.nodes[i].leaf;
}

double TreeEnsemble::margin(const FeatureVector& x) const {
    if (x.size() != num_features_) {
        throw std::invalid_argument(
            "static model expects " + std::to_string(num_features_) +
            " features, got " + std::to_string(x.size()));
    }

    double sum = base_margin_;
    for (const auto& t : trees_) {
        sum += leafValue(t, x);
    }
    return sum;
}

double TreeEnsemble::probability(const FeatureVector& x) const {
    return sigmoid(margin(x));
}

TreeEnsemble TreeEnsemble::parse(const std::string& json_text) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ModelUnavailableError(std::string("static model: ") + e.what());
    }

    const json::object* root = doc.if_object();
    if (!root) {
        throw ModelUnavailableError("static model: expected a JSON object");
    }

    auto num = [](const json::object& o, const char* key) -> const json::value* {
        const json::value* v = o.if_contains(key);
        return (v && v->is_number()) ? v : nullptr;
    };

    const json::value* nf = num(*root, "num_features");
    const json::value* trees = root->if_contains("trees");
    if (!nf || !trees || !trees->is_array()) {
        throw ModelUnavailableError("static model: needs 'num_features' and 'trees'");
    }

    double base_margin = 0.0;
    if (const json::value* bm = num(*root, "base_margin")) {
        base_margin = bm->to_number<double>();
    }

    std::vector<Tree> parsed;
    for (const auto& tv : trees->get_array()) {
        const json::object* to = tv.if_object();
        const json::value* nodes = to ? to->if_contains("nodes") : nullptr;
        if (!nodes || !nodes->is_array()) {
            throw ModelUnavailableError("static model: tree without 'nodes'");
        }

        Tree tree;
        for (const auto& nv : nodes->get_array()) {
            const json::object* no = nv.if_object();
            if (!no) {
                throw ModelUnavailableError("static model: node must be an object");
            }

            TreeNode nd;
            if (const json::value* leaf = num(*no, "leaf")) {
                nd.leaf = leaf->to_number<double>();
            } else {
                const json::value* f = num(*no, "feature");
                const json::value* th = num(*no, "threshold");
                const json::value* l = num(*no, "left");
                const json::value* r = num(*no, "right");
                if (!f || !th || !l || !r) {
                    throw ModelUnavailableError(
                        "static model: split node needs feature, threshold, left, right");
                }
                nd.feature = integral(*f, "feature");
                nd.threshold = th->to_number<double>();
                nd.left = integral(*l, "left");
                nd.right = integral(*r, "right");
                if (const json::value* dl = no->if_contains("default_left")) {
                    nd.default_left = dl->is_bool() ? dl->get_bool() : true;
                }
            }
            tree.nodes.push_back(nd);
        }
        parsed.push_back(std::move(tree));
    }

    const int num_features = integral(*nf, "num_features");
    if (num_features <= 0) {
        throw ModelUnavailableError("static model: num_features must be positive");
    }

    return TreeEnsemble(
        std::move(parsed),
        static_cast<std::size_t>(num_features),
        base_margin
    );
}

TreeEnsemble TreeEnsemble::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ModelUnavailableError("static model: cannot open " + path);
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    return parse(data);
}

}
