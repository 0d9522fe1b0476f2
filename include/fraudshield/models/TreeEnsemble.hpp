#pragma once

#include "fraudshield/core/Types.hpp"

#include <string>
#include <vector>

namespace fraudshield {

struct TreeNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    bool default_left = true;  // route taken for a non-finite input
    double leaf = 0.0;

    bool isLeaf() const { return left < 0; }
};

struct Tree {
    std::vector<TreeNode> nodes;  // nodes[0] is the root
};

// Gradient-boosted binary classifier: sigmoid(base_margin + sum of leaves).
class TreeEnsemble {
public:
    // Throws ModelUnavailableError on a structurally invalid ensemble.
    TreeEnsemble(
        std::vector<Tree> trees,
        std::size_t num_features,
        double base_margin
    );

    static TreeEnsemble load(const std::string& path);
    static TreeEnsemble parse(const std::string& json_text);

    double margin(const FeatureVector& x) const;
    double probability(const FeatureVector& x) const;

    std::size_t numFeatures() const { return num_features_; }
    std::size_t numTrees() const { return trees_.size(); }
    double baseMargin() const { return base_margin_; }

private:
    double leafValue(const Tree& t, const FeatureVector& x) const;

    std::vector<Tree> trees_;
    std::size_t num_features_;
    double base_margin_;
};

double sigmoid(double z);

}
