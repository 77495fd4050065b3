/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */

#include <maths/CBoostedTreeEngine.h>

#include <core/CLogger.h>

#include <maths/CTools.h>

#include <algorithm>
#include <memory>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace axgb {
namespace maths {
namespace {
const double EPSILON{100.0 * std::numeric_limits<double>::epsilon()};

//! \brief A row's feature value and loss derivatives.
struct SValueDerivatives {
    bool operator<(const SValueDerivatives& rhs) const {
        return s_Value < rhs.s_Value;
    }
    double s_Value;
    double s_Gradient;
    double s_Curvature;
};
using TValueDerivativesVec = std::vector<SValueDerivatives>;
}

CBoostingEngine::TTrainedTreeCPtr
CBoostedTreeEngine::trainOneRound(const TDenseMatrix& features,
                                  const TDenseVector& labels,
                                  const TDenseVector& baseMargins,
                                  const SBoostedTreeParameters& parameters) {

    if (labels.size() != features.rows() || baseMargins.size() != features.rows()) {
        std::ostringstream message;
        message << "Input error: " << features.rows() << " rows but "
                << labels.size() << " labels and " << baseMargins.size() << " base margins";
        throw std::runtime_error{message.str()};
    }

    LOG_TRACE(<< "Training on " << features.rows() << " x " << features.cols()
              << " with " << parameters.print());

    std::size_t numberRows{static_cast<std::size_t>(features.rows())};
    m_Gradients.resize(numberRows);
    m_Curvatures.resize(numberRows);
    for (std::size_t i = 0; i < numberRows; ++i) {
        auto row = static_cast<Eigen::Index>(i);
        m_Gradients[i] = gradient(baseMargins(row), labels(row));
        m_Curvatures[i] = curvature(baseMargins(row));
    }

    CBoostedTree::TNodeVec tree(1);
    TSizeVec rows(numberRows);
    std::iota(rows.begin(), rows.end(), 0);

    std::vector<SLeaf> leaves;
    leaves.push_back(SLeaf{0, 0, std::move(rows)});

    while (leaves.empty() == false) {
        SLeaf leaf{std::move(leaves.back())};
        leaves.pop_back();

        double g{0.0};
        double h{0.0};
        for (auto row : leaf.s_Rows) {
            g += m_Gradients[row];
            h += m_Curvatures[row];
        }
        tree[leaf.s_Node].value(-parameters.s_Eta * g / (h + parameters.s_Lambda));
        tree[leaf.s_Node].numberSamples(leaf.s_Rows.size());

        if (leaf.s_Depth >= parameters.s_MaximumDepth) {
            continue;
        }

        SSplitStatistics split{this->bestSplit(features, leaf.s_Rows, g, h, parameters)};
        if (split.s_Gain <= 0.0) {
            continue;
        }
        LOG_TRACE(<< "Splitting node " << leaf.s_Node << ": " << split.print());

        CBoostedTreeNode::TNodeIndex leftChild;
        CBoostedTreeNode::TNodeIndex rightChild;
        std::tie(leftChild, rightChild) =
            tree[leaf.s_Node].split(split.s_Feature, split.s_SplitAt,
                                    split.s_AssignMissingToLeft, split.s_Gain, h, tree);

        TSizeVec leftRows;
        TSizeVec rightRows;
        const CBoostedTreeNode& node{tree[leaf.s_Node]};
        for (auto row : leaf.s_Rows) {
            double value{features(static_cast<Eigen::Index>(row),
                                  static_cast<Eigen::Index>(split.s_Feature))};
            (node.assignToLeft(value) ? leftRows : rightRows).push_back(row);
        }
        leaves.push_back(SLeaf{rightChild, leaf.s_Depth + 1, std::move(rightRows)});
        leaves.push_back(SLeaf{leftChild, leaf.s_Depth + 1, std::move(leftRows)});
    }

    auto result = std::make_shared<const CBoostedTree>(std::move(tree));
    LOG_TRACE(<< "Trained tree " << result->print());
    return result;
}

CBoostingEngine::TDenseVector CBoostedTreeEngine::score(const CTrainedTree& tree,
                                                        const TDenseMatrix& features,
                                                        const TDenseVector& baseMargins,
                                                        bool wantMargin) const {
    if (baseMargins.size() != features.rows()) {
        std::ostringstream message;
        message << "Input error: " << features.rows() << " rows but "
                << baseMargins.size() << " base margins";
        throw std::runtime_error{message.str()};
    }

    TDenseVector result{baseMargins};
    for (Eigen::Index i = 0; i < features.rows(); ++i) {
        result(i) += tree.margin(features, i);
        if (wantMargin == false) {
            result(i) = CTools::logisticFunction(result(i));
        }
    }
    return result;
}

double CBoostedTreeEngine::gradient(double margin, double label) {
    return CTools::logisticFunction(margin) - label;
}

double CBoostedTreeEngine::curvature(double margin) {
    double p{CTools::logisticFunction(margin)};
    return std::max(p * (1.0 - p), EPSILON);
}

CBoostedTreeEngine::SSplitStatistics
CBoostedTreeEngine::bestSplit(const TDenseMatrix& features,
                              const TSizeVec& rows,
                              double g,
                              double h,
                              const SBoostedTreeParameters& parameters) const {

    SSplitStatistics result;

    TValueDerivativesVec values;
    values.reserve(rows.size());

    for (Eigen::Index feature = 0; feature < features.cols(); ++feature) {
        values.clear();
        double gMissing{0.0};
        double hMissing{0.0};
        for (auto row : rows) {
            double value{features(static_cast<Eigen::Index>(row), feature)};
            if (CTools::isMissing(value)) {
                gMissing += m_Gradients[row];
                hMissing += m_Curvatures[row];
            } else {
                values.push_back({value, m_Gradients[row], m_Curvatures[row]});
            }
        }
        std::sort(values.begin(), values.end());

        double gLeft{0.0};
        double hLeft{0.0};
        for (std::size_t i = 0; i + 1 < values.size(); ++i) {
            gLeft += values[i].s_Gradient;
            hLeft += values[i].s_Curvature;
            if (values[i].s_Value == values[i + 1].s_Value) {
                continue;
            }
            for (bool missingLeft : {true, false}) {
                double gl{missingLeft ? gLeft + gMissing : gLeft};
                double hl{missingLeft ? hLeft + hMissing : hLeft};
                double gr{g - gl};
                double hr{h - hl};
                if (hl < parameters.s_MinimumChildWeight ||
                    hr < parameters.s_MinimumChildWeight) {
                    continue;
                }
                double gain{CBoostedTreeEngine::gain(gl, hl, gr, hr, g, h, parameters)};
                if (gain > result.s_Gain) {
                    result.s_Gain = gain;
                    result.s_Feature = static_cast<std::size_t>(feature);
                    result.s_SplitAt = 0.5 * (values[i].s_Value + values[i + 1].s_Value);
                    result.s_AssignMissingToLeft = missingLeft;
                }
            }
        }
    }

    return result;
}

double CBoostedTreeEngine::gain(double gradientLeft,
                                double curvatureLeft,
                                double gradientRight,
                                double curvatureRight,
                                double gradient,
                                double curvature,
                                const SBoostedTreeParameters& parameters) {
    double lambda{parameters.s_Lambda};
    return 0.5 * (CTools::pow2(gradientLeft) / (curvatureLeft + lambda) +
                  CTools::pow2(gradientRight) / (curvatureRight + lambda) -
                  CTools::pow2(gradient) / (curvature + lambda)) -
           parameters.s_Gamma;
}

std::string CBoostedTreeEngine::SSplitStatistics::print() const {
    std::ostringstream result;
    result << "split feature '" << s_Feature << "' @ " << s_SplitAt
           << ", gain = " << s_Gain
           << (s_AssignMissingToLeft ? ", missing left" : ", missing right");
    return result.str();
}
}
}
