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

#ifndef INCLUDED_axgb_maths_CBoostedTreeEngine_h
#define INCLUDED_axgb_maths_CBoostedTreeEngine_h

#include <maths/CBoostedTree.h>
#include <maths/CBoostingEngine.h>
#include <maths/ImportExport.h>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace axgb {
namespace maths {

//! \brief Trains single regression trees on the binary logistic loss.
//!
//! DESCRIPTION:\n
//! Each call to trainOneRound performs one round of gradient boosting: it
//! computes the gradient and curvature of the logistic loss at the supplied
//! base margins and greedily grows one tree to minimise the second order
//! approximation of the loss.
//!
//! IMPLEMENTATION:\n
//! Split search is exact. For each leaf and feature the leaf's rows are
//! sorted by feature value and every boundary between distinct values is
//! a candidate split. Rows with a missing value are tried on both sides and
//! the better direction is remembered by the node. The tree is grown depth
//! first down to the maximum depth, stopping early at leaves for which no
//! split has positive gain.
class MATHS_EXPORT CBoostedTreeEngine final : public CBoostingEngine {
public:
    using TSizeVec = std::vector<std::size_t>;
    using TDoubleVec = std::vector<double>;

public:
    TTrainedTreeCPtr trainOneRound(const TDenseMatrix& features,
                                   const TDenseVector& labels,
                                   const TDenseVector& baseMargins,
                                   const SBoostedTreeParameters& parameters) override;

    TDenseVector score(const CTrainedTree& tree,
                       const TDenseMatrix& features,
                       const TDenseVector& baseMargins,
                       bool wantMargin) const override;

    //! The logistic loss gradient w.r.t. the margin.
    static double gradient(double margin, double label);

    //! The logistic loss curvature w.r.t. the margin.
    static double curvature(double margin);

private:
    //! \brief The best split of a leaf.
    struct SSplitStatistics {
        std::string print() const;

        double s_Gain{-std::numeric_limits<double>::max()};
        std::size_t s_Feature{0};
        double s_SplitAt{0.0};
        bool s_AssignMissingToLeft{true};
    };

    //! \brief A leaf which is a candidate to split.
    struct SLeaf {
        CBoostedTreeNode::TNodeIndex s_Node;
        std::size_t s_Depth;
        TSizeVec s_Rows;
    };

private:
    SSplitStatistics bestSplit(const TDenseMatrix& features,
                               const TSizeVec& rows,
                               double gradient,
                               double curvature,
                               const SBoostedTreeParameters& parameters) const;

    static double gain(double gradientLeft,
                       double curvatureLeft,
                       double gradientRight,
                       double curvatureRight,
                       double gradient,
                       double curvature,
                       const SBoostedTreeParameters& parameters);

private:
    TDoubleVec m_Gradients;
    TDoubleVec m_Curvatures;
};
}
}

#endif // INCLUDED_axgb_maths_CBoostedTreeEngine_h
