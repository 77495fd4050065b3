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

#ifndef INCLUDED_axgb_maths_CBoostingEngine_h
#define INCLUDED_axgb_maths_CBoostingEngine_h

#include <maths/CLinearAlgebraEigen.h>
#include <maths/ImportExport.h>

#include <cstddef>
#include <memory>
#include <string>

namespace axgb {
namespace maths {

//! \brief The hyperparameters of a single boosting round.
//!
//! The objective is always binary logistic and each call trains exactly
//! one tree, so these are the only knobs.
struct MATHS_EXPORT SBoostedTreeParameters {
    //! The learning rate, i.e. the shrinkage applied to leaf values.
    double s_Eta{0.3};
    //! The maximum depth of the tree, the root is at depth zero.
    std::size_t s_MaximumDepth{6};
    //! The L2 regularisation of leaf values.
    double s_Lambda{1.0};
    //! The minimum loss reduction needed to split a leaf.
    double s_Gamma{0.0};
    //! The minimum total curvature a child node must have.
    double s_MinimumChildWeight{1.0};

    std::string print() const;
};

//! \brief Interface to a gradient boosted tree trainer.
//!
//! DESCRIPTION:\n
//! Trains one additive tree on a mini-batch given the margins of the
//! trees which precede it and scores data against a trained tree.
//!
//! Margins live in log-odds space. A tree's contribution is added to the
//! base margin supplied with each call, so chaining calls in training
//! order composes an additive ensemble.
class MATHS_EXPORT CBoostingEngine {
public:
    using TDenseMatrix = CDenseMatrix<double>;
    using TDenseVector = CDenseVector<double>;

    //! \brief A trained tree.
    //!
    //! Trained trees are immutable once created and are shared between the
    //! ensemble and any caller holding on to them.
    class MATHS_EXPORT CTrainedTree {
    public:
        virtual ~CTrainedTree() = default;

        //! Get the margin contribution of the tree for \p row of \p features.
        virtual double margin(const TDenseMatrix& features, Eigen::Index row) const = 0;

        //! Get a human readable description of the tree.
        virtual std::string print() const = 0;
    };
    using TTrainedTreeCPtr = std::shared_ptr<const CTrainedTree>;

public:
    virtual ~CBoostingEngine() = default;

    //! Train one tree on the binary logistic loss.
    //!
    //! \param[in] features The mini-batch feature vectors, one per row.
    //! \param[in] labels The 0/1 labels of the rows of \p features.
    //! \param[in] baseMargins The margins of the preceding trees for the
    //! rows of \p features.
    //! \param[in] parameters The boosting hyperparameters.
    virtual TTrainedTreeCPtr trainOneRound(const TDenseMatrix& features,
                                           const TDenseVector& labels,
                                           const TDenseVector& baseMargins,
                                           const SBoostedTreeParameters& parameters) = 0;

    //! Score \p features against \p tree.
    //!
    //! \return The raw margins, i.e. \p baseMargins plus the tree's
    //! contribution, if \p wantMargin is true and otherwise the logistic
    //! function of these, i.e. the probability of class one.
    virtual TDenseVector score(const CTrainedTree& tree,
                               const TDenseMatrix& features,
                               const TDenseVector& baseMargins,
                               bool wantMargin) const = 0;
};
}
}

#endif // INCLUDED_axgb_maths_CBoostingEngine_h
