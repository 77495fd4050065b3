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

#ifndef INCLUDED_CMockBoostingEngine_h
#define INCLUDED_CMockBoostingEngine_h

#include <maths/CBoostingEngine.h>
#include <maths/CTools.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

//! \brief A tree which adds a fixed linear function of the first feature
//! to the margin and remembers the order in which it was trained.
class CTaggedTree final : public axgb::maths::CBoostingEngine::CTrainedTree {
public:
    using TDenseMatrix = axgb::maths::CBoostingEngine::TDenseMatrix;

public:
    CTaggedTree(std::size_t tag, double intercept, double slope)
        : m_Tag{tag}, m_Intercept{intercept}, m_Slope{slope} {}

    double margin(const TDenseMatrix& features, Eigen::Index row) const override {
        return m_Intercept + m_Slope * features(row, 0);
    }

    std::string print() const override {
        return "tree #" + std::to_string(m_Tag);
    }

    std::size_t tag() const { return m_Tag; }

private:
    std::size_t m_Tag;
    double m_Intercept;
    double m_Slope;
};

//! Get the tag of \p tree which must be a CTaggedTree.
inline std::size_t tagOf(const axgb::maths::CBoostingEngine::TTrainedTreeCPtr& tree) {
    return dynamic_cast<const CTaggedTree&>(*tree).tag();
}

//! \brief A boosting engine which records its inputs and creates tagged trees.
//!
//! The n'th tree trained gets tag n and the intercept and slope returned by
//! the supplied functions of n.
class CMockBoostingEngine final : public axgb::maths::CBoostingEngine {
public:
    using TSizeVec = std::vector<std::size_t>;
    using TDenseVectorVec = std::vector<TDenseVector>;
    using TCoefficientFunc = std::function<double(std::size_t)>;

public:
    CMockBoostingEngine(TCoefficientFunc intercept = [](std::size_t tag) {
        return 0.1 * static_cast<double>(tag + 1);
    },
                        TCoefficientFunc slope = [](std::size_t) { return 0.0; })
        : m_Intercept{std::move(intercept)}, m_Slope{std::move(slope)} {}

    TTrainedTreeCPtr trainOneRound(const TDenseMatrix& features,
                                   const TDenseVector& /*labels*/,
                                   const TDenseVector& baseMargins,
                                   const axgb::maths::SBoostedTreeParameters& parameters) override {
        std::size_t tag{m_BatchSizes.size()};
        m_BatchSizes.push_back(static_cast<std::size_t>(features.rows()));
        m_BaseMargins.push_back(baseMargins);
        m_Parameters = parameters;
        return std::make_shared<const CTaggedTree>(tag, m_Intercept(tag), m_Slope(tag));
    }

    TDenseVector score(const CTrainedTree& tree,
                       const TDenseMatrix& features,
                       const TDenseVector& baseMargins,
                       bool wantMargin) const override {
        TDenseVector result{baseMargins};
        for (Eigen::Index i = 0; i < features.rows(); ++i) {
            result(i) += tree.margin(features, i);
            if (wantMargin == false) {
                result(i) = axgb::maths::CTools::logisticFunction(result(i));
            }
        }
        return result;
    }

    //! The mini-batch sizes in the order the trees were trained.
    const TSizeVec& batchSizes() const { return m_BatchSizes; }

    //! The base margins supplied for each tree.
    const TDenseVectorVec& baseMargins() const { return m_BaseMargins; }

    //! The last parameters supplied.
    const axgb::maths::SBoostedTreeParameters& parameters() const {
        return m_Parameters;
    }

private:
    TCoefficientFunc m_Intercept;
    TCoefficientFunc m_Slope;
    TSizeVec m_BatchSizes;
    TDenseVectorVec m_BaseMargins;
    axgb::maths::SBoostedTreeParameters m_Parameters;
};

//! \brief Wraps an engine and records the base margins it is supplied.
class CRecordingBoostingEngine final : public axgb::maths::CBoostingEngine {
public:
    using TDenseVectorVec = std::vector<TDenseVector>;

public:
    explicit CRecordingBoostingEngine(std::unique_ptr<axgb::maths::CBoostingEngine> engine)
        : m_Engine{std::move(engine)} {}

    TTrainedTreeCPtr trainOneRound(const TDenseMatrix& features,
                                   const TDenseVector& labels,
                                   const TDenseVector& baseMargins,
                                   const axgb::maths::SBoostedTreeParameters& parameters) override {
        m_BaseMargins.push_back(baseMargins);
        return m_Engine->trainOneRound(features, labels, baseMargins, parameters);
    }

    TDenseVector score(const CTrainedTree& tree,
                       const TDenseMatrix& features,
                       const TDenseVector& baseMargins,
                       bool wantMargin) const override {
        return m_Engine->score(tree, features, baseMargins, wantMargin);
    }

    const TDenseVectorVec& baseMargins() const { return m_BaseMargins; }

private:
    std::unique_ptr<axgb::maths::CBoostingEngine> m_Engine;
    TDenseVectorVec m_BaseMargins;
};

#endif // INCLUDED_CMockBoostingEngine_h
