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

#ifndef INCLUDED_axgb_model_CAdaptiveBoostedTreeClassifier_h
#define INCLUDED_axgb_model_CAdaptiveBoostedTreeClassifier_h

#include <core/CNonCopyable.h>

#include <maths/CBoostingEngine.h>
#include <maths/CDriftMonitor.h>

#include <model/CAdaptiveBoostedTreeConfig.h>
#include <model/CAdaptiveWindow.h>
#include <model/CEnsemble.h>
#include <model/ImportExport.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace axgb {
namespace model {

//! \brief An online binary classifier which adapts an ensemble of boosted
//! trees to a drifting stream of examples.
//!
//! DESCRIPTION:\n
//! Examples are processed one at a time. They are buffered by an adaptive
//! window and each time the window fills a mini-batch is drained and one new
//! tree is trained on it and added to the ensemble. The new tree is fitted
//! to the residuals of the trees already in the ensemble: their margins are
//! summed in training order and passed to the boosting engine as the base
//! margins. Prediction chains margins the same way so training and
//! prediction are consistent.
//!
//! If drift detection is enabled each example is also predicted after it has
//! been processed and whether the prediction was wrong is added to a drift
//! monitor. When the monitor detects a change the window is reset to its
//! initial size and, for the replace strategy, the ensemble starts
//! overwriting from its first slot. This lets the ensemble forget quickly.
//!
//! IMPLEMENTATION:\n
//! The boosting engine and the drift monitor are supplied by the caller so
//! they can be replaced in tests. By default CBoostedTreeEngine and CAdwin
//! are used.
//!
//! This is not thread safe: callers must serialise access.
class MODEL_EXPORT CAdaptiveBoostedTreeClassifier : private core::CNonCopyable {
public:
    using TDoubleVec = std::vector<double>;
    using TOptionalSize = boost::optional<std::size_t>;
    using TDenseMatrix = maths::CBoostingEngine::TDenseMatrix;
    using TDenseVector = maths::CBoostingEngine::TDenseVector;
    using TBoostingEngineUPtr = std::unique_ptr<maths::CBoostingEngine>;
    using TDriftMonitorFactory = std::function<maths::TDriftMonitorUPtr()>;
    using TEnsembleUPtr = CEnsemble::TEnsembleUPtr;
    using TTrainedTreeCPtrVec = CEnsemble::TTrainedTreeCPtrVec;

public:
    explicit CAdaptiveBoostedTreeClassifier(const CAdaptiveBoostedTreeConfig& config = CAdaptiveBoostedTreeConfig{},
                                            TBoostingEngineUPtr engine = nullptr,
                                            TDriftMonitorFactory driftMonitorFactory = nullptr);

    //! Update with the examples in the rows of \p features.
    //!
    //! \return False if any row was rejected, in which case it is skipped.
    bool partialFit(const TDenseMatrix& features, const TDenseVector& labels);

    //! Update with \p example which has \p label.
    //!
    //! \return False if the example was rejected.
    //! \note A mini-batch leaves the window before it is trained on. If the
    //! engine throws the exception propagates and that batch is discarded.
    bool partialFit(const TDoubleVec& example, double label);

    //! Predict the labels of the rows of \p features.
    //!
    //! Before any tree has been trained this predicts zero for every row
    //! whatever the number of columns.
    //!
    //! \throws std::runtime_error if there are trees and the number of
    //! columns differs from the feature dimension.
    TDenseVector predict(const TDenseMatrix& features) const;

    //! Predict the label of \p example.
    double predict(const TDoubleVec& example) const;

    //! Class probabilities are not available.
    //!
    //! \throws std::logic_error always.
    TDenseVector predictProbabilities(const TDenseMatrix& features) const;

    //! Get the total margin of the ensemble for the rows of \p features.
    TDenseVector margins(const TDenseMatrix& features) const;

    //! Forget everything learned and any locked in feature dimension.
    void reset();

    //! \name Diagnostics
    //@{
    //! Get the number of examples used for training.
    std::size_t numberSamplesSeen() const;
    //! Get the number of trees trained.
    std::size_t numberTrainedTrees() const;
    //! Get the number of drifts detected.
    std::size_t numberDriftsDetected() const;
    //! Get the current window size.
    std::size_t windowSize() const;
    //! Get the feature dimension, unset until the first example.
    const TOptionalSize& numberFeatures() const;
    const CEnsemble& ensemble() const;
    const CAdaptiveWindow& window() const;
    const CAdaptiveBoostedTreeConfig& config() const;
    //! Get the memory used by this object.
    std::size_t memoryUsage() const;
    //@}

private:
    //! Check \p example and \p label can be used for training.
    bool isValid(const TDoubleVec& example, double label) const;

    //! Chain the margins of \p members for \p features.
    TDenseVector chainMargins(const TDenseMatrix& features,
                              const TTrainedTreeCPtrVec& members,
                              std::size_t numberMembers) const;

    //! Train a tree on \p batch and add it to the ensemble.
    void train(const CAdaptiveWindow::SMiniBatch& batch);

    //! Update the drift monitor with the prediction error for \p example.
    void checkForDrift(const TDoubleVec& example, double label);

    //! Create the drift monitor if it is needed.
    void createDriftMonitor();

private:
    CAdaptiveBoostedTreeConfig m_Config;
    TBoostingEngineUPtr m_Engine;
    TDriftMonitorFactory m_DriftMonitorFactory;
    CAdaptiveWindow m_Window;
    TEnsembleUPtr m_Ensemble;
    maths::TDriftMonitorUPtr m_DriftMonitor;
    TOptionalSize m_NumberFeatures;
    std::size_t m_NumberSamplesSeen = 0;
    std::size_t m_NumberTrainedTrees = 0;
    std::size_t m_NumberDriftsDetected = 0;
};
}
}

#endif // INCLUDED_axgb_model_CAdaptiveBoostedTreeClassifier_h
