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

#include <model/CAdaptiveBoostedTreeClassifier.h>

#include <core/CLogger.h>

#include <maths/CAdwin.h>
#include <maths/CBoostedTreeEngine.h>

#include <sstream>
#include <stdexcept>

namespace axgb {
namespace model {
namespace {
const double PROBABILITY_THRESHOLD{0.5};
}

CAdaptiveBoostedTreeClassifier::CAdaptiveBoostedTreeClassifier(const CAdaptiveBoostedTreeConfig& config,
                                                               TBoostingEngineUPtr engine,
                                                               TDriftMonitorFactory driftMonitorFactory)
    : m_Config{config}, m_Engine{std::move(engine)},
      m_DriftMonitorFactory{std::move(driftMonitorFactory)},
      m_Window{config.maximumWindowSize(), config.minimumWindowSize()},
      m_Ensemble{CEnsemble::create(config.updateStrategy(), config.numberEstimators())} {
    if (m_Engine == nullptr) {
        m_Engine = std::make_unique<maths::CBoostedTreeEngine>();
    }
    if (!m_DriftMonitorFactory) {
        m_DriftMonitorFactory = [] { return std::make_unique<maths::CAdwin>(); };
    }
    this->createDriftMonitor();
    LOG_DEBUG(<< "Created classifier with " << m_Config.print());
}

bool CAdaptiveBoostedTreeClassifier::partialFit(const TDenseMatrix& features,
                                                const TDenseVector& labels) {
    if (labels.size() != features.rows()) {
        LOG_ERROR(<< "Got " << labels.size() << " labels for " << features.rows() << " examples");
        return false;
    }

    bool result{true};
    TDoubleVec example(static_cast<std::size_t>(features.cols()));
    for (Eigen::Index i = 0; i < features.rows(); ++i) {
        for (Eigen::Index j = 0; j < features.cols(); ++j) {
            example[static_cast<std::size_t>(j)] = features(i, j);
        }
        if (this->partialFit(example, labels(i)) == false) {
            result = false;
        }
    }
    return result;
}

bool CAdaptiveBoostedTreeClassifier::partialFit(const TDoubleVec& example, double label) {
    if (this->isValid(example, label) == false) {
        return false;
    }

    if (!m_NumberFeatures) {
        m_NumberFeatures = example.size();
        LOG_DEBUG(<< "Feature dimension is " << example.size());
    }

    m_Window.add(example, label);
    while (m_Window.isReady()) {
        this->train(m_Window.drainBatch());
        m_Window.grow();
    }

    if (m_DriftMonitor != nullptr) {
        this->checkForDrift(example, label);
    }

    return true;
}

CAdaptiveBoostedTreeClassifier::TDenseVector
CAdaptiveBoostedTreeClassifier::predict(const TDenseMatrix& features) const {
    TTrainedTreeCPtrVec members{m_Ensemble->liveMembers()};
    if (members.empty()) {
        return TDenseVector::Zero(features.rows());
    }

    if (m_NumberFeatures && static_cast<std::size_t>(features.cols()) != *m_NumberFeatures) {
        std::ostringstream message;
        message << "Input error: expected " << *m_NumberFeatures << " features but got "
                << features.cols();
        throw std::runtime_error{message.str()};
    }

    std::size_t k{members.size()};
    TDenseVector margins{this->chainMargins(features, members, k - 1)};
    TDenseVector probabilities{m_Engine->score(*members[k - 1], features, margins, false)};

    TDenseVector result(features.rows());
    for (Eigen::Index i = 0; i < features.rows(); ++i) {
        result(i) = probabilities(i) > PROBABILITY_THRESHOLD ? 1.0 : 0.0;
    }
    return result;
}

double CAdaptiveBoostedTreeClassifier::predict(const TDoubleVec& example) const {
    TDenseMatrix features(1, static_cast<Eigen::Index>(example.size()));
    for (std::size_t j = 0; j < example.size(); ++j) {
        features(0, static_cast<Eigen::Index>(j)) = example[j];
    }
    return this->predict(features)(0);
}

CAdaptiveBoostedTreeClassifier::TDenseVector
CAdaptiveBoostedTreeClassifier::predictProbabilities(const TDenseMatrix& /*features*/) const {
    throw std::logic_error{"predictProbabilities is not implemented: only class "
                           "labels are supported, use predict"};
}

CAdaptiveBoostedTreeClassifier::TDenseVector
CAdaptiveBoostedTreeClassifier::margins(const TDenseMatrix& features) const {
    TTrainedTreeCPtrVec members{m_Ensemble->liveMembers()};
    return this->chainMargins(features, members, members.size());
}

void CAdaptiveBoostedTreeClassifier::reset() {
    m_Ensemble = CEnsemble::create(m_Config.updateStrategy(), m_Config.numberEstimators());
    m_Window.reset();
    m_Window.clear();
    this->createDriftMonitor();
    m_NumberFeatures.reset();
    m_NumberSamplesSeen = 0;
    m_NumberTrainedTrees = 0;
    m_NumberDriftsDetected = 0;
    LOG_DEBUG(<< "Reset classifier");
}

std::size_t CAdaptiveBoostedTreeClassifier::numberSamplesSeen() const {
    return m_NumberSamplesSeen;
}

std::size_t CAdaptiveBoostedTreeClassifier::numberTrainedTrees() const {
    return m_NumberTrainedTrees;
}

std::size_t CAdaptiveBoostedTreeClassifier::numberDriftsDetected() const {
    return m_NumberDriftsDetected;
}

std::size_t CAdaptiveBoostedTreeClassifier::windowSize() const {
    return m_Window.windowSize();
}

const CAdaptiveBoostedTreeClassifier::TOptionalSize&
CAdaptiveBoostedTreeClassifier::numberFeatures() const {
    return m_NumberFeatures;
}

const CEnsemble& CAdaptiveBoostedTreeClassifier::ensemble() const {
    return *m_Ensemble;
}

const CAdaptiveWindow& CAdaptiveBoostedTreeClassifier::window() const {
    return m_Window;
}

const CAdaptiveBoostedTreeConfig& CAdaptiveBoostedTreeClassifier::config() const {
    return m_Config;
}

std::size_t CAdaptiveBoostedTreeClassifier::memoryUsage() const {
    std::size_t mem{sizeof(*this)};
    mem += m_Window.memoryUsage() - sizeof(m_Window);
    mem += m_Ensemble->memoryUsage();
    if (m_DriftMonitor != nullptr) {
        mem += m_DriftMonitor->memoryUsage();
    }
    return mem;
}

bool CAdaptiveBoostedTreeClassifier::isValid(const TDoubleVec& example, double label) const {
    if (example.empty()) {
        LOG_ERROR(<< "Ignoring example with no features");
        return false;
    }
    if (m_NumberFeatures && example.size() != *m_NumberFeatures) {
        LOG_ERROR(<< "Ignoring example with " << example.size()
                  << " features, expected " << *m_NumberFeatures);
        return false;
    }
    if (label != 0.0 && label != 1.0) {
        LOG_ERROR(<< "Ignoring example with label " << label << ", expected 0 or 1");
        return false;
    }
    return true;
}

CAdaptiveBoostedTreeClassifier::TDenseVector
CAdaptiveBoostedTreeClassifier::chainMargins(const TDenseMatrix& features,
                                             const TTrainedTreeCPtrVec& members,
                                             std::size_t numberMembers) const {
    // Each tree was trained on the sum of the margins of the trees before it.
    TDenseVector result{TDenseVector::Zero(features.rows())};
    for (std::size_t i = 0; i < numberMembers; ++i) {
        result = m_Engine->score(*members[i], features, result, true);
    }
    return result;
}

void CAdaptiveBoostedTreeClassifier::train(const CAdaptiveWindow::SMiniBatch& batch) {
    TTrainedTreeCPtrVec members{m_Ensemble->liveMembers()};
    TDenseVector baseMargins{this->chainMargins(batch.s_Features, members, members.size())};

    LOG_TRACE(<< "Training on " << batch.s_Features.rows() << " examples with "
              << members.size() << " live trees");

    auto tree = m_Engine->trainOneRound(batch.s_Features, batch.s_Labels, baseMargins,
                                        m_Config.boostingParameters());
    if (tree == nullptr) {
        LOG_ABORT(<< "Boosting engine returned no tree");
    }
    m_Ensemble->insert(std::move(tree));

    m_NumberSamplesSeen += static_cast<std::size_t>(batch.s_Features.rows());
    ++m_NumberTrainedTrees;
    LOG_TRACE(<< "Trained tree " << m_NumberTrainedTrees << ", " << m_Window.print());
}

void CAdaptiveBoostedTreeClassifier::checkForDrift(const TDoubleVec& example, double label) {
    double error{this->predict(example) == label ? 0.0 : 1.0};
    m_DriftMonitor->add(error);
    if (m_DriftMonitor->changeDetected()) {
        ++m_NumberDriftsDetected;
        LOG_DEBUG(<< "Drift detected after " << m_NumberSamplesSeen
                  << " samples, resetting window from " << m_Window.windowSize());
        m_Window.reset();
        m_Ensemble->resetCursor();
    }
}

void CAdaptiveBoostedTreeClassifier::createDriftMonitor() {
    m_DriftMonitor.reset();
    if (m_Config.detectDrift()) {
        m_DriftMonitor = m_DriftMonitorFactory();
        if (m_DriftMonitor == nullptr) {
            LOG_ABORT(<< "Failed to create drift monitor");
        }
    }
}
}
}
