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

#include <model/CAdaptiveBoostedTreeConfig.h>

#include <boost/property_tree/ini_parser.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace axgb {
namespace model {

// Initialise statics
const std::size_t CAdaptiveBoostedTreeConfig::DEFAULT_NUMBER_ESTIMATORS{30};
const double CAdaptiveBoostedTreeConfig::DEFAULT_LEARNING_RATE{0.3};
const std::size_t CAdaptiveBoostedTreeConfig::DEFAULT_MAXIMUM_DEPTH{6};
const std::size_t CAdaptiveBoostedTreeConfig::DEFAULT_MAXIMUM_WINDOW_SIZE{1000};
const bool CAdaptiveBoostedTreeConfig::DEFAULT_DETECT_DRIFT{false};
const CAdaptiveBoostedTreeConfig::EUpdateStrategy CAdaptiveBoostedTreeConfig::DEFAULT_UPDATE_STRATEGY{
    CAdaptiveBoostedTreeConfig::E_Replace};
const double CAdaptiveBoostedTreeConfig::MINIMUM_LEARNING_RATE{1e-3};
const std::string CAdaptiveBoostedTreeConfig::PUSH{"push"};
const std::string CAdaptiveBoostedTreeConfig::REPLACE{"replace"};

CAdaptiveBoostedTreeConfig::CAdaptiveBoostedTreeConfig()
    : m_NumberEstimators{DEFAULT_NUMBER_ESTIMATORS}, m_LearningRate{DEFAULT_LEARNING_RATE},
      m_MaximumDepth{DEFAULT_MAXIMUM_DEPTH}, m_MaximumWindowSize{DEFAULT_MAXIMUM_WINDOW_SIZE},
      m_DetectDrift{DEFAULT_DETECT_DRIFT}, m_UpdateStrategy{DEFAULT_UPDATE_STRATEGY} {
}

bool CAdaptiveBoostedTreeConfig::init(const std::string& configFile) {
    std::ifstream strm(configFile.c_str());
    if (!strm.is_open()) {
        LOG_ERROR(<< "Error opening config file " << configFile);
        return false;
    }
    if (this->init(strm) == false) {
        LOG_ERROR(<< "Error processing config file " << configFile);
        return false;
    }
    return true;
}

bool CAdaptiveBoostedTreeConfig::init(std::istream& strm) {
    boost::property_tree::ptree propTree;
    try {
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config : " << e.what());
        return false;
    }

    std::size_t numberEstimators{0};
    double learningRate{0.0};
    std::size_t maximumDepth{0};
    std::size_t maximumWindowSize{0};
    bool detectDrift{false};
    std::string updateStrategy;
    if (processSetting(propTree, "ensemble.n_estimators",
                       DEFAULT_NUMBER_ESTIMATORS, numberEstimators) == false ||
        processSetting(propTree, "ensemble.update_strategy",
                       print(DEFAULT_UPDATE_STRATEGY), updateStrategy) == false ||
        processSetting(propTree, "boosting.learning_rate",
                       DEFAULT_LEARNING_RATE, learningRate) == false ||
        processSetting(propTree, "boosting.max_depth", DEFAULT_MAXIMUM_DEPTH,
                       maximumDepth) == false ||
        processSetting(propTree, "window.max_window_size",
                       DEFAULT_MAXIMUM_WINDOW_SIZE, maximumWindowSize) == false ||
        processSetting(propTree, "drift.detect_drift", DEFAULT_DETECT_DRIFT,
                       detectDrift) == false) {
        return false;
    }

    // There is no default for the minimum window size: absent means use the
    // maximum window size.
    TOptionalSize minimumWindowSize;
    std::size_t minimumWindowSizeSetting{0};
    if (propTree.get_optional<std::string>("window.min_window_size")) {
        if (processSetting(propTree, "window.min_window_size", minimumWindowSizeSetting,
                           minimumWindowSizeSetting) == false) {
            return false;
        }
        minimumWindowSize = minimumWindowSizeSetting;
    } else {
        LOG_DEBUG(<< "Using the maximum window size for unspecified setting window.min_window_size");
    }

    CAdaptiveBoostedTreeConfig result;
    try {
        result.updateStrategy(updateStrategy);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(<< e.what());
        return false;
    }
    result.numberEstimators(numberEstimators)
        .learningRate(learningRate)
        .maximumDepth(maximumDepth)
        .maximumWindowSize(maximumWindowSize)
        .detectDrift(detectDrift);
    if (minimumWindowSize) {
        result.minimumWindowSize(*minimumWindowSize);
    }

    *this = result;
    LOG_DEBUG(<< "Read configuration " << this->print());

    return true;
}

CAdaptiveBoostedTreeConfig& CAdaptiveBoostedTreeConfig::numberEstimators(std::size_t numberEstimators) {
    if (numberEstimators == 0) {
        LOG_WARN(<< "Number of estimators must be positive, using 1");
        numberEstimators = 1;
    }
    m_NumberEstimators = numberEstimators;
    return *this;
}

CAdaptiveBoostedTreeConfig& CAdaptiveBoostedTreeConfig::learningRate(double learningRate) {
    if (std::isnan(learningRate) || learningRate < MINIMUM_LEARNING_RATE) {
        LOG_WARN(<< "Learning rate " << learningRate << " too small, using "
                 << MINIMUM_LEARNING_RATE);
        learningRate = MINIMUM_LEARNING_RATE;
    } else if (learningRate > 1.0) {
        LOG_WARN(<< "Learning rate " << learningRate << " too large, using 1");
        learningRate = 1.0;
    }
    m_LearningRate = learningRate;
    return *this;
}

CAdaptiveBoostedTreeConfig& CAdaptiveBoostedTreeConfig::maximumDepth(std::size_t maximumDepth) {
    m_MaximumDepth = maximumDepth;
    return *this;
}

CAdaptiveBoostedTreeConfig&
CAdaptiveBoostedTreeConfig::maximumWindowSize(std::size_t maximumWindowSize) {
    if (maximumWindowSize == 0) {
        LOG_WARN(<< "Maximum window size must be positive, using 1");
        maximumWindowSize = 1;
    }
    m_MaximumWindowSize = maximumWindowSize;
    if (m_MinimumWindowSize && *m_MinimumWindowSize > m_MaximumWindowSize) {
        LOG_WARN(<< "Minimum window size " << *m_MinimumWindowSize
                 << " exceeds maximum, using " << m_MaximumWindowSize);
        m_MinimumWindowSize = m_MaximumWindowSize;
    }
    return *this;
}

CAdaptiveBoostedTreeConfig&
CAdaptiveBoostedTreeConfig::minimumWindowSize(std::size_t minimumWindowSize) {
    if (minimumWindowSize == 0) {
        LOG_WARN(<< "Minimum window size must be positive, using 1");
        minimumWindowSize = 1;
    } else if (minimumWindowSize > m_MaximumWindowSize) {
        LOG_WARN(<< "Minimum window size " << minimumWindowSize
                 << " exceeds maximum, using " << m_MaximumWindowSize);
        minimumWindowSize = m_MaximumWindowSize;
    }
    m_MinimumWindowSize = minimumWindowSize;
    return *this;
}

CAdaptiveBoostedTreeConfig& CAdaptiveBoostedTreeConfig::detectDrift(bool detectDrift) {
    m_DetectDrift = detectDrift;
    return *this;
}

CAdaptiveBoostedTreeConfig&
CAdaptiveBoostedTreeConfig::updateStrategy(EUpdateStrategy updateStrategy) {
    m_UpdateStrategy = updateStrategy;
    return *this;
}

CAdaptiveBoostedTreeConfig&
CAdaptiveBoostedTreeConfig::updateStrategy(const std::string& name) {
    m_UpdateStrategy = parseUpdateStrategy(name);
    return *this;
}

std::size_t CAdaptiveBoostedTreeConfig::numberEstimators() const {
    return m_NumberEstimators;
}

double CAdaptiveBoostedTreeConfig::learningRate() const {
    return m_LearningRate;
}

std::size_t CAdaptiveBoostedTreeConfig::maximumDepth() const {
    return m_MaximumDepth;
}

std::size_t CAdaptiveBoostedTreeConfig::maximumWindowSize() const {
    return m_MaximumWindowSize;
}

const CAdaptiveBoostedTreeConfig::TOptionalSize& CAdaptiveBoostedTreeConfig::minimumWindowSize() const {
    return m_MinimumWindowSize;
}

bool CAdaptiveBoostedTreeConfig::detectDrift() const {
    return m_DetectDrift;
}

CAdaptiveBoostedTreeConfig::EUpdateStrategy CAdaptiveBoostedTreeConfig::updateStrategy() const {
    return m_UpdateStrategy;
}

maths::SBoostedTreeParameters CAdaptiveBoostedTreeConfig::boostingParameters() const {
    maths::SBoostedTreeParameters result;
    result.s_Eta = m_LearningRate;
    result.s_MaximumDepth = m_MaximumDepth;
    return result;
}

std::string CAdaptiveBoostedTreeConfig::print() const {
    std::ostringstream result;
    result << "n_estimators = " << m_NumberEstimators
           << ", update_strategy = " << print(m_UpdateStrategy)
           << ", learning_rate = " << m_LearningRate << ", max_depth = " << m_MaximumDepth
           << ", max_window_size = " << m_MaximumWindowSize << ", min_window_size = "
           << (m_MinimumWindowSize ? core::CStringUtils::typeToString(*m_MinimumWindowSize)
                                   : std::string{"unset"})
           << ", detect_drift = " << core::CStringUtils::typeToString(m_DetectDrift);
    return result.str();
}

CAdaptiveBoostedTreeConfig::EUpdateStrategy
CAdaptiveBoostedTreeConfig::parseUpdateStrategy(const std::string& name) {
    if (name == PUSH) {
        return E_Push;
    }
    if (name == REPLACE) {
        return E_Replace;
    }
    throw std::invalid_argument{"Invalid update_strategy '" + name +
                                "'. Valid values are [" + PUSH + ", " + REPLACE + "]"};
}

const std::string& CAdaptiveBoostedTreeConfig::print(EUpdateStrategy updateStrategy) {
    switch (updateStrategy) {
    case E_Push:
        return PUSH;
    case E_Replace:
        break;
    }
    return REPLACE;
}
}
}
