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

#ifndef INCLUDED_axgb_model_CAdaptiveBoostedTreeConfig_h
#define INCLUDED_axgb_model_CAdaptiveBoostedTreeConfig_h

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <maths/CBoostingEngine.h>

#include <model/ImportExport.h>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace axgb {
namespace model {

//! \brief
//! Holds the configuration of an adaptive boosted tree classifier.
//!
//! DESCRIPTION:\n
//! The settings can be made programmatically or read from a config file.
//! Sizes and the learning rate are clamped to sensible ranges, with a
//! warning, rather than rejected. The update strategy is the one setting
//! which is validated: an unknown strategy name is an error.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Config files are similar in format to Windows .ini files but with hash
//! as the comment character instead of semi-colon, and are loaded using
//! boost::property_tree::ini_parser. The values are copied into member
//! variables to decouple the public interface from the file format.
class MODEL_EXPORT CAdaptiveBoostedTreeConfig {
public:
    using TOptionalSize = boost::optional<std::size_t>;

    //! The policy for adding a new tree to a full ensemble.
    enum EUpdateStrategy {
        E_Push,   //!< Evict the oldest tree.
        E_Replace //!< Overwrite slots round robin.
    };

public:
    static const std::size_t DEFAULT_NUMBER_ESTIMATORS;
    static const double DEFAULT_LEARNING_RATE;
    static const std::size_t DEFAULT_MAXIMUM_DEPTH;
    static const std::size_t DEFAULT_MAXIMUM_WINDOW_SIZE;
    static const bool DEFAULT_DETECT_DRIFT;
    static const EUpdateStrategy DEFAULT_UPDATE_STRATEGY;
    static const double MINIMUM_LEARNING_RATE;

    static const std::string PUSH;
    static const std::string REPLACE;

public:
    CAdaptiveBoostedTreeConfig();

    //! Initialise from a config file.
    //!
    //! Settings which are absent keep their default values.
    bool init(const std::string& configFile);

    //! Initialise from the contents of a config file.
    bool init(std::istream& strm);

    //! \name Setters
    //@{
    CAdaptiveBoostedTreeConfig& numberEstimators(std::size_t numberEstimators);
    CAdaptiveBoostedTreeConfig& learningRate(double learningRate);
    CAdaptiveBoostedTreeConfig& maximumDepth(std::size_t maximumDepth);
    CAdaptiveBoostedTreeConfig& maximumWindowSize(std::size_t maximumWindowSize);
    CAdaptiveBoostedTreeConfig& minimumWindowSize(std::size_t minimumWindowSize);
    CAdaptiveBoostedTreeConfig& detectDrift(bool detectDrift);
    CAdaptiveBoostedTreeConfig& updateStrategy(EUpdateStrategy updateStrategy);
    //! \throws std::invalid_argument if \p name isn't a valid strategy.
    CAdaptiveBoostedTreeConfig& updateStrategy(const std::string& name);
    //@}

    //! \name Getters
    //@{
    std::size_t numberEstimators() const;
    double learningRate() const;
    std::size_t maximumDepth() const;
    std::size_t maximumWindowSize() const;
    const TOptionalSize& minimumWindowSize() const;
    bool detectDrift() const;
    EUpdateStrategy updateStrategy() const;
    //@}

    //! Get the boosting hyperparameters for one training round.
    maths::SBoostedTreeParameters boostingParameters() const;

    //! Get a description of the configuration.
    std::string print() const;

    //! Parse an update strategy name.
    //!
    //! \throws std::invalid_argument naming \p name and the valid names.
    static EUpdateStrategy parseUpdateStrategy(const std::string& name);

    //! Get the name of \p updateStrategy.
    static const std::string& print(EUpdateStrategy updateStrategy);

private:
    //! Helper method for init().
    template<typename FIELDTYPE>
    static bool processSetting(const boost::property_tree::ptree& propTree,
                               const std::string& iniPath,
                               const FIELDTYPE& defaultValue,
                               FIELDTYPE& value) {
        boost::optional<std::string> valueStr{
            propTree.get_optional<std::string>(iniPath)};
        if (!valueStr) {
            LOG_DEBUG(<< "Using default value (" << defaultValue
                      << ") for unspecified setting " << iniPath);
            value = defaultValue;
            return true;
        }
        // Use our own string-to-type conversion, because what's built
        // into the boost::property_tree is too lax
        std::string trimmed{*valueStr};
        core::CStringUtils::trimWhitespace(trimmed);
        if (core::CStringUtils::stringToType(trimmed, value) == false) {
            LOG_ERROR(<< "Invalid value for setting " << iniPath << " : " << *valueStr);
            return false;
        }
        return true;
    }

private:
    //! The ensemble capacity.
    std::size_t m_NumberEstimators;

    //! The shrinkage applied to each tree's leaf values.
    double m_LearningRate;

    //! The maximum depth of each tree.
    std::size_t m_MaximumDepth;

    //! The largest mini-batch used for training.
    std::size_t m_MaximumWindowSize;

    //! The mini-batch size used after a reset, if unset the maximum.
    TOptionalSize m_MinimumWindowSize;

    //! Should we react to changes in the prediction error rate?
    bool m_DetectDrift;

    //! How new trees enter the ensemble.
    EUpdateStrategy m_UpdateStrategy;
};
}
}

#endif // INCLUDED_axgb_model_CAdaptiveBoostedTreeConfig_h
