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

#ifndef INCLUDED_axgb_model_CAdaptiveWindow_h
#define INCLUDED_axgb_model_CAdaptiveWindow_h

#include <maths/CBoostingEngine.h>

#include <model/ImportExport.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace axgb {
namespace model {

//! \brief Buffers examples and decides when to train.
//!
//! DESCRIPTION:\n
//! Examples are buffered until there are window size of them, at which point
//! they can be drained as a mini-batch to train one tree. The window starts
//! at the minimum size, or the maximum if there is no minimum, and doubles
//! after each mini-batch until it reaches the maximum. This means training
//! starts almost immediately on a cold stream or after a reset and converges
//! to the steady state batch size.
//!
//! IMPLEMENTATION:\n
//! The dynamic window size only doubles while it is less than the maximum,
//! the effective window size is the same as if it doubled indefinitely and
//! it can't overflow.
class MODEL_EXPORT CAdaptiveWindow {
public:
    using TDoubleVec = std::vector<double>;
    using TOptionalSize = boost::optional<std::size_t>;
    using TDenseMatrix = maths::CBoostingEngine::TDenseMatrix;
    using TDenseVector = maths::CBoostingEngine::TDenseVector;

    //! \brief A mini-batch of examples, one per row.
    struct MODEL_EXPORT SMiniBatch {
        TDenseMatrix s_Features;
        TDenseVector s_Labels;
    };

public:
    CAdaptiveWindow(std::size_t maximumWindowSize, TOptionalSize minimumWindowSize);

    //! Buffer the example \p features with \p label.
    void add(TDoubleVec features, double label);

    //! Check if there are enough examples buffered to train.
    bool isReady() const;

    //! Remove the oldest window size examples from the buffer.
    //!
    //! \note Must only be called if isReady() is true.
    SMiniBatch drainBatch();

    //! Double the dynamic window size and set the window size to it
    //! clamped to the maximum.
    void grow();

    //! Set the window size back to its initial value.
    void reset();

    //! Discard all buffered examples.
    void clear();

    //! Get the number of examples needed to train.
    std::size_t windowSize() const;

    //! Get the size to which the window would grow, unclamped.
    std::size_t dynamicWindowSize() const;

    //! Get the maximum window size.
    std::size_t maximumWindowSize() const;

    //! Get the minimum window size, if set.
    const TOptionalSize& minimumWindowSize() const;

    //! Get the number of buffered examples.
    std::size_t bufferSize() const;

    //! Get the memory used by this object.
    std::size_t memoryUsage() const;

    //! Get a description of the window state.
    std::string print() const;

private:
    using TDoubleVecDoublePr = std::pair<TDoubleVec, double>;
    using TDoubleVecDoublePrDeque = std::deque<TDoubleVecDoublePr>;

private:
    std::size_t m_MaximumWindowSize;
    TOptionalSize m_MinimumWindowSize;
    std::size_t m_DynamicWindowSize = 0;
    std::size_t m_WindowSize = 0;
    //! The oldest example is at the front.
    TDoubleVecDoublePrDeque m_Buffer;
};
}
}

#endif // INCLUDED_axgb_model_CAdaptiveWindow_h
