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

#include <model/CAdaptiveWindow.h>

#include <core/CLogger.h>

#include <algorithm>
#include <limits>
#include <sstream>

namespace axgb {
namespace model {

CAdaptiveWindow::CAdaptiveWindow(std::size_t maximumWindowSize, TOptionalSize minimumWindowSize)
    : m_MaximumWindowSize{maximumWindowSize}, m_MinimumWindowSize{minimumWindowSize} {
    if (m_MaximumWindowSize == 0) {
        LOG_WARN(<< "Maximum window size must be positive, using 1");
        m_MaximumWindowSize = 1;
    }
    if (m_MinimumWindowSize) {
        if (*m_MinimumWindowSize == 0) {
            LOG_WARN(<< "Minimum window size must be positive, using 1");
            m_MinimumWindowSize = std::size_t{1};
        } else if (*m_MinimumWindowSize > m_MaximumWindowSize) {
            LOG_WARN(<< "Minimum window size " << *m_MinimumWindowSize
                     << " exceeds maximum, using " << m_MaximumWindowSize);
            m_MinimumWindowSize = m_MaximumWindowSize;
        }
    }
    this->reset();
}

void CAdaptiveWindow::add(TDoubleVec features, double label) {
    m_Buffer.emplace_back(std::move(features), label);
}

bool CAdaptiveWindow::isReady() const {
    return m_Buffer.size() >= m_WindowSize;
}

CAdaptiveWindow::SMiniBatch CAdaptiveWindow::drainBatch() {
    if (this->isReady() == false) {
        LOG_ABORT(<< "Draining " << m_WindowSize << " examples with only "
                  << m_Buffer.size() << " buffered");
    }

    auto rows = static_cast<Eigen::Index>(m_WindowSize);
    auto cols = static_cast<Eigen::Index>(m_Buffer.front().first.size());

    SMiniBatch result;
    result.s_Features.resize(rows, cols);
    result.s_Labels.resize(rows);
    for (Eigen::Index i = 0; i < rows; ++i) {
        const auto& example = m_Buffer.front();
        for (Eigen::Index j = 0; j < cols; ++j) {
            result.s_Features(i, j) = example.first[static_cast<std::size_t>(j)];
        }
        result.s_Labels(i) = example.second;
        m_Buffer.pop_front();
    }

    return result;
}

void CAdaptiveWindow::grow() {
    // Saturate rather than wrap.
    if (m_DynamicWindowSize > std::numeric_limits<std::size_t>::max() / 2) {
        m_DynamicWindowSize = std::numeric_limits<std::size_t>::max();
    } else {
        m_DynamicWindowSize *= 2;
    }
    m_WindowSize = std::min(m_DynamicWindowSize, m_MaximumWindowSize);
}

void CAdaptiveWindow::reset() {
    m_DynamicWindowSize = m_MinimumWindowSize ? *m_MinimumWindowSize : m_MaximumWindowSize;
    m_WindowSize = m_DynamicWindowSize;
}

void CAdaptiveWindow::clear() {
    m_Buffer.clear();
}

std::size_t CAdaptiveWindow::windowSize() const {
    return m_WindowSize;
}

std::size_t CAdaptiveWindow::dynamicWindowSize() const {
    return m_DynamicWindowSize;
}

std::size_t CAdaptiveWindow::maximumWindowSize() const {
    return m_MaximumWindowSize;
}

const CAdaptiveWindow::TOptionalSize& CAdaptiveWindow::minimumWindowSize() const {
    return m_MinimumWindowSize;
}

std::size_t CAdaptiveWindow::bufferSize() const {
    return m_Buffer.size();
}

std::size_t CAdaptiveWindow::memoryUsage() const {
    std::size_t mem{sizeof(*this)};
    for (const auto& example : m_Buffer) {
        mem += sizeof(TDoubleVecDoublePr) + example.first.capacity() * sizeof(double);
    }
    return mem;
}

std::string CAdaptiveWindow::print() const {
    std::ostringstream result;
    result << "window size = " << m_WindowSize << ", dynamic window size = " << m_DynamicWindowSize
           << ", maximum = " << m_MaximumWindowSize << ", buffered = " << m_Buffer.size();
    return result.str();
}
}
}
