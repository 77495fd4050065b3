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

#include <maths/CAdwin.h>

#include <core/CLogger.h>

#include <maths/CTools.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace axgb {
namespace maths {

const double CAdwin::DEFAULT_DELTA{0.002};
const std::size_t CAdwin::DEFAULT_CLOCK{32};
const std::size_t CAdwin::DEFAULT_MAXIMUM_BUCKETS{5};
const std::size_t CAdwin::DEFAULT_MINIMUM_WINDOW_LENGTH{10};
const std::size_t CAdwin::DEFAULT_MINIMUM_SUBWINDOW_LENGTH{5};

CAdwin::CAdwin(double delta,
               std::size_t clock,
               std::size_t maximumBuckets,
               std::size_t minimumWindowLength,
               std::size_t minimumSubwindowLength)
    : m_Delta{delta}, m_Clock{std::max(clock, std::size_t{1})},
      m_MaximumBuckets{std::max(maximumBuckets, std::size_t{2})},
      m_MinimumWindowLength{minimumWindowLength},
      m_MinimumSubwindowLength{std::max(minimumSubwindowLength, std::size_t{1})} {
    if (m_Delta <= 0.0 || m_Delta >= 1.0) {
        LOG_WARN(<< "Invalid confidence " << m_Delta << ", using " << DEFAULT_DELTA);
        m_Delta = DEFAULT_DELTA;
    }
}

void CAdwin::add(double bit) {
    ++m_Width;
    if (m_Rows.empty()) {
        m_Rows.emplace_back();
    }
    m_Rows[0].push_front(SBucket{bit, 0.0});
    ++m_NumberBuckets;

    if (m_Width > 1) {
        double n{static_cast<double>(m_Width)};
        m_Variance += (n - 1.0) * CTools::pow2(bit - m_Total / (n - 1.0)) / n;
    }
    m_Total += bit;

    this->compress();

    m_ChangeDetected = false;
    if (++m_Ticks % m_Clock == 0 && m_Width > m_MinimumWindowLength) {
        while (this->detectAndCut()) {
            m_ChangeDetected = true;
        }
        if (m_ChangeDetected) {
            LOG_TRACE(<< "Change detected, width = " << m_Width
                      << ", estimation = " << this->estimation());
        }
    }
}

bool CAdwin::changeDetected() const {
    return m_ChangeDetected;
}

std::size_t CAdwin::width() const {
    return m_Width;
}

double CAdwin::estimation() const {
    return m_Width == 0 ? 0.0 : m_Total / static_cast<double>(m_Width);
}

std::size_t CAdwin::memoryUsage() const {
    std::size_t mem{sizeof(*this)};
    mem += m_Rows.capacity() * sizeof(TBucketDeque);
    mem += m_NumberBuckets * sizeof(SBucket);
    return mem;
}

double CAdwin::total() const {
    return m_Total;
}

double CAdwin::variance() const {
    return m_Variance;
}

std::size_t CAdwin::numberBuckets() const {
    return m_NumberBuckets;
}

std::size_t CAdwin::numberRows() const {
    return m_Rows.size();
}

std::size_t CAdwin::clock() const {
    return m_Clock;
}

std::size_t CAdwin::maximumBuckets() const {
    return m_MaximumBuckets;
}

std::string CAdwin::print() const {
    std::ostringstream result;
    result << "width = " << m_Width << ", total = " << m_Total
           << ", variance = " << m_Variance;
    for (std::size_t i = 0; i < m_Rows.size(); ++i) {
        result << "\n  row " << i << ":";
        for (const auto& bucket : m_Rows[i]) {
            result << " (" << bucket.s_Total << ", " << bucket.s_Variance << ")";
        }
    }
    return result.str();
}

double CAdwin::bucketSize(std::size_t row) {
    return std::ldexp(1.0, static_cast<int>(row));
}

void CAdwin::compress() {
    for (std::size_t i = 0; i < m_Rows.size(); ++i) {
        if (m_Rows[i].size() <= m_MaximumBuckets) {
            break;
        }
        if (i + 1 == m_Rows.size()) {
            m_Rows.emplace_back();
        }
        // Note that m_Rows may have been reallocated.
        TBucketDeque& row{m_Rows[i]};
        SBucket oldest{row.back()};
        row.pop_back();
        SBucket next{row.back()};
        row.pop_back();

        double n{bucketSize(i)};
        double meanDifference{(oldest.s_Total - next.s_Total) / n};
        double variance{oldest.s_Variance + next.s_Variance +
                        n * n * CTools::pow2(meanDifference) / (2.0 * n)};
        m_Rows[i + 1].push_front(SBucket{oldest.s_Total + next.s_Total, variance});
        --m_NumberBuckets;
    }
}

bool CAdwin::detectAndCut() {
    double width{static_cast<double>(m_Width)};
    double minimumSubwindowLength{static_cast<double>(m_MinimumSubwindowLength)};
    double variance{m_Variance / width};
    double logTerm{std::log(2.0 * std::log(width) / m_Delta)};

    double n0{0.0};
    double n1{width};
    double u0{0.0};
    double u1{m_Total};

    // Scan the splits from the oldest bucket to the newest.
    for (std::size_t i = m_Rows.size(); i > 0; --i) {
        double n{bucketSize(i - 1)};
        const TBucketDeque& row{m_Rows[i - 1]};
        for (auto bucket = row.rbegin(); bucket != row.rend(); ++bucket) {
            n0 += n;
            n1 -= n;
            u0 += bucket->s_Total;
            u1 -= bucket->s_Total;
            if (n1 < minimumSubwindowLength) {
                return false;
            }
            if (n0 < minimumSubwindowLength) {
                continue;
            }
            double m{1.0 / (n0 - minimumSubwindowLength + 1.0) +
                     1.0 / (n1 - minimumSubwindowLength + 1.0)};
            double epsilon{std::sqrt(2.0 * m * variance * logTerm) +
                           2.0 / 3.0 * logTerm * m};
            if (std::fabs(u0 / n0 - u1 / n1) > epsilon) {
                this->dropOldestBucket();
                return true;
            }
        }
    }
    return false;
}

void CAdwin::dropOldestBucket() {
    std::size_t i{m_Rows.size() - 1};
    TBucketDeque& row{m_Rows[i]};
    SBucket oldest{row.back()};
    row.pop_back();
    --m_NumberBuckets;

    double n{bucketSize(i)};
    m_Width -= static_cast<std::size_t>(n);
    m_Total -= oldest.s_Total;
    if (m_Width == 0) {
        m_Total = 0.0;
        m_Variance = 0.0;
    } else {
        double width{static_cast<double>(m_Width)};
        double meanDifference{oldest.s_Total / n - m_Total / width};
        m_Variance -= oldest.s_Variance +
                      n * width * CTools::pow2(meanDifference) / (n + width);
        m_Variance = std::max(m_Variance, 0.0);
    }

    while (m_Rows.empty() == false && m_Rows.back().empty()) {
        m_Rows.pop_back();
    }
}
}
}
