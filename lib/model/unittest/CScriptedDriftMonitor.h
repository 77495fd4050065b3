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

#ifndef INCLUDED_CScriptedDriftMonitor_h
#define INCLUDED_CScriptedDriftMonitor_h

#include <maths/CDriftMonitor.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <numeric>
#include <vector>

//! \brief A drift monitor which reports changes at fixed observations.
//!
//! The script is shared with the test so the observations can be checked
//! after the classifier has discarded the monitor.
class CScriptedDriftMonitor final : public axgb::maths::CDriftMonitor {
public:
    using TDoubleVec = std::vector<double>;
    using TSizeVec = std::vector<std::size_t>;

    struct SScript {
        //! The one based observation counts at which to report a change.
        TSizeVec s_ChangeAt;
        //! The observations added to every monitor created from the script.
        TDoubleVec s_Observations;
        //! The number of monitors created from the script.
        std::size_t s_NumberCreated = 0;
    };
    using TScriptPtr = std::shared_ptr<SScript>;

public:
    explicit CScriptedDriftMonitor(TScriptPtr script) : m_Script{std::move(script)} {
        ++m_Script->s_NumberCreated;
    }

    void add(double bit) override {
        m_Script->s_Observations.push_back(bit);
        m_Bits.push_back(bit);
        const auto& changeAt = m_Script->s_ChangeAt;
        m_ChangeDetected = std::find(changeAt.begin(), changeAt.end(), m_Bits.size()) !=
                           changeAt.end();
    }

    bool changeDetected() const override { return m_ChangeDetected; }

    std::size_t width() const override { return m_Bits.size(); }

    double estimation() const override {
        return m_Bits.empty() ? 0.0
                              : std::accumulate(m_Bits.begin(), m_Bits.end(), 0.0) /
                                    static_cast<double>(m_Bits.size());
    }

    std::size_t memoryUsage() const override {
        return sizeof(*this) + m_Bits.capacity() * sizeof(double);
    }

private:
    TScriptPtr m_Script;
    TDoubleVec m_Bits;
    bool m_ChangeDetected = false;
};

#endif // INCLUDED_CScriptedDriftMonitor_h
