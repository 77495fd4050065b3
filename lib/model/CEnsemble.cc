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

#include <model/CEnsemble.h>

#include <core/CLogger.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace axgb {
namespace model {
namespace {
std::size_t checkedCapacity(std::size_t capacity) {
    if (capacity == 0) {
        LOG_WARN(<< "Ensemble capacity must be positive, using 1");
        return 1;
    }
    return capacity;
}
}

CEnsemble::CEnsemble(std::size_t capacity) : m_Capacity{checkedCapacity(capacity)} {
}

CEnsemble::TEnsembleUPtr CEnsemble::create(EUpdateStrategy updateStrategy, std::size_t capacity) {
    switch (updateStrategy) {
    case CAdaptiveBoostedTreeConfig::E_Push:
        return std::make_unique<CPushEnsemble>(capacity);
    case CAdaptiveBoostedTreeConfig::E_Replace:
        return std::make_unique<CReplaceEnsemble>(capacity);
    }
    LOG_ABORT(<< "Unexpected update strategy " << static_cast<int>(updateStrategy));
}

std::size_t CEnsemble::capacity() const {
    return m_Capacity;
}

CPushEnsemble::CPushEnsemble(std::size_t capacity) : CEnsemble{capacity} {
}

void CPushEnsemble::insert(TTrainedTreeCPtr tree) {
    if (m_Trees.size() >= this->capacity()) {
        m_Trees.pop_front();
    }
    m_Trees.push_back(std::move(tree));
}

CEnsemble::TTrainedTreeCPtrVec CPushEnsemble::liveMembers() const {
    return TTrainedTreeCPtrVec(m_Trees.begin(), m_Trees.end());
}

std::size_t CPushEnsemble::numberLiveMembers() const {
    return m_Trees.size();
}

void CPushEnsemble::resetCursor() {
}

CEnsemble::EUpdateStrategy CPushEnsemble::updateStrategy() const {
    return CAdaptiveBoostedTreeConfig::E_Push;
}

std::size_t CPushEnsemble::memoryUsage() const {
    return sizeof(*this) + m_Trees.size() * sizeof(TTrainedTreeCPtr);
}

CReplaceEnsemble::CReplaceEnsemble(std::size_t capacity)
    : CEnsemble{capacity}, m_Slots(this->capacity()) {
}

void CReplaceEnsemble::insert(TTrainedTreeCPtr tree) {
    m_Slots[m_Cursor] = std::move(tree);
    m_Cursor = (m_Cursor + 1) % m_Slots.size();
}

CEnsemble::TTrainedTreeCPtrVec CReplaceEnsemble::liveMembers() const {
    TTrainedTreeCPtrVec result;
    result.reserve(m_Slots.size());
    std::copy_if(m_Slots.begin(), m_Slots.end(), std::back_inserter(result),
                 [](const TTrainedTreeCPtr& tree) { return tree != nullptr; });
    return result;
}

std::size_t CReplaceEnsemble::numberLiveMembers() const {
    return static_cast<std::size_t>(
        std::count_if(m_Slots.begin(), m_Slots.end(),
                      [](const TTrainedTreeCPtr& tree) { return tree != nullptr; }));
}

void CReplaceEnsemble::resetCursor() {
    m_Cursor = 0;
}

CEnsemble::EUpdateStrategy CReplaceEnsemble::updateStrategy() const {
    return CAdaptiveBoostedTreeConfig::E_Replace;
}

std::size_t CReplaceEnsemble::memoryUsage() const {
    return sizeof(*this) + m_Slots.capacity() * sizeof(TTrainedTreeCPtr);
}

std::size_t CReplaceEnsemble::cursor() const {
    return m_Cursor;
}

const CEnsemble::TTrainedTreeCPtr& CReplaceEnsemble::slot(std::size_t i) const {
    if (i >= m_Slots.size()) {
        throw std::out_of_range{"Slot " + std::to_string(i) + " out of range"};
    }
    return m_Slots[i];
}
}
}
