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

#ifndef INCLUDED_axgb_model_CEnsemble_h
#define INCLUDED_axgb_model_CEnsemble_h

#include <maths/CBoostingEngine.h>

#include <model/CAdaptiveBoostedTreeConfig.h>
#include <model/ImportExport.h>

#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

namespace axgb {
namespace model {

//! \brief A bounded collection of trained trees.
//!
//! DESCRIPTION:\n
//! Each tree is trained on the margins of the trees which were in the
//! ensemble when it was trained so the members must be scored in training
//! order. Implementations differ in what happens when a tree is inserted
//! into a full ensemble.
class MODEL_EXPORT CEnsemble {
public:
    using EUpdateStrategy = CAdaptiveBoostedTreeConfig::EUpdateStrategy;
    using TTrainedTreeCPtr = maths::CBoostingEngine::TTrainedTreeCPtr;
    using TTrainedTreeCPtrVec = std::vector<TTrainedTreeCPtr>;
    using TEnsembleUPtr = std::unique_ptr<CEnsemble>;

public:
    virtual ~CEnsemble() = default;

    //! Create an empty ensemble for \p updateStrategy which holds at most
    //! \p capacity trees.
    static TEnsembleUPtr create(EUpdateStrategy updateStrategy, std::size_t capacity);

    //! Get the maximum number of trees.
    std::size_t capacity() const;

    //! Add \p tree.
    virtual void insert(TTrainedTreeCPtr tree) = 0;

    //! Get the trees in the order their margins are chained.
    virtual TTrainedTreeCPtrVec liveMembers() const = 0;

    //! Get the number of trees.
    virtual std::size_t numberLiveMembers() const = 0;

    //! Start overwriting from the first slot, if the ensemble has slots.
    virtual void resetCursor() = 0;

    //! Get the update strategy this implements.
    virtual EUpdateStrategy updateStrategy() const = 0;

    //! Get the memory used by this object.
    virtual std::size_t memoryUsage() const = 0;

protected:
    explicit CEnsemble(std::size_t capacity);

private:
    std::size_t m_Capacity;
};

//! \brief An ensemble which evicts its oldest tree when full.
class MODEL_EXPORT CPushEnsemble final : public CEnsemble {
public:
    explicit CPushEnsemble(std::size_t capacity);

    void insert(TTrainedTreeCPtr tree) override;
    TTrainedTreeCPtrVec liveMembers() const override;
    std::size_t numberLiveMembers() const override;
    //! No-op.
    void resetCursor() override;
    EUpdateStrategy updateStrategy() const override;
    std::size_t memoryUsage() const override;

private:
    using TTrainedTreeCPtrDeque = std::deque<TTrainedTreeCPtr>;

private:
    //! The oldest tree is at the front.
    TTrainedTreeCPtrDeque m_Trees;
};

//! \brief An ensemble with a fixed number of slots which are overwritten
//! round robin.
//!
//! DESCRIPTION:\n
//! A new tree is written into the slot at the cursor, silently discarding
//! the previous occupant, and the cursor advances wrapping at the capacity.
//! Slot i therefore holds the (i mod capacity)'th tree trained since the
//! cursor was last reset and live members are visited in slot order.
class MODEL_EXPORT CReplaceEnsemble final : public CEnsemble {
public:
    explicit CReplaceEnsemble(std::size_t capacity);

    void insert(TTrainedTreeCPtr tree) override;
    TTrainedTreeCPtrVec liveMembers() const override;
    std::size_t numberLiveMembers() const override;
    void resetCursor() override;
    EUpdateStrategy updateStrategy() const override;
    std::size_t memoryUsage() const override;

    //! Get the index of the next slot to write.
    std::size_t cursor() const;

    //! Get the tree in slot \p i, null if it is unset.
    const TTrainedTreeCPtr& slot(std::size_t i) const;

private:
    //! Unset slots hold null.
    TTrainedTreeCPtrVec m_Slots;
    std::size_t m_Cursor = 0;
};
}
}

#endif // INCLUDED_axgb_model_CEnsemble_h
