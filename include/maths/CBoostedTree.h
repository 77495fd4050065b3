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

#ifndef INCLUDED_axgb_maths_CBoostedTree_h
#define INCLUDED_axgb_maths_CBoostedTree_h

#include <maths/CBoostingEngine.h>
#include <maths/ImportExport.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace axgb {
namespace maths {

//! \brief A node of a regression tree.
//!
//! DESCRIPTION:\n
//! This defines a tree structure on a vector of nodes (maintaining the parent
//! child relationships as indexes into the vector). It holds the (binary)
//! splitting criterion (feature and value) and the tree's prediction at each
//! leaf. The intervals are open above so the left node contains feature vectors
//! for which the feature value is _strictly_ less than the split value. Missing
//! values are sent in the direction chosen when the split was made.
class MATHS_EXPORT CBoostedTreeNode final {
public:
    using TNodeIndex = std::uint32_t;
    using TNodeIndexNodeIndexPr = std::pair<TNodeIndex, TNodeIndex>;
    using TNodeVec = std::vector<CBoostedTreeNode>;
    using TOptionalNodeIndex = boost::optional<TNodeIndex>;
    using TDenseMatrix = CBoostingEngine::TDenseMatrix;

public:
    //! Check if this is a leaf node.
    bool isLeaf() const { return m_LeftChild.is_initialized() == false; }

    //! Get the leaf index for \p row of \p features.
    TNodeIndex leafIndex(const TDenseMatrix& features,
                         Eigen::Index row,
                         const TNodeVec& tree,
                         TNodeIndex index = 0) const;

    //! Check if we should assign \p value to the left child.
    bool assignToLeft(double value) const;

    //! Get the value predicted by \p tree for \p row of \p features.
    double value(const TDenseMatrix& features, Eigen::Index row, const TNodeVec& tree) const {
        return tree[this->leafIndex(features, row, tree)].m_NodeValue;
    }

    //! Get the value of this node.
    double value() const { return m_NodeValue; }

    //! Set the node value to \p value.
    void value(double value) { m_NodeValue = value; }

    //! Get the gain of the split.
    double gain() const { return m_Gain; }

    //! Get the total curvature at the rows below this node.
    double curvature() const { return m_Curvature; }

    //! Set the number of samples to \p value.
    void numberSamples(std::size_t value) { m_NumberSamples = value; }

    //! Get number of samples affected by the node.
    std::size_t numberSamples() const { return m_NumberSamples; }

    //! Get the index of the left child node.
    TNodeIndex leftChildIndex() const { return m_LeftChild.get(); }

    //! Get the index of the right child node.
    TNodeIndex rightChildIndex() const { return m_RightChild.get(); }

    //! Get the feature index of the split.
    std::size_t splitFeature() const { return m_SplitFeature; }

    //! Get the split value.
    double splitValue() const { return m_SplitValue; }

    //! Check if missing values go to the left child.
    bool assignMissingToLeft() const { return m_AssignMissingToLeft; }

    //! Split this node and add its child nodes to \p tree.
    TNodeIndexNodeIndexPr split(std::size_t splitFeature,
                                double splitValue,
                                bool assignMissingToLeft,
                                double gain,
                                double curvature,
                                TNodeVec& tree);

    //! Get a human readable description of the tree rooted at this node.
    std::string print(const TNodeVec& tree) const;

private:
    std::ostringstream&
    doPrint(std::string pad, const TNodeVec& tree, std::ostringstream& result) const;

private:
    std::size_t m_SplitFeature = 0;
    double m_SplitValue = 0.0;
    bool m_AssignMissingToLeft = true;
    TOptionalNodeIndex m_LeftChild;
    TOptionalNodeIndex m_RightChild;
    double m_NodeValue = 0.0;
    double m_Gain = 0.0;
    double m_Curvature = 0.0;
    std::size_t m_NumberSamples = 0;
};

//! \brief A single regression tree trained for one boosting round.
//!
//! DESCRIPTION:\n
//! The tree predicts a log-odds increment. The root is the first node.
class MATHS_EXPORT CBoostedTree final : public CBoostingEngine::CTrainedTree {
public:
    using TNodeVec = CBoostedTreeNode::TNodeVec;
    using TDenseMatrix = CBoostingEngine::TDenseMatrix;

public:
    explicit CBoostedTree(TNodeVec nodes);

    //! Get the leaf value for \p row of \p features.
    double margin(const TDenseMatrix& features, Eigen::Index row) const override;

    //! Get a human readable description of the tree.
    std::string print() const override;

    //! Get the nodes.
    const TNodeVec& nodes() const { return m_Nodes; }

    //! Get the number of leaves.
    std::size_t numberLeaves() const;

    //! Get the depth of the deepest leaf.
    std::size_t depth() const;

    //! Get the memory used by this object.
    std::size_t memoryUsage() const;

private:
    std::size_t depth(CBoostedTreeNode::TNodeIndex index) const;

private:
    TNodeVec m_Nodes;
};
}
}

#endif // INCLUDED_axgb_maths_CBoostedTree_h
