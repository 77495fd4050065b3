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

#include <maths/CBoostedTree.h>

#include <core/CLogger.h>

#include <maths/CTools.h>

#include <algorithm>

namespace axgb {
namespace maths {

CBoostedTreeNode::TNodeIndex CBoostedTreeNode::leafIndex(const TDenseMatrix& features,
                                                         Eigen::Index row,
                                                         const TNodeVec& tree,
                                                         TNodeIndex index) const {
    if (this->isLeaf()) {
        return index;
    }
    return this->assignToLeft(features(row, static_cast<Eigen::Index>(m_SplitFeature)))
               ? tree[m_LeftChild.get()].leafIndex(features, row, tree, m_LeftChild.get())
               : tree[m_RightChild.get()].leafIndex(features, row, tree, m_RightChild.get());
}

bool CBoostedTreeNode::assignToLeft(double value) const {
    bool missing{CTools::isMissing(value)};
    return (missing && m_AssignMissingToLeft) || (missing == false && value < m_SplitValue);
}

CBoostedTreeNode::TNodeIndexNodeIndexPr CBoostedTreeNode::split(std::size_t splitFeature,
                                                                double splitValue,
                                                                bool assignMissingToLeft,
                                                                double gain,
                                                                double curvature,
                                                                TNodeVec& tree) {
    m_SplitFeature = splitFeature;
    m_SplitValue = splitValue;
    m_AssignMissingToLeft = assignMissingToLeft;
    m_LeftChild = static_cast<TNodeIndex>(tree.size());
    m_RightChild = static_cast<TNodeIndex>(tree.size() + 1);
    m_Gain = gain;
    m_Curvature = curvature;
    TNodeIndexNodeIndexPr result{m_LeftChild.get(), m_RightChild.get()};
    // Don't access members after calling resize because this object is likely an
    // element of the vector being resized.
    tree.resize(tree.size() + 2);
    return result;
}

std::string CBoostedTreeNode::print(const TNodeVec& tree) const {
    std::ostringstream result;
    return this->doPrint("", tree, result).str();
}

std::ostringstream& CBoostedTreeNode::doPrint(std::string pad,
                                              const TNodeVec& tree,
                                              std::ostringstream& result) const {
    result << "\n" << pad;
    if (this->isLeaf()) {
        result << m_NodeValue;
    } else {
        result << "split feature '" << m_SplitFeature << "' @ " << m_SplitValue
               << (m_AssignMissingToLeft ? " (missing left)" : " (missing right)");
        tree[m_LeftChild.get()].doPrint(pad + "  ", tree, result);
        tree[m_RightChild.get()].doPrint(pad + "  ", tree, result);
    }
    return result;
}

CBoostedTree::CBoostedTree(TNodeVec nodes) : m_Nodes{std::move(nodes)} {
    if (m_Nodes.empty()) {
        LOG_ABORT(<< "A tree must have a root");
    }
}

double CBoostedTree::margin(const TDenseMatrix& features, Eigen::Index row) const {
    return m_Nodes[0].value(features, row, m_Nodes);
}

std::string CBoostedTree::print() const {
    return m_Nodes[0].print(m_Nodes);
}

std::size_t CBoostedTree::numberLeaves() const {
    return static_cast<std::size_t>(
        std::count_if(m_Nodes.begin(), m_Nodes.end(),
                      [](const CBoostedTreeNode& node) { return node.isLeaf(); }));
}

std::size_t CBoostedTree::depth() const {
    return this->depth(0);
}

std::size_t CBoostedTree::depth(CBoostedTreeNode::TNodeIndex index) const {
    const auto& node = m_Nodes[index];
    if (node.isLeaf()) {
        return 0;
    }
    return 1 + std::max(this->depth(node.leftChildIndex()), this->depth(node.rightChildIndex()));
}

std::size_t CBoostedTree::memoryUsage() const {
    return sizeof(*this) + m_Nodes.capacity() * sizeof(CBoostedTreeNode);
}
}
}
