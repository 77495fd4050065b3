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

#include <core/CLogger.h>

#include <maths/CBoostedTree.h>

#include <boost/test/unit_test.hpp>

#include <limits>
#include <string>

BOOST_AUTO_TEST_SUITE(CBoostedTreeTest)

using namespace axgb;

namespace {
using TNodeVec = maths::CBoostedTreeNode::TNodeVec;
using TDenseMatrix = maths::CBoostingEngine::TDenseMatrix;

const double NaN{std::numeric_limits<double>::quiet_NaN()};

TNodeVec stump(bool assignMissingToLeft) {
    TNodeVec tree(1);
    auto children = tree[0].split(1, 0.5, assignMissingToLeft, 2.0, 10.0, tree);
    tree[children.first].value(-1.0);
    tree[children.second].value(2.0);
    return tree;
}
}

BOOST_AUTO_TEST_CASE(testLeafIndex) {
    TNodeVec tree{stump(true)};

    TDenseMatrix features(4, 2);
    features << 0.0, 0.2, //
        5.0, 0.5,         //
        -1.0, 0.9,        //
        3.0, NaN;

    BOOST_REQUIRE_EQUAL(1, tree[0].leafIndex(features, 0, tree));
    // The split is open above.
    BOOST_REQUIRE_EQUAL(2, tree[0].leafIndex(features, 1, tree));
    BOOST_REQUIRE_EQUAL(2, tree[0].leafIndex(features, 2, tree));
    BOOST_REQUIRE_EQUAL(1, tree[0].leafIndex(features, 3, tree));

    tree = stump(false);
    BOOST_REQUIRE_EQUAL(2, tree[0].leafIndex(features, 3, tree));
}

BOOST_AUTO_TEST_CASE(testTree) {
    maths::CBoostedTree tree{stump(false)};

    BOOST_REQUIRE_EQUAL(3, tree.nodes().size());
    BOOST_REQUIRE_EQUAL(2, tree.numberLeaves());
    BOOST_REQUIRE_EQUAL(1, tree.depth());
    BOOST_REQUIRE_EQUAL(1, tree.nodes()[0].splitFeature());
    BOOST_REQUIRE_EQUAL(0.5, tree.nodes()[0].splitValue());
    BOOST_REQUIRE_EQUAL(2.0, tree.nodes()[0].gain());
    BOOST_REQUIRE_EQUAL(10.0, tree.nodes()[0].curvature());
    BOOST_TEST_REQUIRE(tree.nodes()[0].assignMissingToLeft() == false);
    BOOST_TEST_REQUIRE(tree.memoryUsage() > sizeof(maths::CBoostedTree));

    TDenseMatrix features(3, 2);
    features << 0.0, 0.1, //
        0.0, 0.7,         //
        0.0, NaN;
    BOOST_REQUIRE_EQUAL(-1.0, tree.margin(features, 0));
    BOOST_REQUIRE_EQUAL(2.0, tree.margin(features, 1));
    BOOST_REQUIRE_EQUAL(2.0, tree.margin(features, 2));

    std::string description{tree.print()};
    LOG_DEBUG(<< "tree = " << description);
    BOOST_TEST_REQUIRE(description.find("split feature '1' @ 0.5") != std::string::npos);
    BOOST_TEST_REQUIRE(description.find("missing right") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(testSingleLeaf) {
    TNodeVec nodes(1);
    nodes[0].value(0.25);
    maths::CBoostedTree tree{nodes};

    BOOST_REQUIRE_EQUAL(1, tree.numberLeaves());
    BOOST_REQUIRE_EQUAL(0, tree.depth());

    TDenseMatrix features(1, 3);
    features << 1.0, NaN, -4.0;
    BOOST_REQUIRE_EQUAL(0.25, tree.margin(features, 0));
}

BOOST_AUTO_TEST_SUITE_END()
