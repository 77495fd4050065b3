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

#ifndef INCLUDED_axgb_maths_CLinearAlgebraEigen_h
#define INCLUDED_axgb_maths_CLinearAlgebraEigen_h

#include <Eigen/Core>

namespace axgb {
namespace maths {

//! The dense matrix type used for mini-batches of feature vectors.
//!
//! Rows are examples and are stored contiguously so tree traversal
//! for one example touches a single cache line run.
template<typename SCALAR>
using CDenseMatrix = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

//! The dense column vector type used for labels and margins.
template<typename SCALAR>
using CDenseVector = Eigen::Matrix<SCALAR, Eigen::Dynamic, 1>;
}
}

#endif // INCLUDED_axgb_maths_CLinearAlgebraEigen_h
