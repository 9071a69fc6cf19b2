/**
 * @fileoverview contact_solver.cpp
 * @brief Matrix form Projected Gauss-Seidel for impulses and contact forces
 *
 * Each sweep visits the rows in order and moves x_i so that row i is
 * satisfied given the current values of the other rows, then projects the
 * non-joint rows back onto x_i >= 0. Rows with a vanishing diagonal belong to
 * records between bodies that cannot respond and are left at zero.
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "rigid2d/collision/contact_solver.hpp"
#include "rigid2d/core/profile.hpp"

namespace RigidBodyCollision
{

#if !defined(ENABLE_CONTACT_SOLVER_DEBUG)
    #define ENABLE_CONTACT_SOLVER_DEBUG 0
#endif

#define DEBUG_LOG(x) \
    do { if (ENABLE_CONTACT_SOLVER_DEBUG) { std::cout << x << std::endl; } } while(0)

namespace {

constexpr double kMinDiagonal = 1e-12;

/**
 * @brief Worst violation of the complementarity conditions for one row
 */
double rowViolation(double x, double a, bool joint) {
    if (joint) {
        return std::fabs(a);
    }
    double v = 0.0;
    if (x < 0) v = std::max(v, -x);
    if (a < 0) v = std::max(v, -a);
    // x*a should vanish; measure it by the smaller of the two
    if (x > 0 && a > 0) v = std::max(v, std::min(x, a));
    return v;
}

} // namespace

std::vector<double> residual(const Matrix& A, const std::vector<double>& x,
                             const std::vector<double>& b)
{
    std::vector<double> accel(b);
    for (size_t i = 0; i < A.size(); ++i) {
        for (size_t j = 0; j < x.size(); ++j) {
            accel[i] += A[i][j] * x[j];
        }
    }
    return accel;
}

bool checkForceAccel(double tol, const std::vector<double>& x,
                     const std::vector<double>& accel,
                     const std::vector<bool>& joint)
{
    for (size_t i = 0; i < x.size(); ++i) {
        if (rowViolation(x[i], accel[i], joint[i]) > tol) {
            return false;
        }
    }
    return true;
}

LcpResult solveLCP_PGS(const Matrix& A,
                       const std::vector<double>& b,
                       const std::vector<bool>& joint,
                       std::vector<double>& x,
                       int maxIterations,
                       double tolerance)
{
    PROFILE_SCOPE("LCP PGS");

    const size_t n = b.size();
    if (A.size() != n || joint.size() != n) {
        throw std::invalid_argument("solveLCP_PGS: size mismatch");
    }
    for (const auto& row : A) {
        if (row.size() != n) {
            throw std::invalid_argument("solveLCP_PGS: matrix is not square");
        }
    }
    if (x.size() != n) {
        x.assign(n, 0.0);
    }

    LcpResult result;
    for (int iter = 0; iter < maxIterations; ++iter) {
        double maxChange = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double const diag = A[i][i];
            if (diag < kMinDiagonal) {
                x[i] = 0.0;
                continue;
            }
            double r = b[i];
            for (size_t j = 0; j < n; ++j) {
                r += A[i][j] * x[j];
            }
            double newX = x[i] - r / diag;
            if (!joint[i] && newX < 0.0) {
                newX = 0.0;
            }
            maxChange = std::max(maxChange, std::fabs(newX - x[i]));
            x[i] = newX;
        }
        result.iterations = iter + 1;
        if (maxChange < tolerance) {
            result.converged = true;
            break;
        }
    }

    std::vector<double> const accel = residual(A, x, b);
    for (size_t i = 0; i < n; ++i) {
        if (A[i][i] < kMinDiagonal) continue;
        result.maxResidual = std::max(result.maxResidual, rowViolation(x[i], accel[i], joint[i]));
    }
    if (!result.converged) {
        DEBUG_LOG("[PGS] no convergence after " << result.iterations
                  << " sweeps, n=" << n << " residual=" << result.maxResidual);
    }
    return result;
}

} // namespace RigidBodyCollision
