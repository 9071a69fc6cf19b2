/**
 * @file contact_solver.hpp
 * @brief Projected Gauss-Seidel solver for the contact and impulse LCP
 *
 * Both the impulse and the contact force problems have the form
 *
 *     a = A x + b
 *
 * where A is the symmetric influence matrix of the records. Non-joint rows must
 * end with x >= 0, a >= 0 and x*a = 0. Joint rows are bilateral: x is free and
 * a must be zero.
 */

#ifndef RIGID2D_CONTACT_SOLVER_HPP
#define RIGID2D_CONTACT_SOLVER_HPP

#include <vector>

namespace RigidBodyCollision {

using Matrix = std::vector<std::vector<double>>;

struct LcpResult {
    int iterations = 0;
    bool converged = false;
    double maxResidual = 0.0;  // worst violation of the conditions above
};

/**
 * @brief Solves the mixed LCP by projected Gauss-Seidel
 *
 * @param A Square influence matrix
 * @param b Constant term, one entry per row
 * @param joint Rows that are bilateral (no sign clamp)
 * @param x In: starting guess, resized and zeroed if the size differs. Out: solution
 * @param maxIterations Sweeps before giving up
 * @param tolerance Largest change of any x in a sweep that counts as converged
 * @throws std::invalid_argument on mismatched sizes
 */
LcpResult solveLCP_PGS(const Matrix& A,
                       const std::vector<double>& b,
                       const std::vector<bool>& joint,
                       std::vector<double>& x,
                       int maxIterations = 2000,
                       double tolerance = 1e-12);

/**
 * @brief Checks a solution against the complementarity conditions
 * @param tol Allowed violation
 * @param x Forces or impulses
 * @param accel A x + b
 */
bool checkForceAccel(double tol, const std::vector<double>& x,
                     const std::vector<double>& accel,
                     const std::vector<bool>& joint);

/** @brief A x + b */
std::vector<double> residual(const Matrix& A, const std::vector<double>& x,
                             const std::vector<double>& b);

} // namespace RigidBodyCollision

#endif
