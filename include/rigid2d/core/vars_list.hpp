/**
 * @file vars_list.hpp
 * @brief Flat state vector shared by the integrator, detector and resolver
 */

#ifndef RIGID2D_VARS_LIST_HPP
#define RIGID2D_VARS_LIST_HPP

#include <string>
#include <vector>

/**
 * @class VarsList
 * @brief Ordered array of generalized coordinates plus simulation time
 *
 * Slot 0 holds time. Each rigid body owns six contiguous slots starting at its
 * base index, in the order x, vx, y, vy, angle, angular velocity. The list
 * keeps one saved copy so a step can be rolled back to its known-good start.
 */
class VarsList {
public:
    // Offsets of a body's variables from its base index
    static constexpr int X_ = 0;
    static constexpr int VX_ = 1;
    static constexpr int Y_ = 2;
    static constexpr int VY_ = 3;
    static constexpr int W_ = 4;
    static constexpr int VW_ = 5;
    static constexpr int SlotsPerBody = 6;
    static constexpr int TimeIndex = 0;

    VarsList();

    /**
     * @brief Appends slots for one body
     * @param name Prefix for the variable names, usually the body name
     * @return Base index of the new slots
     */
    int addBody(const std::string& name);

    /** @brief Drops every body slot and resets time to zero */
    void clear();

    int numVariables() const { return static_cast<int>(values.size()); }
    int numBodies() const { return (numVariables() - 1) / SlotsPerBody; }

    double getValue(int index) const;
    void setValue(int index, double value);

    const std::vector<double>& getValues() const { return values; }

    /**
     * @brief Replaces all values at once
     * @throws std::invalid_argument on a size mismatch
     */
    void setValues(const std::vector<double>& newValues);

    const std::string& getName(int index) const { return names.at(index); }

    double getTime() const { return values[TimeIndex]; }
    void setTime(double time) { values[TimeIndex] = time; }

    /** @brief Copies the current values aside */
    void saveState();

    /**
     * @brief Restores the values copied by the last saveState()
     * @return false if nothing was ever saved
     */
    bool restoreState();

    /** @brief True when every value is a finite number */
    bool allFinite() const;

private:
    std::vector<double> values;
    std::vector<double> savedValues;
    std::vector<std::string> names;
};

#endif
