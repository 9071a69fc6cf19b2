/**
 * @file advance_strategy.hpp
 * @brief How a simulation is moved forward in time
 */

#pragma once

namespace Engine {

/**
 * @class MemoList
 * @brief Something to notify every time the sim time has moved forward
 */
class MemoList {
public:
    virtual ~MemoList() = default;
    virtual void memorize() = 0;
};

class IAdvanceStrategy {
public:
    virtual ~IAdvanceStrategy() = default;

    /**
     * @brief Advances the sim by exactly @p timeStep
     * @param memo Notified after each sub-step that moved time forward, may be null
     */
    virtual void advance(double timeStep, MemoList* memo = nullptr) = 0;

    virtual double getTime() const = 0;
    virtual double getTimeStep() const = 0;
    virtual void setTimeStep(double timeStep) = 0;

    /** @brief Returns to the state recorded by save(), or the initial one */
    virtual void reset() = 0;
    virtual void save() = 0;
};

} // namespace Engine
