/**
 * @file profile.cpp
 * @brief Implementation of the scope timers declared in profile.hpp
 */

#include "rigid2d/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];
    section.start_time = Clock::now();

    if (instance.scope_stack.empty()) {
        section.profile_data.parent_name.clear();
    } else {
        const std::string parentName = instance.scope_stack.top();
        auto& data = section.profile_data;
        if (!data.parent_name.empty() && data.parent_name != parentName) {
            auto& oldKids = instance.sections[data.parent_name].profile_data.children;
            oldKids.erase(std::remove(oldKids.begin(), oldKids.end(), name), oldKids.end());
        }
        data.parent_name = parentName;

        auto& kids = instance.sections[parentName].profile_data.children;
        if (std::find(kids.begin(), kids.end(), name) == kids.end()) {
            kids.push_back(name);
        }
    }
    instance.scope_stack.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();
    if (instance.scope_stack.empty() || instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: unbalanced endSection(\"" << name << "\")\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const duration = Clock::now() - instance.sections[name].start_time;

    data.total_time += duration;
    data.self_time  += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= duration;
    }
    instance.scope_stack.pop();
}

uint64_t Profiler::callCount(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.profile_data.call_count;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (auto& [name, sdata] : instance.sections) {
        if (sdata.profile_data.parent_name.empty()) {
            roots.push_back(name);
            totalTime += sdata.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }
    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();

    std::cout << prefix << (isLast ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls] "
              << totalMs << "ms (total: "
              << std::fixed << std::setprecision(2) << totalPercent << "%, "
              << "self: " << selfPercent << "%)\n";

    for (size_t i = 0; i < pd.children.size(); ++i) {
        std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
        printNode(pd.children[i], childPrefix, i == pd.children.size() - 1, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = std::stack<std::string>();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
