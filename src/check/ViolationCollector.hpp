//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/check/ViolationCollector.hpp
// Purpose: Append-only sink shared by scanning workers.
// Key invariants: append() is safe from any number of threads; take() is
//                 called once after all workers finished.
// Ownership/Lifetime: Owned by ApiChecker::run for the duration of one run.
// Links: check/ApiChecker.cpp
#pragma once

#include "check/Reference.hpp"

#include <mutex>
#include <vector>

namespace apicheck::check
{

class ViolationCollector
{
  public:
    void append(std::vector<Violation> batch)
    {
        if (batch.empty())
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &v : batch)
            violations_.push_back(std::move(v));
    }

    /// @brief Move the accumulated violations out, in arrival order.
    std::vector<Violation> take()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(violations_);
    }

  private:
    std::mutex mutex_;
    std::vector<Violation> violations_;
};

} // namespace apicheck::check
