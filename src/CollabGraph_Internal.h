#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "CollabGraph.h"

namespace CollabGraph {
namespace detail {

    // Writes one "[CollabGraph] ..." line when a sink is configured
    inline void logLine(std::ostream* log, const std::string& message) {
        if (log != nullptr) {
            *log << "[CollabGraph] " << message << '\n';
        }
    }

    // Parameter checks shared by the analyzers and AnalysisOptions validation

    inline void validateDamping(double damping) {
        if (!(damping >= 0.0 && damping <= 1.0)) {
            throw InvalidConfigurationException(
                "PageRank damping factor must be in [0, 1], got " + std::to_string(damping) + ".");
        }
    }

    inline void validateIterations(const std::string& what, int iterations) {
        if (iterations < 0) {
            throw InvalidConfigurationException(
                what + " iteration count must not be negative, got " + std::to_string(iterations) + ".");
        }
    }

    inline void validateTolerance(double tolerance) {
        if (!(tolerance >= 0.0)) {
            throw InvalidConfigurationException(
                "PageRank tolerance must not be negative, got " + std::to_string(tolerance) + ".");
        }
    }

    inline void validateBridgingThreshold(double threshold) {
        if (!(threshold >= 0.0 && threshold <= 1.0)) {
            throw InvalidConfigurationException(
                "Bridging threshold must be in [0, 1], got " + std::to_string(threshold) + ".");
        }
    }

    // Runs each task on its own thread. Every started thread is joined before
    // returning or unwinding; the first task failure is rethrown afterwards.
    inline void runConcurrently(const std::vector<std::function<void()>>& tasks) {
        std::vector<std::exception_ptr> errors(tasks.size());
        std::vector<std::thread> threads;
        threads.reserve(tasks.size());

        try {
            for (std::size_t i = 0; i < tasks.size(); ++i) {
                threads.emplace_back([&tasks, &errors, i]() {
                    try {
                        tasks[i]();
                    } catch (...) {
                        errors[i] = std::current_exception();
                    }
                });
            }
        } catch (...) {
            // A thread failed to start
            for (auto& thread : threads) {
                thread.join();
            }
            throw;
        }

        // Wait for all threads to finish
        for (auto& thread : threads) {
            thread.join();
        }
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    // Degrees are read once per analyzer instead of once per inner-loop step
    struct DegreeTable {
        std::vector<int> in;
        std::vector<int> out;
        std::vector<int> total;

        explicit DegreeTable(const Graph& graph)
            : in(graph.getVertexCount()),
              out(graph.getVertexCount()),
              total(graph.getVertexCount()) {
            for (int v = 0; v < graph.getVertexCount(); ++v) {
                in[v] = graph.getVertexInDegree(v);
                out[v] = graph.getVertexOutDegree(v);
                total[v] = in[v] + out[v];
            }
        }
    };

} // namespace detail
} // namespace CollabGraph
