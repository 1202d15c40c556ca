/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "plotgraph/common/common.hpp"

namespace plotgraph
{

/**
 * @brief Error codes for graph algorithm failures.
 */
enum class GraphErrorCode
{
    CycleDetected,
    MissingEdge,
    InvalidArgument
};

/**
 * @brief Error codes for dataflow and dominator analysis failures.
 */
enum class AnalysisErrorCode
{
    InvalidStartNode,
    InvalidTarget
};

/**
 * @brief Exception class for graph algorithm errors.
 *
 * @details
 * `GraphError` is thrown by the algorithms in `graph_algorithms.hpp` and
 * `path_algorithms.hpp` when a precondition on the graph shape is violated,
 * for example a topological sort over a cyclic graph. Queries on a
 * constructed `DirectedGraph` never throw it.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class GraphError : public std::exception
{
public:
    /**
     * @brief Construct a GraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    GraphError(GraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception class for analysis input errors.
 *
 * @details
 * Thrown when an analysis is asked to start from a node that is not part of
 * its input. This is an invalid-argument failure: the analysis is abandoned
 * before any result is produced.
 */
class AnalysisError : public std::exception
{
public:
    AnalysisError(AnalysisErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    AnalysisErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    AnalysisErrorCode m_code;
    std::string m_message;
};

} // namespace plotgraph
