/**
 * @file scenario_enums.hpp
 */
#pragma once
#include "plotgraph/common/common.hpp"

namespace plotgraph
{

/**
 * @brief How a scenario graph edge was derived from a scene.
 */
enum class TransitionType
{
    Linear,  ///< The scene's `next_scene_id`.
    Branch   ///< One of the scene's branches.
};

/**
 * @brief Severity of a consistency issue reported by a path evaluator.
 */
enum class IssueSeverity
{
    Info,
    Warning,
    Error,
    Critical
};

/**
 * @brief Kind of consistency issue reported by a path evaluator.
 */
enum class ConsistencyIssueType
{
    Unknown,
    EntityInconsistency,
    TimelineConflict,
    CharacterInconsistency,
    LocationInconsistency,
    PlotHole,
    LogicalContradiction
};

inline const char* to_string(TransitionType type) noexcept
{
    switch (type)
    {
    case TransitionType::Linear:
        return "Linear";
    case TransitionType::Branch:
        return "Branch";
    }
    return "Unknown";
}

inline const char* to_string(IssueSeverity severity) noexcept
{
    switch (severity)
    {
    case IssueSeverity::Info:
        return "Info";
    case IssueSeverity::Warning:
        return "Warning";
    case IssueSeverity::Error:
        return "Error";
    case IssueSeverity::Critical:
        return "Critical";
    }
    return "Unknown";
}

} // namespace plotgraph
