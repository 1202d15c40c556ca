/**
 * @file scenario_diagnostics.hpp
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/scenario/scenario_model.hpp"

namespace plotgraph
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Suspicious but playable.
    Error     ///< The scenario is broken on at least one path.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    DuplicateSceneId,          ///< Two scenes share an id.
    DanglingSceneReference,    ///< A next id or branch target names no scene.
    MissingStartScene,         ///< The scenario has no scenes.
    NoEndingScene,             ///< No scene ends the story.
    UnreachableScene,          ///< A scene cannot be reached from the start.
    UndefinedEntityReference,  ///< A referenced entity is absent on every path.
    PossiblyAbsentEntity       ///< A referenced entity is absent on some path.
};

const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Scenes involved in this issue (if applicable).
    std::vector<SceneId> involved_scenes;

    /// Entities involved in this issue (if applicable).
    std::vector<EntityId> involved_entities;
};

// ============================================================================
// ScenarioDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected for one scenario.
 *
 * @details
 * Produced by `ScenarioConsistencyChecker::check()`.
 *
 * @par Error vs Warning
 * - **Errors**: DuplicateSceneId, DanglingSceneReference, MissingStartScene,
 *   UndefinedEntityReference.
 * - **Warnings**: NoEndingScene, UnreachableScene, PossiblyAbsentEntity.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class ScenarioDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the scenario is consistent.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /// Number of items in the given category, errors and warnings alike.
    size_t count(DiagnosticCategory category) const noexcept
    {
        size_t n = 0;
        for (const auto& item : m_errors)
        {
            n += item.category == category ? 1 : 0;
        }
        for (const auto& item : m_warnings)
        {
            n += item.category == category ? 1 : 0;
        }
        return n;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        return std::to_string(m_errors.size()) + " error(s), " +
               std::to_string(m_warnings.size()) + " warning(s)";
    }

    friend class ScenarioConsistencyChecker;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace plotgraph
