/**
 * @file scenario_model.hpp
 * @brief Read-only content model of a branching scenario.
 */
#pragma once
#include "plotgraph/common/common.hpp"

namespace plotgraph
{

/// Scene identifiers are the node type of every scenario graph.
using SceneId = std::string;

/// Entities (characters, items, locations) are tracked by name.
using EntityId = std::string;

/**
 * @brief A player choice leading out of a scene.
 *
 * @details
 * A branch without a target (absent or empty `next_scene_id`) is a choice
 * that leads nowhere; it produces no graph edge.
 */
struct Branch
{
    std::string choice;
    std::optional<SceneId> next_scene_id{};

    bool has_target() const noexcept
    {
        return next_scene_id && !next_scene_id->empty();
    }
};

/**
 * @brief One unit of narrative content.
 *
 * @details
 * A scene has at most one linear successor and any number of branches. The
 * entity lists describe what the scene does to the story's cast and props:
 * - `introduced_entities` become present after the scene.
 * - `removed_entities` are gone after the scene (applied after introductions).
 * - `referenced_entities` are mentioned by the scene and are expected to be
 *   present when it is reached.
 */
struct Scene
{
    SceneId id;
    std::string title{};
    std::string content{};
    std::optional<SceneId> next_scene_id{};
    std::vector<Branch> branches{};
    std::vector<EntityId> introduced_entities{};
    std::vector<EntityId> removed_entities{};
    std::vector<EntityId> referenced_entities{};

    bool has_next_scene() const noexcept
    {
        return next_scene_id && !next_scene_id->empty();
    }

    /// True if neither the linear successor nor any branch has a target.
    bool is_ending() const noexcept
    {
        if (has_next_scene())
        {
            return false;
        }
        for (const auto& b : branches)
        {
            if (b.has_target())
            {
                return false;
            }
        }
        return true;
    }
};

/**
 * @brief A scenario: an ordered collection of scenes.
 *
 * @details
 * Scene order matters only for the start-scene heuristic and for the order
 * of reported results.
 */
struct Scenario
{
    std::string id;
    std::string title{};
    std::vector<Scene> scenes{};

    /// First scene with the given id, or `nullptr`.
    const Scene* find_scene(const SceneId& scene_id) const noexcept
    {
        for (const auto& s : scenes)
        {
            if (s.id == scene_id)
            {
                return &s;
            }
        }
        return nullptr;
    }
};

} // namespace plotgraph
