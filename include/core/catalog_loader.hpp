#pragma once

#include "core/target.hpp"
#include "core/transcode_result.hpp"
#include "core/workflow.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Targets and workflows known to the server
 */
struct Catalog
{
    std::map<std::string, TargetPtr> targets;
    std::vector<WorkflowPtr> workflows; // Evaluation order

    TargetPtr findTarget(const std::string &id) const
    {
        auto it = targets.find(id);
        return it == targets.end() ? nullptr : it->second;
    }
};

/**
 * @brief Reads the JSON catalog file
 *
 * Layout:
 * {
 *   "targets":   [{"id", "label", "extension", "options": {...}}],
 *   "workflows": [{"id", "label", "enabled",
 *                  "criteria": [{"key", "type", "value", "combine_type"}],
 *                  "targets": ["target id", ...]}]
 * }
 */
class CatalogLoader
{
public:
    static TranscodeResult loadFile(const std::string &path, Catalog &catalog);
    static TranscodeResult loadJson(const nlohmann::json &document, Catalog &catalog);
};
