#include "core/catalog_loader.hpp"
#include "logging/logger.hpp"
#include <fstream>

namespace
{
    TranscodeResult invalid(const std::string &message)
    {
        Logger::error("Invalid catalog: " + message);
        return TranscodeResult::failure(TranscodeError::VALIDATION, message);
    }

    TranscodeResult parseCriteria(const nlohmann::json &node, const std::string &workflow_id, size_t position,
                                  Criteria &criteria)
    {
        if (!node.is_object())
            return invalid("Criteria " + std::to_string(position) + " of workflow " + workflow_id + " is not an object");

        std::string key_text = node.value("key", "");
        std::string type_text = node.value("type", "");
        std::string combine_text = node.value("combine_type", "AND");

        auto key = parseCriteriaKey(key_text);
        if (!key)
            return invalid("Unknown criteria key '" + key_text + "' in workflow " + workflow_id);
        auto type = parseCriteriaType(type_text);
        if (!type)
            return invalid("Unknown criteria type '" + type_text + "' in workflow " + workflow_id);
        auto combine = parseCombineType(combine_text);
        if (!combine)
            return invalid("Unknown combine type '" + combine_text + "' in workflow " + workflow_id);

        criteria.id = node.value("id", workflow_id + "_" + std::to_string(position));
        criteria.workflow_id = workflow_id;
        criteria.key = *key;
        criteria.type = *type;
        criteria.combine_type = *combine;

        const auto value = node.find("value");
        if (value == node.end() || value->is_null())
            criteria.value.clear();
        else if (value->is_string())
            criteria.value = value->get<std::string>();
        else
            criteria.value = value->dump();
        return TranscodeResult::ok();
    }
}

TranscodeResult CatalogLoader::loadFile(const std::string &path, Catalog &catalog)
{
    std::ifstream in(path);
    if (!in.good())
        return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Catalog file not found: " + path);

    try
    {
        nlohmann::json document = nlohmann::json::parse(in);
        auto result = loadJson(document, catalog);
        if (result.success)
        {
            Logger::info("Loaded catalog " + path + " with " + std::to_string(catalog.targets.size()) +
                         " targets and " + std::to_string(catalog.workflows.size()) + " workflows");
        }
        return result;
    }
    catch (const nlohmann::json::exception &e)
    {
        return invalid("Failed to parse " + path + ": " + std::string(e.what()));
    }
}

TranscodeResult CatalogLoader::loadJson(const nlohmann::json &document, Catalog &catalog)
{
    if (!document.is_object())
        return invalid("Catalog root must be an object");

    Catalog loaded;
    try
    {
        for (const auto &node : document.value("targets", nlohmann::json::array()))
        {
            auto target = std::make_shared<Target>();
            target->id = node.at("id").get<std::string>();
            target->label = node.value("label", target->id);
            target->extension = node.value("extension", "mp4");
            if (node.contains("options"))
                target->options = node.at("options").get<EncoderOptions>();

            if (target->id.empty())
                return invalid("Target without id");
            if (!loaded.targets.emplace(target->id, target).second)
                return invalid("Duplicate target id " + target->id);
        }

        for (const auto &node : document.value("workflows", nlohmann::json::array()))
        {
            std::string id = node.at("id").get<std::string>();
            auto workflow = std::make_shared<Workflow>(id, node.value("label", id), node.value("enabled", true));

            std::vector<Criteria> criteria;
            size_t position = 0;
            for (const auto &criteria_node : node.value("criteria", nlohmann::json::array()))
            {
                Criteria parsed;
                auto result = parseCriteria(criteria_node, id, position++, parsed);
                if (!result.success)
                    return result;
                criteria.push_back(parsed);
            }

            auto criteria_result = workflow->setCriteria(criteria);
            if (!criteria_result.success)
                return criteria_result;

            std::vector<TargetPtr> targets;
            for (const auto &target_id : node.value("targets", nlohmann::json::array()))
            {
                auto target = loaded.findTarget(target_id.get<std::string>());
                if (!target)
                    return invalid("Workflow " + id + " references unknown target " + target_id.dump());
                targets.push_back(target);
            }
            workflow->setTargets(targets);
            loaded.workflows.push_back(workflow);
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        return invalid(std::string("Malformed catalog entry: ") + e.what());
    }

    catalog = std::move(loaded);
    return TranscodeResult::ok();
}
