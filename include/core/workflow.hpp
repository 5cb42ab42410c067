#pragma once

#include "core/criteria.hpp"
#include "core/media.hpp"
#include "core/target.hpp"
#include "core/transcode_result.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Rule set deciding which targets apply to a media item
 */
class Workflow
{
public:
    Workflow(const std::string &id, const std::string &label, bool enabled = true);

    const std::string &getId() const { return id_; }
    const std::string &getLabel() const { return label_; }
    bool isEnabled() const { return enabled_; }
    void setEnabled(bool enabled) { enabled_ = enabled; }

    const std::vector<Criteria> &getCriteria() const { return criteria_; }
    const std::vector<TargetPtr> &getTargets() const { return targets_; }

    /**
     * @brief Replace the criteria list
     *
     * The whole list is rejected when any criterion is illegal, in which case
     * the previous list is kept.
     *
     * @param criteria Ordered criteria
     * @return VALIDATION failure naming the offending criterion
     */
    TranscodeResult setCriteria(const std::vector<Criteria> &criteria);

    void setTargets(const std::vector<TargetPtr> &targets) { targets_ = targets; }

    /**
     * @brief Whether this workflow applies to the media
     * @return false when disabled, otherwise the criteria fold
     */
    bool isMediaEligible(const Media &media) const;

    std::string toString() const;

private:
    std::string id_;
    std::string label_;
    bool enabled_;
    std::vector<Criteria> criteria_;
    std::vector<TargetPtr> targets_;
};

using WorkflowPtr = std::shared_ptr<Workflow>;

/**
 * @brief First enabled workflow, in list order, that the media is eligible for
 * @return nullptr when no workflow applies
 */
WorkflowPtr findEligibleWorkflow(const Media &media, const std::vector<WorkflowPtr> &workflows);
