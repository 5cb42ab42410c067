#include "core/workflow.hpp"
#include "logging/logger.hpp"

Workflow::Workflow(const std::string &id, const std::string &label, bool enabled)
    : id_(id), label_(label), enabled_(enabled)
{
}

TranscodeResult Workflow::setCriteria(const std::vector<Criteria> &criteria)
{
    for (const auto &c : criteria)
    {
        auto result = CriteriaMatcher::validate(c);
        if (!result.success)
        {
            Logger::warn("Rejecting criteria for workflow " + id_ + ": " + result.error_message);
            return TranscodeResult::failure(TranscodeError::VALIDATION,
                                            c.toString() + ": " + result.error_message);
        }
    }

    criteria_ = criteria;
    for (auto &c : criteria_)
        c.workflow_id = id_;
    return TranscodeResult::ok();
}

bool Workflow::isMediaEligible(const Media &media) const
{
    if (!enabled_)
        return false;
    return CriteriaMatcher::evaluate(media, criteria_);
}

std::string Workflow::toString() const
{
    return "Workflow{ID=" + id_ + " Label=" + label_ + " Enabled=" + (enabled_ ? "true" : "false") +
           " Criteria=" + std::to_string(criteria_.size()) + " Targets=" + std::to_string(targets_.size()) + "}";
}

WorkflowPtr findEligibleWorkflow(const Media &media, const std::vector<WorkflowPtr> &workflows)
{
    for (const auto &workflow : workflows)
    {
        if (workflow && workflow->isMediaEligible(media))
        {
            Logger::debug("Media " + media.id + " is eligible for " + workflow->toString());
            return workflow;
        }
    }
    Logger::debug("Media " + media.id + " matched no workflow");
    return nullptr;
}
