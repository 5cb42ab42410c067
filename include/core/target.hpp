#pragma once

#include "core/encoder_options.hpp"
#include <memory>
#include <string>

/**
 * @brief Named encoding profile that media can be transcoded into
 *
 * Targets are immutable once loaded and shared between workflows and tasks.
 */
struct Target
{
    std::string id;
    std::string label;
    std::string extension; // Output file extension without the dot, e.g. "mp4"
    EncoderOptions options;

    std::string toString() const
    {
        return "Target{ID=" + id + " Label=" + label + " Ext=" + extension + "}";
    }
};

using TargetPtr = std::shared_ptr<const Target>;
