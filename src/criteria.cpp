#include "core/criteria.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace
{
    std::string toUpper(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return text;
    }

    bool isPatternValue(const std::string &value)
    {
        return value.size() >= 2 && value.front() == '/' && value.back() == '/';
    }

    const std::vector<CriteriaKey> ALL_KEYS = {
        CriteriaKey::MEDIA_TITLE, CriteriaKey::SERIES_TITLE, CriteriaKey::SEASON_TITLE,
        CriteriaKey::RESOLUTION, CriteriaKey::VIDEO_CODEC, CriteriaKey::AUDIO_CODEC,
        CriteriaKey::CONTAINER, CriteriaKey::DURATION, CriteriaKey::SEASON_NUMBER,
        CriteriaKey::EPISODE_NUMBER, CriteriaKey::SOURCE_PATH, CriteriaKey::SOURCE_NAME,
        CriteriaKey::SOURCE_EXTENSION};

    const std::vector<CriteriaType> ALL_TYPES = {
        CriteriaType::EQUALS, CriteriaType::NOT_EQUALS, CriteriaType::MATCHES,
        CriteriaType::DOES_NOT_MATCH, CriteriaType::LESS_THAN, CriteriaType::GREATER_THAN,
        CriteriaType::IS_PRESENT, CriteriaType::IS_NOT_PRESENT};
}

std::string toString(CriteriaKey key)
{
    switch (key)
    {
    case CriteriaKey::MEDIA_TITLE:
        return "MEDIA_TITLE";
    case CriteriaKey::SERIES_TITLE:
        return "SERIES_TITLE";
    case CriteriaKey::SEASON_TITLE:
        return "SEASON_TITLE";
    case CriteriaKey::RESOLUTION:
        return "RESOLUTION";
    case CriteriaKey::VIDEO_CODEC:
        return "VIDEO_CODEC";
    case CriteriaKey::AUDIO_CODEC:
        return "AUDIO_CODEC";
    case CriteriaKey::CONTAINER:
        return "CONTAINER";
    case CriteriaKey::DURATION:
        return "DURATION";
    case CriteriaKey::SEASON_NUMBER:
        return "SEASON_NUMBER";
    case CriteriaKey::EPISODE_NUMBER:
        return "EPISODE_NUMBER";
    case CriteriaKey::SOURCE_PATH:
        return "SOURCE_PATH";
    case CriteriaKey::SOURCE_NAME:
        return "SOURCE_NAME";
    case CriteriaKey::SOURCE_EXTENSION:
        return "SOURCE_EXTENSION";
    }
    return "UNKNOWN";
}

std::string toString(CriteriaType type)
{
    switch (type)
    {
    case CriteriaType::EQUALS:
        return "EQUALS";
    case CriteriaType::NOT_EQUALS:
        return "NOT_EQUALS";
    case CriteriaType::MATCHES:
        return "MATCHES";
    case CriteriaType::DOES_NOT_MATCH:
        return "DOES_NOT_MATCH";
    case CriteriaType::LESS_THAN:
        return "LESS_THAN";
    case CriteriaType::GREATER_THAN:
        return "GREATER_THAN";
    case CriteriaType::IS_PRESENT:
        return "IS_PRESENT";
    case CriteriaType::IS_NOT_PRESENT:
        return "IS_NOT_PRESENT";
    }
    return "UNKNOWN";
}

std::string toString(CombineType combine_type)
{
    return combine_type == CombineType::AND ? "AND" : "OR";
}

std::optional<CriteriaKey> parseCriteriaKey(const std::string &text)
{
    std::string upper = toUpper(text);
    if (upper == "CODEC")
        return CriteriaKey::VIDEO_CODEC;
    for (auto key : ALL_KEYS)
    {
        if (toString(key) == upper)
            return key;
    }
    return std::nullopt;
}

std::optional<CriteriaType> parseCriteriaType(const std::string &text)
{
    std::string upper = toUpper(text);
    for (auto type : ALL_TYPES)
    {
        if (toString(type) == upper)
            return type;
    }
    return std::nullopt;
}

std::optional<CombineType> parseCombineType(const std::string &text)
{
    std::string upper = toUpper(text);
    if (upper == "AND")
        return CombineType::AND;
    if (upper == "OR")
        return CombineType::OR;
    return std::nullopt;
}

std::string Criteria::toString() const
{
    return "Criteria{ID=" + id + " Key=" + ::toString(key) + " Type=" + ::toString(type) +
           " Value=" + value + " Combine=" + ::toString(combine_type) + "}";
}

bool CriteriaMatcher::evaluate(const Media &media, const std::vector<Criteria> &criteria)
{
    if (criteria.empty())
        return true;

    bool acc = matches(media, criteria.front());
    for (size_t i = 1; i < criteria.size(); ++i)
    {
        const Criteria &c = criteria[i];
        bool result = matches(media, c);
        acc = c.combine_type == CombineType::AND ? (acc && result) : (acc || result);
    }
    return acc;
}

bool CriteriaMatcher::matches(const Media &media, const Criteria &criteria)
{
    if (!isLegal(criteria.key, criteria.type))
    {
        Logger::warn("Illegal criteria " + criteria.toString() + ", treating as not matched");
        return false;
    }

    if (isNumericKey(criteria.key))
        return matchesNumber(media, criteria);
    return matchesText(media, criteria);
}

bool CriteriaMatcher::isNumericKey(CriteriaKey key)
{
    return key == CriteriaKey::DURATION || key == CriteriaKey::SEASON_NUMBER ||
           key == CriteriaKey::EPISODE_NUMBER;
}

bool CriteriaMatcher::isLegal(CriteriaKey key, CriteriaType type)
{
    switch (type)
    {
    case CriteriaType::EQUALS:
    case CriteriaType::NOT_EQUALS:
    case CriteriaType::IS_PRESENT:
    case CriteriaType::IS_NOT_PRESENT:
        return true;
    case CriteriaType::MATCHES:
    case CriteriaType::DOES_NOT_MATCH:
        return !isNumericKey(key);
    case CriteriaType::LESS_THAN:
    case CriteriaType::GREATER_THAN:
        return isNumericKey(key);
    }
    return false;
}

TranscodeResult CriteriaMatcher::validate(const Criteria &criteria)
{
    if (!isLegal(criteria.key, criteria.type))
    {
        return TranscodeResult::failure(TranscodeError::VALIDATION,
                                        "Criteria type " + toString(criteria.type) +
                                            " is not allowed for key " + toString(criteria.key));
    }

    if (criteria.type == CriteriaType::IS_PRESENT || criteria.type == CriteriaType::IS_NOT_PRESENT)
        return TranscodeResult::ok();

    if (isNumericKey(criteria.key) && !parseNumber(criteria.value))
    {
        return TranscodeResult::failure(TranscodeError::VALIDATION,
                                        "Criteria value '" + criteria.value + "' is not a number");
    }

    if (isPatternValue(criteria.value) &&
        (criteria.type == CriteriaType::MATCHES || criteria.type == CriteriaType::DOES_NOT_MATCH))
    {
        bool valid = true;
        matchesPattern("", criteria.value, valid);
        if (!valid)
        {
            return TranscodeResult::failure(TranscodeError::VALIDATION,
                                            "Criteria pattern '" + criteria.value + "' is not a valid regular expression");
        }
    }
    return TranscodeResult::ok();
}

std::optional<std::string> CriteriaMatcher::textAttribute(const Media &media, CriteriaKey key)
{
    std::string value;
    switch (key)
    {
    case CriteriaKey::MEDIA_TITLE:
        value = media.title;
        break;
    case CriteriaKey::SERIES_TITLE:
        value = media.series_title;
        break;
    case CriteriaKey::SEASON_TITLE:
        value = media.season_title;
        break;
    case CriteriaKey::RESOLUTION:
        value = media.resolutionLabel();
        break;
    case CriteriaKey::VIDEO_CODEC:
        value = media.video_codec;
        break;
    case CriteriaKey::AUDIO_CODEC:
        value = media.audio_codec;
        break;
    case CriteriaKey::CONTAINER:
        value = media.container;
        break;
    case CriteriaKey::SOURCE_PATH:
        value = media.source_path;
        break;
    case CriteriaKey::SOURCE_NAME:
        value = std::filesystem::path(media.source_path).filename().string();
        break;
    case CriteriaKey::SOURCE_EXTENSION:
    {
        value = std::filesystem::path(media.source_path).extension().string();
        if (!value.empty() && value.front() == '.')
            value.erase(0, 1);
        break;
    }
    default:
        return std::nullopt;
    }

    if (value.empty())
        return std::nullopt;
    return value;
}

std::optional<double> CriteriaMatcher::numericAttribute(const Media &media, CriteriaKey key)
{
    switch (key)
    {
    case CriteriaKey::DURATION:
        if (media.duration_seconds > 0.0)
            return media.duration_seconds;
        return std::nullopt;
    case CriteriaKey::SEASON_NUMBER:
        if (media.season_number)
            return static_cast<double>(*media.season_number);
        return std::nullopt;
    case CriteriaKey::EPISODE_NUMBER:
        if (media.episode_number)
            return static_cast<double>(*media.episode_number);
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

std::optional<double> CriteriaMatcher::parseNumber(const std::string &text)
{
    try
    {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed])))
            ++consumed;
        if (consumed != text.size())
            return std::nullopt;
        return value;
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
}

bool CriteriaMatcher::matchesPattern(const std::string &attribute, const std::string &value, bool &valid)
{
    valid = true;
    if (!isPatternValue(value))
        return attribute == value;

    try
    {
        std::regex pattern(value.substr(1, value.size() - 2), std::regex::ECMAScript);
        return std::regex_search(attribute, pattern);
    }
    catch (const std::regex_error &e)
    {
        valid = false;
        Logger::warn("Invalid criteria pattern " + value + ": " + std::string(e.what()));
        return false;
    }
}

bool CriteriaMatcher::matchesText(const Media &media, const Criteria &criteria)
{
    auto attribute = textAttribute(media, criteria.key);

    switch (criteria.type)
    {
    case CriteriaType::IS_PRESENT:
        return attribute.has_value();
    case CriteriaType::IS_NOT_PRESENT:
        return !attribute.has_value();
    default:
        break;
    }

    if (!attribute)
    {
        Logger::debug("Media " + media.id + " has no " + toString(criteria.key) + ", criteria not matched");
        return false;
    }

    switch (criteria.type)
    {
    case CriteriaType::EQUALS:
        return *attribute == criteria.value;
    case CriteriaType::NOT_EQUALS:
        return *attribute != criteria.value;
    case CriteriaType::MATCHES:
    case CriteriaType::DOES_NOT_MATCH:
    {
        bool valid = true;
        bool matched = matchesPattern(*attribute, criteria.value, valid);
        if (!valid)
            return false;
        return criteria.type == CriteriaType::MATCHES ? matched : !matched;
    }
    default:
        return false;
    }
}

bool CriteriaMatcher::matchesNumber(const Media &media, const Criteria &criteria)
{
    auto attribute = numericAttribute(media, criteria.key);

    switch (criteria.type)
    {
    case CriteriaType::IS_PRESENT:
        return attribute.has_value();
    case CriteriaType::IS_NOT_PRESENT:
        return !attribute.has_value();
    default:
        break;
    }

    if (!attribute)
    {
        Logger::debug("Media " + media.id + " has no " + toString(criteria.key) + ", criteria not matched");
        return false;
    }

    auto value = parseNumber(criteria.value);
    if (!value)
    {
        Logger::warn("Criteria value '" + criteria.value + "' for " + toString(criteria.key) +
                     " is not a number, treating as not matched");
        return false;
    }

    switch (criteria.type)
    {
    case CriteriaType::EQUALS:
        return *attribute == *value;
    case CriteriaType::NOT_EQUALS:
        return *attribute != *value;
    case CriteriaType::LESS_THAN:
        return *attribute < *value;
    case CriteriaType::GREATER_THAN:
        return *attribute > *value;
    default:
        return false;
    }
}
