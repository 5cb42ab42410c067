#pragma once

#include "core/media.hpp"
#include "core/transcode_result.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Media attribute a criterion inspects
 */
enum class CriteriaKey
{
    MEDIA_TITLE,
    SERIES_TITLE,
    SEASON_TITLE,
    RESOLUTION,
    VIDEO_CODEC,
    AUDIO_CODEC,
    CONTAINER,
    DURATION,
    SEASON_NUMBER,
    EPISODE_NUMBER,
    SOURCE_PATH,
    SOURCE_NAME,
    SOURCE_EXTENSION
};

/**
 * @brief Comparison a criterion applies to its attribute
 */
enum class CriteriaType
{
    EQUALS,
    NOT_EQUALS,
    MATCHES,
    DOES_NOT_MATCH,
    LESS_THAN,
    GREATER_THAN,
    IS_PRESENT,
    IS_NOT_PRESENT
};

/**
 * @brief How a criterion folds into the result of the criteria before it
 */
enum class CombineType
{
    AND,
    OR
};

/**
 * @brief One rule of a workflow's criteria list
 */
struct Criteria
{
    std::string id;
    std::string workflow_id;
    CriteriaKey key = CriteriaKey::MEDIA_TITLE;
    CriteriaType type = CriteriaType::EQUALS;
    std::string value;
    CombineType combine_type = CombineType::AND;

    std::string toString() const;
};

std::string toString(CriteriaKey key);
std::string toString(CriteriaType type);
std::string toString(CombineType combine_type);

// Case-insensitive parsing of the upper snake case names; "CODEC" is accepted for VIDEO_CODEC
std::optional<CriteriaKey> parseCriteriaKey(const std::string &text);
std::optional<CriteriaType> parseCriteriaType(const std::string &text);
std::optional<CombineType> parseCombineType(const std::string &text);

/**
 * @brief Evaluates media against ordered criteria lists
 *
 * Every predicate fails closed: an absent attribute, an unparseable numeric
 * value, an invalid pattern or an illegal key/type pair yields false and is
 * logged, it never throws.
 */
class CriteriaMatcher
{
public:
    /**
     * @brief Fold the criteria left to right
     *
     * The first criterion seeds the accumulator, each following one is
     * combined with its own combine type. There is no other precedence.
     *
     * @param media Media under test
     * @param criteria Ordered criteria; an empty list is eligible
     * @return true when the media satisfies the list
     */
    static bool evaluate(const Media &media, const std::vector<Criteria> &criteria);

    /**
     * @brief Evaluate a single criterion
     */
    static bool matches(const Media &media, const Criteria &criteria);

    static bool isNumericKey(CriteriaKey key);

    /**
     * @brief Whether the key accepts the comparison type
     *
     * Textual keys take EQUALS, NOT_EQUALS, MATCHES, DOES_NOT_MATCH and the
     * presence checks. Numeric keys take EQUALS, NOT_EQUALS, LESS_THAN,
     * GREATER_THAN and the presence checks.
     */
    static bool isLegal(CriteriaKey key, CriteriaType type);

    /**
     * @brief Check legality and, for numeric keys and patterns, that the value parses
     * @return VALIDATION failure describing the first problem found
     */
    static TranscodeResult validate(const Criteria &criteria);

private:
    static std::optional<std::string> textAttribute(const Media &media, CriteriaKey key);
    static std::optional<double> numericAttribute(const Media &media, CriteriaKey key);
    static std::optional<double> parseNumber(const std::string &text);
    static bool matchesPattern(const std::string &attribute, const std::string &value, bool &valid);
    static bool matchesText(const Media &media, const Criteria &criteria);
    static bool matchesNumber(const Media &media, const Criteria &criteria);
};
