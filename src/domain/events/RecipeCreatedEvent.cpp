#include "domain/events/RecipeCreatedEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cookbook::domain {

namespace {

std::string formatIsoUtc(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = *std::gmtime(&seconds);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::chrono::system_clock::time_point parseIsoUtc(const std::string& isoString) {
    std::tm tm = {};
    std::istringstream ss(isoString);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + isoString);
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

/// Целое неотрицательное значение не больше maxValue
std::uint64_t readUnsigned(const nlohmann::json& j, const char* key, std::uint64_t maxValue) {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() || v.get<std::uint64_t>() > maxValue) {
        throw std::invalid_argument(std::string("Invalid ") + key + ": " + v.dump());
    }
    return v.get<std::uint64_t>();
}

} // namespace

RecipeCreatedEvent::RecipeCreatedEvent(const Recipe& recipe)
    : eventId(utils::UuidGenerator::generate().toString())
    , recipeId(recipe.id().toString())
    , name(recipe.name())
    , difficulty(recipe.difficulty())
    , duration(recipe.duration())
    , ingredientCount(recipe.ingredients().size())
    , tagCount(recipe.tags().size())
    , hasImage(recipe.hasImage())
{
    tags.reserve(recipe.tags().size());
    for (const auto& t : recipe.tags()) {
        tags.push_back(t.value());
    }
    std::sort(tags.begin(), tags.end());
}

RecipeCreatedEvent::RecipeCreatedEvent(const std::string& json) {
    if (json.empty() || json == "{}") return;

    auto j = nlohmann::json::parse(json);

    eventId = j.value("eventId", "");
    if (j.contains("timestamp")) {
        timestamp = parseIsoUtc(j["timestamp"].get<std::string>());
    }

    recipeId = j.value("recipeId", "");
    name = j.value("name", "");
    hasImage = j.value("hasImage", false);

    if (j.contains("duration")) {
        duration = static_cast<std::uint16_t>(
            readUnsigned(j, "duration", std::numeric_limits<std::uint16_t>::max()));
    }
    if (j.contains("ingredientCount")) {
        ingredientCount = readUnsigned(j, "ingredientCount", std::numeric_limits<std::size_t>::max());
    }
    if (j.contains("difficulty")) {
        difficulty = parseDifficulty(j["difficulty"].get<std::string>());
    }
    if (j.contains("tags")) {
        tags = j["tags"].get<std::vector<std::string>>();
    }

    tagCount = j.contains("tagCount")
        ? readUnsigned(j, "tagCount", std::numeric_limits<std::size_t>::max())
        : tags.size();
}

std::string RecipeCreatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = formatIsoUtc(timestamp);
    j["recipeId"] = recipeId;
    j["name"] = name;
    j["difficulty"] = toString(difficulty);
    j["duration"] = duration;
    j["ingredientCount"] = ingredientCount;
    j["tagCount"] = tagCount;
    j["tags"] = tags;
    j["hasImage"] = hasImage;
    return j.dump();
}

} // namespace cookbook::domain
