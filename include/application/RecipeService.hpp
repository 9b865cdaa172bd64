#pragma once

#include "ports/input/IRecipeService.hpp"
#include "ports/output/IRecipeRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/ServiceSettings.hpp"
#include "domain/RecipeBuilder.hpp"
#include "domain/events/RecipeCreatedEvent.hpp"
#include "domain/exceptions/DuplicateRecipeException.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <memory>

namespace cookbook::application {

/**
 * @brief Сервис создания рецептов
 * 
 * Переносит поля запроса в RecipeBuilder, сохраняет готовый рецепт
 * и публикует recipe.created. Ошибка сборки (нет обязательного поля)
 * возвращается вызывающему как есть, повторных попыток нет.
 */
class RecipeService : public ports::input::IRecipeService {
public:
    RecipeService(
        std::shared_ptr<ports::output::IRecipeRepository> recipeRepo,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::ServiceSettings> settings
    ) : recipeRepo_(std::move(recipeRepo))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[RecipeService] Created (" << settings_->getServiceName() << ")" << std::endl;
    }

    domain::RecipeBuildResult createRecipe(const ports::input::CreateRecipeRequest& request) override {
        domain::RecipeBuilder builder;

        builder.withId(request.id ? *request.id : utils::UuidGenerator::generate());
        if (request.name) builder.withName(*request.name);
        if (request.difficulty) builder.withDifficulty(*request.difficulty);
        if (request.duration) builder.withDuration(*request.duration);
        if (request.description) builder.withDescription(*request.description);
        if (request.directions) builder.withDirections(*request.directions);
        if (request.img) builder.withImage(*request.img);

        for (const auto& ingredient : request.ingredients) {
            builder.addIngredient(ingredient);
        }
        for (const auto& tag : request.tags) {
            builder.addTag(tag);
        }

        auto result = std::move(builder).tryBuild();
        if (!result.isSuccess()) {
            std::cout << "[RecipeService] Rejected recipe: " << result.message << std::endl;
            return result;
        }

        const auto& recipe = *result.recipe;
        if (!recipeRepo_->save(recipe)) {
            std::cerr << "[RecipeService] Duplicate recipe id: " << recipe.id().toString() << std::endl;
            throw domain::DuplicateRecipeException(recipe.id());
        }

        std::cout << "[RecipeService] Recipe created: " << recipe.id().toString()
                  << " name=" << recipe.name()
                  << " difficulty=" << domain::toString(recipe.difficulty()) << std::endl;

        if (settings_->isEventsEnabled()) {
            domain::RecipeCreatedEvent event(recipe);
            eventPublisher_->publish(settings_->getEventRoutingKey(), event.toJson());
        }

        return result;
    }

    std::optional<domain::Recipe> getRecipe(const domain::Uuid& recipeId) override {
        return recipeRepo_->findById(recipeId);
    }

private:
    std::shared_ptr<ports::output::IRecipeRepository> recipeRepo_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::ServiceSettings> settings_;
};

} // namespace cookbook::application
