#pragma once

#include "ports/output/IRecipeRepository.hpp"
#include <unordered_map>

namespace cookbook::tests::mocks {

/**
 * @brief In-Memory реализация репозитория рецептов для unit-тестов
 */
class InMemoryRecipeRepository : public ports::output::IRecipeRepository {
public:
    bool save(const domain::Recipe& recipe) override {
        return recipes_.emplace(recipe.id(), recipe).second;
    }

    std::optional<domain::Recipe> findById(const domain::Uuid& recipeId) override {
        auto it = recipes_.find(recipeId);
        if (it == recipes_.end()) return std::nullopt;
        return it->second;
    }

    bool exists(const domain::Uuid& recipeId) override {
        return recipes_.count(recipeId) > 0;
    }

    // Test helpers
    void clear() { recipes_.clear(); }
    size_t size() const { return recipes_.size(); }

private:
    std::unordered_map<domain::Uuid, domain::Recipe> recipes_;
};

} // namespace cookbook::tests::mocks
