#include "geoscene/entity.hpp"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace geoscene {

    Entity::Entity(std::string id) : id_(std::move(id)) {}

    std::optional<std::string> Entity::property(const std::string &key) const {
        if (!geoJson_ || !geoJson_->is_object())
            return std::nullopt;

        auto const *props = geoJson_->as_object().if_contains("properties");
        if (!props || !props->is_object())
            return std::nullopt;

        auto const *value = props->as_object().if_contains(key);
        if (!value)
            return std::nullopt;
        if (value->is_string())
            return std::string(value->as_string());
        return boost::json::serialize(*value);
    }

    void EntityCollection::clear() {
        index_.clear();
        entities_.clear();
    }

    Entity &EntityCollection::getOrCreate(const std::string &id) {
        auto it = index_.find(id);
        if (it != index_.end())
            return *it->second;

        entities_.push_back(std::make_unique<Entity>(id));
        Entity &entity = *entities_.back();
        index_.emplace(id, &entity);
        return entity;
    }

    bool EntityCollection::exists(const std::string &id) const { return index_.find(id) != index_.end(); }

    size_t EntityCollection::size() const { return entities_.size(); }

    bool EntityCollection::empty() const { return entities_.empty(); }

    const Entity *EntityCollection::get(const std::string &id) const {
        auto it = index_.find(id);
        return it != index_.end() ? it->second : nullptr;
    }

    Entity *EntityCollection::get(const std::string &id) {
        auto it = index_.find(id);
        return it != index_.end() ? it->second : nullptr;
    }

    const Entity &EntityCollection::at(size_t index) const {
        if (index >= entities_.size())
            throw std::out_of_range("Entity index out of range");
        return *entities_[index];
    }

    Entity &EntityCollection::at(size_t index) {
        if (index >= entities_.size())
            throw std::out_of_range("Entity index out of range");
        return *entities_[index];
    }

    std::vector<const Entity *> EntityCollection::getPoints() const {
        std::vector<const Entity *> result;
        for (const auto &entity : entities_) {
            if (entity->style().point) {
                result.push_back(entity.get());
            }
        }
        return result;
    }

    std::vector<const Entity *> EntityCollection::getPolylines() const {
        std::vector<const Entity *> result;
        for (const auto &entity : entities_) {
            if (entity->style().polyline && !entity->style().polygon) {
                result.push_back(entity.get());
            }
        }
        return result;
    }

    std::vector<const Entity *> EntityCollection::getPolygons() const {
        std::vector<const Entity *> result;
        for (const auto &entity : entities_) {
            if (entity->style().polygon) {
                result.push_back(entity.get());
            }
        }
        return result;
    }

    std::vector<const Entity *> EntityCollection::filterByProperty(const std::string &key,
                                                                   const std::string &value) const {
        std::vector<const Entity *> result;
        for (const auto &entity : entities_) {
            auto prop = entity->property(key);
            if (prop && *prop == value) {
                result.push_back(entity.get());
            }
        }
        return result;
    }

    std::ostream &operator<<(std::ostream &os, EntityCollection const &entities) {
        os << "ENTITIES: " << entities.size() << "\n";

        for (auto const &e : entities) {
            os << "  " << e->id();
            if (e->style().polygon) {
                os << " POLYGON";
            } else if (e->style().polyline) {
                os << " LINE";
            } else if (e->style().point) {
                os << " POINT";
            } else {
                os << " EMPTY";
            }
            if (e->vertexPositions())
                os << " (" << e->vertexPositions()->size() << " vertices)";
            os << "\n";
        }

        return os;
    }

} // namespace geoscene
