#pragma once

#include "geoscene/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace geoscene {

    class Entity {
      public:
        explicit Entity(std::string id);

        const std::string &id() const { return id_; }

        // The GeoJSON fragment this entity was created from, or nullptr.
        const boost::json::value *geoJson() const { return geoJson_.get(); }
        void setGeoJson(std::shared_ptr<const boost::json::value> fragment) { geoJson_ = std::move(fragment); }

        const Style &style() const { return style_; }
        Style &style() { return style_; }
        void merge(const Style &source) { style_.merge(source); }

        const std::optional<dp::Point> &position() const { return position_; }
        void setPosition(const dp::Point &position) { position_ = position; }

        const std::optional<std::vector<dp::Point>> &vertexPositions() const { return vertexPositions_; }
        void setVertexPositions(std::vector<dp::Point> positions) { vertexPositions_ = std::move(positions); }

        // String form of a member of the originating feature's "properties", if there is one.
        std::optional<std::string> property(const std::string &key) const;

      private:
        std::string id_;
        std::shared_ptr<const boost::json::value> geoJson_;
        Style style_;
        std::optional<dp::Point> position_;
        std::optional<std::vector<dp::Point>> vertexPositions_;
    };

    // Receives the entities produced by a load.
    class EntityStore {
      public:
        virtual ~EntityStore() = default;

        virtual void clear() = 0;

        // Returns the entity with this id, creating it if needed.
        virtual Entity &getOrCreate(const std::string &id) = 0;

        virtual bool exists(const std::string &id) const = 0;
    };

    // In-memory store that keeps entities in order of first creation.
    class EntityCollection : public EntityStore {
      private:
        std::vector<std::unique_ptr<Entity>> entities_;
        std::unordered_map<std::string, Entity *> index_;

      public:
        EntityCollection() = default;
        EntityCollection(EntityCollection &&) = default;
        EntityCollection &operator=(EntityCollection &&) = default;

        void clear() override;
        Entity &getOrCreate(const std::string &id) override;
        bool exists(const std::string &id) const override;

        size_t size() const;
        bool empty() const;

        const Entity *get(const std::string &id) const;
        Entity *get(const std::string &id);

        const Entity &at(size_t index) const;
        Entity &at(size_t index);

        std::vector<const Entity *> getPoints() const;

        std::vector<const Entity *> getPolylines() const;

        std::vector<const Entity *> getPolygons() const;

        std::vector<const Entity *> filterByProperty(const std::string &key, const std::string &value) const;

        auto begin() { return entities_.begin(); }
        auto end() { return entities_.end(); }
        auto begin() const { return entities_.begin(); }
        auto end() const { return entities_.end(); }
        auto cbegin() const { return entities_.cbegin(); }
        auto cend() const { return entities_.cend(); }
    };

    std::ostream &operator<<(std::ostream &os, EntityCollection const &entities);

} // namespace geoscene
