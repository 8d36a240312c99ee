#include "geoscene/geoscene.hpp"

namespace geoscene {

    EntityCollection read(const std::filesystem::path &file) {
        auto entities = std::make_shared<EntityCollection>();
        GeoJsonDataSource dataSource(entities);
        dataSource.load(readJsonFile(file), file.string()).get();
        return std::move(*entities);
    }

} // namespace geoscene
