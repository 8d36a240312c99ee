#pragma once

#include "crs.hpp"
#include "data_source.hpp"
#include "entity.hpp"
#include "error.hpp"
#include "fetch.hpp"
#include "parser.hpp"
#include "style.hpp"
#include "types.hpp"

namespace geoscene {

    // Loads a GeoJSON file with the global CRS registry and the default styles.
    EntityCollection read(const std::filesystem::path &file);

} // namespace geoscene
