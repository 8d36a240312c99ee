#pragma once

#include "geoscene/crs.hpp"
#include "geoscene/entity.hpp"
#include "geoscene/fetch.hpp"
#include "geoscene/style.hpp"

#include <boost/json.hpp>
#include <boost/signals2/signal.hpp>

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace geoscene {

    /**
     * Loads GeoJSON into an entity store.
     *
     * GeoJSON carries no styling, so every entity receives a copy of one of the default templates
     * (point, line or polygon). Edits to the templates affect later loads only.
     *
     * Each load replaces the whole content of the store. The store is cleared only once the CRS
     * transform is available, so a load failing during CRS resolution leaves the previous content.
     * Overlapping loads are not ordered against each other, but each clear-then-populate runs alone:
     * the store always holds exactly one document.
     *
     * Destroying the source abandons its pending loads; a worker that resumes afterwards drops its
     * result. The source must not be destroyed from one of its own signal handlers.
     */
    class GeoJsonDataSource {
      public:
        using ChangedSignal = boost::signals2::signal<void(const GeoJsonDataSource &)>;
        using ErrorSignal = boost::signals2::signal<void(const GeoJsonDataSource &, std::exception_ptr)>;

        explicit GeoJsonDataSource(std::shared_ptr<EntityStore> store = std::make_shared<EntityCollection>(),
                                   CrsRegistry &registry = CrsRegistry::global(), FetchJson fetch = fetchFile);
        ~GeoJsonDataSource();

        GeoJsonDataSource(const GeoJsonDataSource &) = delete;
        GeoJsonDataSource &operator=(const GeoJsonDataSource &) = delete;

        // Raised after each successful load.
        ChangedSignal &changedEvent() { return changed_; }

        // Raised when loadUrl cannot fetch its document.
        ErrorSignal &errorEvent() { return error_; }

        EntityStore &entities();
        const EntityStore &entities() const;

        // GeoJSON is a static format.
        bool isTimeVarying() const { return false; }

        Style &defaultPoint() { return styles_.point; }
        Style &defaultLine() { return styles_.line; }
        Style &defaultPolygon() { return styles_.polygon; }

        std::string source() const;

        /**
         * Replaces the store content with the entities of geoJson.
         *
         * Missing or unsupported documents and malformed or unknown CRSs throw Error before the store
         * is touched. When the CRS resolves immediately the whole load happens before returning;
         * otherwise it completes on a worker and its failures are reported through the future.
         *
         * @param source The URI the document came from, if any.
         */
        std::shared_future<void> load(const boost::json::value &geoJson, const std::string &source = "");

        // Fetches url and loads the result. Fetch failures go to errorEvent() instead of the future.
        std::shared_future<void> loadUrl(const std::string &url);

      private:
        // Everything a load needs after it has left the calling thread. Workers own a reference to it,
        // never to the source itself.
        struct State;

        static std::shared_future<void> loadDocument(const std::shared_ptr<State> &state,
                                                     const boost::json::value &geoJson, const std::string &source,
                                                     DefaultStyles styles);
        static void populate(State &state, const std::shared_ptr<const boost::json::value> &document,
                             const CoordinateTransform &transform, const DefaultStyles &styles,
                             const std::string &source);
        static bool fetched(State &state, std::future<boost::json::value> &response, const std::string &url,
                            boost::json::value &body);
        // Runs raise on the owning source unless it has been destroyed.
        static void notify(State &state, const std::function<void(GeoJsonDataSource &)> &raise);

        std::shared_ptr<State> state_;
        FetchJson fetch_;
        DefaultStyles styles_;

        ChangedSignal changed_;
        ErrorSignal error_;
    };

} // namespace geoscene
