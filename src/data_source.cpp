#include "geoscene/data_source.hpp"
#include "geoscene/error.hpp"
#include "geoscene/parser.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

namespace geoscene {

    namespace {
        template <typename T> bool isReady(const std::future<T> &future) {
            return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }

        std::shared_future<void> completed() {
            std::promise<void> done;
            done.set_value();
            return done.get_future().share();
        }

        std::string describeType(const boost::json::value &geoJson) {
            auto const *obj = geoJson.if_object();
            auto const *type = obj ? obj->if_contains("type") : nullptr;
            if (!type)
                return "undefined";
            if (type->is_string())
                return std::string(type->as_string());
            return boost::json::serialize(*type);
        }

        const std::string &describeSource(const std::string &source) {
            static const std::string document = "document";
            return source.empty() ? document : source;
        }
    } // namespace

    struct GeoJsonDataSource::State {
        State(GeoJsonDataSource &owner, std::shared_ptr<EntityStore> store, CrsRegistry &registry)
            : owner(owner), store(std::move(store)), registry(registry) {}

        GeoJsonDataSource &owner;
        std::shared_ptr<EntityStore> store;
        CrsRegistry &registry;

        // Guards everything below and is held through each clear-then-populate.
        std::mutex mutex;
        std::condition_variable idle;
        bool alive = true;
        int emitting = 0;
        std::string source;
    };

    GeoJsonDataSource::GeoJsonDataSource(std::shared_ptr<EntityStore> store, CrsRegistry &registry, FetchJson fetch)
        : fetch_(std::move(fetch)) {
        if (!store)
            throw Error(ErrorCode::MissingArgument, "store is required.");
        if (!fetch_)
            throw Error(ErrorCode::MissingArgument, "fetch is required.");
        state_ = std::make_shared<State>(*this, std::move(store), registry);
    }

    GeoJsonDataSource::~GeoJsonDataSource() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->alive = false;
        state_->idle.wait(lock, [this] { return state_->emitting == 0; });
    }

    EntityStore &GeoJsonDataSource::entities() { return *state_->store; }

    const EntityStore &GeoJsonDataSource::entities() const { return *state_->store; }

    std::string GeoJsonDataSource::source() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->source;
    }

    std::shared_future<void> GeoJsonDataSource::load(const boost::json::value &geoJson, const std::string &source) {
        return loadDocument(state_, geoJson, source, styles_);
    }

    std::shared_future<void> GeoJsonDataSource::loadUrl(const std::string &url) {
        if (url.empty())
            throw Error(ErrorCode::MissingArgument, "url is required.");

        DefaultStyles styles = styles_;
        auto response = fetch_(url);
        if (isReady(response)) {
            boost::json::value body;
            if (!fetched(*state_, response, url, body))
                return completed();
            return loadDocument(state_, body, url, std::move(styles));
        }

        std::promise<void> done;
        auto task = done.get_future().share();
        std::thread([state = state_, url, styles = std::move(styles), response = std::move(response),
                     done = std::move(done)]() mutable {
            try {
                boost::json::value body;
                if (fetched(*state, response, url, body))
                    loadDocument(state, body, url, std::move(styles)).get();
                done.set_value();
            } catch (...) {
                done.set_exception(std::current_exception());
            }
        }).detach();
        return task;
    }

    std::shared_future<void> GeoJsonDataSource::loadDocument(const std::shared_ptr<State> &state,
                                                             const boost::json::value &geoJson,
                                                             const std::string &source, DefaultStyles styles) {
        if (geoJson.is_null())
            throw Error(ErrorCode::MissingArgument, "geoJson is required.");

        auto const *obj = geoJson.if_object();
        if (!obj || !parseGeoJsonType(*obj))
            throw Error(ErrorCode::UnsupportedDocumentType,
                        "Unsupported GeoJSON object type: " + describeType(geoJson));

        auto crs = state->registry.resolve(*obj);
        auto document = std::make_shared<const boost::json::value>(geoJson);

        if (isReady(crs)) {
            populate(*state, document, crs.get(), styles, source);
            return completed();
        }

        spdlog::debug("geoscene: waiting for crs of {}", describeSource(source));
        std::promise<void> done;
        auto task = done.get_future().share();
        std::thread([state, document, source, styles = std::move(styles), crs = std::move(crs),
                     done = std::move(done)]() mutable {
            try {
                populate(*state, document, crs.get(), styles, source);
                done.set_value();
            } catch (...) {
                done.set_exception(std::current_exception());
            }
        }).detach();
        return task;
    }

    void GeoJsonDataSource::populate(State &state, const std::shared_ptr<const boost::json::value> &document,
                                     const CoordinateTransform &transform, const DefaultStyles &styles,
                                     const std::string &source) {
        size_t created = 0;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.alive) {
                spdlog::debug("geoscene: source destroyed, dropping {}", describeSource(source));
                return;
            }

            state.store->clear();
            state.source = source;

            DecodeContext context{*state.store, styles, transform, document};
            processDocument(*document, context);
            created = context.created;
        }

        spdlog::info("geoscene: loaded {} entities from {}", created, describeSource(source));
        notify(state, [](GeoJsonDataSource &owner) { owner.changed_(owner); });
    }

    bool GeoJsonDataSource::fetched(State &state, std::future<boost::json::value> &response, const std::string &url,
                                    boost::json::value &body) {
        try {
            body = response.get();
        } catch (const std::exception &e) {
            spdlog::warn("geoscene: cannot fetch {}: {}", url, e.what());
            auto error = std::current_exception();
            notify(state, [&error](GeoJsonDataSource &owner) { owner.error_(owner, error); });
            return false;
        }

        // The registry is only guaranteed to live as long as the source.
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.alive)
            spdlog::debug("geoscene: source destroyed, dropping {}", url);
        return state.alive;
    }

    void GeoJsonDataSource::notify(State &state, const std::function<void(GeoJsonDataSource &)> &raise) {
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.alive)
                return;
            ++state.emitting;
        }

        struct Done {
            State &state;
            ~Done() {
                std::lock_guard<std::mutex> lock(state.mutex);
                --state.emitting;
                state.idle.notify_all();
            }
        } done{state};

        raise(state.owner);
    }

} // namespace geoscene
