#include "geoscene/fetch.hpp"
#include "geoscene/error.hpp"

#include <fstream>
#include <sstream>

namespace geoscene {

    boost::json::value readJsonFile(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw Error(ErrorCode::FetchFailure, "geoscene::readJsonFile(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();

        boost::json::error_code ec;
        boost::json::value j = boost::json::parse(buffer.str(), ec);
        if (ec) {
            throw Error(ErrorCode::FetchFailure,
                        "geoscene::readJsonFile(): failed to parse \"" + file.string() + "\": " + ec.message());
        }
        return j;
    }

    std::future<boost::json::value> fetchFile(const std::string &url) {
        static const std::string scheme = "file://";

        std::promise<boost::json::value> promise;
        try {
            auto path = url.compare(0, scheme.size(), scheme) == 0 ? url.substr(scheme.size()) : url;
            promise.set_value(readJsonFile(path));
        } catch (const Error &) {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    }

} // namespace geoscene
