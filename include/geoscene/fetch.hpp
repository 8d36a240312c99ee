#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <functional>
#include <future>
#include <string>

namespace geoscene {

    // Retrieves and parses the JSON body behind a URL.
    using FetchJson = std::function<std::future<boost::json::value>(const std::string &url)>;

    boost::json::value readJsonFile(const std::filesystem::path &file);

    // Default fetcher: a local path or file:// URL. Failures are stored in the returned future.
    std::future<boost::json::value> fetchFile(const std::string &url);

} // namespace geoscene
