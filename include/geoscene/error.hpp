#pragma once

#include <stdexcept>
#include <string>

namespace geoscene {

    enum class ErrorCode {
        MissingArgument,
        UnsupportedDocumentType,
        UnknownGeometryType,
        MissingGeometry,
        MalformedDocument,
        InvalidCrs,
        UnknownCrsName,
        UnresolvableCrsLink,
        UnknownCrsType,
        FetchFailure
    };

    const char *toString(ErrorCode code);

    // Thrown for every input or configuration problem the loader detects.
    class Error : public std::runtime_error {
      public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

      private:
        ErrorCode code_;
    };

} // namespace geoscene
