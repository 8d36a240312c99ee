#include "geoscene/error.hpp"

namespace geoscene {

    const char *toString(ErrorCode code) {
        switch (code) {
        case ErrorCode::MissingArgument:
            return "MissingArgument";
        case ErrorCode::UnsupportedDocumentType:
            return "UnsupportedDocumentType";
        case ErrorCode::UnknownGeometryType:
            return "UnknownGeometryType";
        case ErrorCode::MissingGeometry:
            return "MissingGeometry";
        case ErrorCode::MalformedDocument:
            return "MalformedDocument";
        case ErrorCode::InvalidCrs:
            return "InvalidCrs";
        case ErrorCode::UnknownCrsName:
            return "UnknownCrsName";
        case ErrorCode::UnresolvableCrsLink:
            return "UnresolvableCrsLink";
        case ErrorCode::UnknownCrsType:
            return "UnknownCrsType";
        case ErrorCode::FetchFailure:
            return "FetchFailure";
        }
        return "Unknown";
    }

    Error::Error(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

} // namespace geoscene
