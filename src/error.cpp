#include "geoharvest/error.hpp"

namespace geoharvest {

    const char *toString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::NetworkError:
            return "NetworkError";
        case ErrorKind::ServerError:
            return "ServerError";
        case ErrorKind::MalformedResponse:
            return "MalformedResponse";
        case ErrorKind::GeometryDecodeError:
            return "GeometryDecodeError";
        case ErrorKind::ReprojectionError:
            return "ReprojectionError";
        case ErrorKind::CRSProbeFailure:
            return "CRSProbeFailure";
        case ErrorKind::LayerEmpty:
            return "LayerEmpty";
        case ErrorKind::NoUsableData:
            return "NoUsableData";
        case ErrorKind::ConfigError:
            return "ConfigError";
        case ErrorKind::OutputError:
            return "OutputError";
        }
        return "Unknown";
    }

    bool isTransient(ErrorKind kind) { return kind == ErrorKind::NetworkError || kind == ErrorKind::ServerError; }

    HarvestError::HarvestError(ErrorKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind), retryable_(isTransient(kind)) {}

    HarvestError::HarvestError(ErrorKind kind, const std::string &what, bool retryable)
        : std::runtime_error(what), kind_(kind), retryable_(retryable) {}

} // namespace geoharvest
