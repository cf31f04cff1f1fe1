#pragma once

#include <stdexcept>
#include <string>

namespace geoharvest {

    enum class ErrorKind {
        NetworkError,
        ServerError,
        MalformedResponse,
        GeometryDecodeError,
        ReprojectionError,
        CRSProbeFailure,
        LayerEmpty,
        NoUsableData,
        ConfigError,
        OutputError,
    };

    const char *toString(ErrorKind kind);

    // Retryable at chunk level: the same request may succeed on a later attempt
    bool isTransient(ErrorKind kind);

    class HarvestError : public std::runtime_error {
      private:
        ErrorKind kind_;
        bool retryable_;

      public:
        HarvestError(ErrorKind kind, const std::string &what);
        HarvestError(ErrorKind kind, const std::string &what, bool retryable);

        ErrorKind kind() const { return kind_; }
        bool retryable() const { return retryable_; }
    };

} // namespace geoharvest
