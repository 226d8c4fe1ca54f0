#pragma once

#include <stdexcept>
#include <string>

namespace aerobuild {

enum class LoadErrorKind {
    MissingRequiredField,
    TypeMismatch,
    InvalidGeometry,
    InvalidMassProperties,
    SourceUnavailable,
    MalformedSource
};

const char* toString(LoadErrorKind kind);

/**
 * @brief Fatal problem while building an AircraftParams record.
 *
 * Loading is all-or-nothing: no partially populated record is ever returned.
 */
class ParameterLoadError : public std::runtime_error {
public:
    ParameterLoadError(LoadErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message)
        , m_kind(kind)
    {
    }

    LoadErrorKind kind() const { return m_kind; }

private:
    LoadErrorKind m_kind;
};

} // namespace aerobuild
