// ConversionErrors.hpp - exception types for graph analysis and conversion
//
// AnalysisError aborts the whole patch (there is no partial graph).
// ConversionError is raised by a converter only for an object it knows but
// cannot safely default; the pipeline records it and keeps going.
// Unknown objects are never errors.

#pragma once

#include <stdexcept>
#include <string>

class AnalysisError : public std::runtime_error {
public:
    enum class Kind {
        InvalidRouting,       // cable endpoint malformed or unknown node id
        CircularDependency,   // reserved, not raised yet
        UnsupportedSpatial    // spatial configuration cannot be classified
    };

    AnalysisError(Kind kind, const std::string &detail)
        : std::runtime_error(kindName(kind) + ": " + detail), mKind(kind) {}

    Kind kind() const { return mKind; }

    static std::string kindName(Kind kind) {
        switch (kind) {
            case Kind::InvalidRouting:     return "Invalid routing configuration";
            case Kind::CircularDependency: return "Circular dependency detected";
            case Kind::UnsupportedSpatial: return "Unsupported spatial configuration";
        }
        return "Analysis error";
    }

private:
    Kind mKind;
};

class ConversionError : public std::runtime_error {
public:
    enum class Kind {
        UnsupportedObject,
        InvalidParameter,
        MissingAttribute
    };

    static ConversionError unsupportedObject(const std::string &name) {
        return ConversionError(Kind::UnsupportedObject,
                               "Unsupported object type: " + name, name, 0.0f);
    }

    static ConversionError invalidParameter(const std::string &name, float value) {
        return ConversionError(Kind::InvalidParameter,
                               "Invalid parameter range: " + name + " = " + std::to_string(value),
                               name, value);
    }

    static ConversionError missingAttribute(const std::string &name) {
        return ConversionError(Kind::MissingAttribute,
                               "Missing required attribute: " + name, name, 0.0f);
    }

    Kind kind() const { return mKind; }
    const std::string &name() const { return mName; }
    float value() const { return mValue; }

private:
    ConversionError(Kind kind, const std::string &what, const std::string &name, float value)
        : std::runtime_error(what), mKind(kind), mName(name), mValue(value) {}

    Kind mKind;
    std::string mName;
    float mValue;
};
