// BoxArguments - typed access to a box's creation arguments
//
// Positional arguments stop at the first @attribute. A token that does not
// parse is ignored and the caller's default is used, the way Max treats it.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../ObjectLexer.hpp"

class BoxArguments {
public:
    static std::vector<std::string> positional(const ObjectKind &kind);

    /// Integer at a positional index, fallback if absent or not an integer.
    /// Throws ConversionError::invalidParameter(name) when it does not fit an int.
    static int intAt(const ObjectKind &kind, size_t index, const std::string &name, int fallback);

    static float floatAt(const ObjectKind &kind, size_t index, float fallback);
    static std::string wordAt(const ObjectKind &kind, size_t index, const std::string &fallback);

    // Numeric value following "@name"
    static std::optional<float> attribute(const ObjectKind &kind, const std::string &name);

    /// Integer positional arguments as 0-based channels (Max counts from 1).
    /// Throws ConversionError::invalidParameter("channel") below 1 or past the int range.
    static std::vector<int> channelList(const ObjectKind &kind);
};
