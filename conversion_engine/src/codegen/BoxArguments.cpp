#include "BoxArguments.hpp"
#include "../ConversionErrors.hpp"
#include <limits>
#include <stdexcept>

// Whole-token integer; nullopt for anything else, throws std::out_of_range on overflow
static std::optional<long long> parseInteger(const std::string &token) {
    try {
        size_t used = 0;
        long long v = std::stoll(token, &used);
        if (used != token.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    }
}

static float overflowValue(const std::string &token) {
    return token[0] == '-' ? std::numeric_limits<float>::lowest() : std::numeric_limits<float>::max();
}

static bool fitsInt(long long v) {
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

std::vector<std::string> BoxArguments::positional(const ObjectKind &kind) {
    std::vector<std::string> out;
    for (const auto &tok : kind.args) {
        if (tok[0] == '@') break;
        out.push_back(tok);
    }
    return out;
}

int BoxArguments::intAt(const ObjectKind &kind, size_t index, const std::string &name, int fallback) {
    std::vector<std::string> args = positional(kind);
    if (index >= args.size()) return fallback;

    const std::string &tok = args[index];
    std::optional<long long> v;
    try {
        v = parseInteger(tok);
    } catch (const std::out_of_range &) {
        throw ConversionError::invalidParameter(name, overflowValue(tok));
    }
    if (!v) return fallback;
    if (!fitsInt(*v)) throw ConversionError::invalidParameter(name, float(*v));
    return int(*v);
}

float BoxArguments::floatAt(const ObjectKind &kind, size_t index, float fallback) {
    std::vector<std::string> args = positional(kind);
    if (index >= args.size()) return fallback;
    try {
        size_t used = 0;
        float v = std::stof(args[index], &used);
        return used == args[index].size() ? v : fallback;
    } catch (const std::logic_error &) {
        return fallback;
    }
}

std::string BoxArguments::wordAt(const ObjectKind &kind, size_t index, const std::string &fallback) {
    std::vector<std::string> args = positional(kind);
    return index < args.size() ? args[index] : fallback;
}

std::optional<float> BoxArguments::attribute(const ObjectKind &kind, const std::string &name) {
    std::string key = "@" + name;
    for (size_t i = 0; i + 1 < kind.args.size(); i++) {
        if (kind.args[i] != key) continue;
        try {
            size_t used = 0;
            float v = std::stof(kind.args[i + 1], &used);
            if (used != kind.args[i + 1].size()) return std::nullopt;
            return v;
        } catch (const std::logic_error &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::vector<int> BoxArguments::channelList(const ObjectKind &kind) {
    std::vector<int> channels;
    for (const auto &tok : positional(kind)) {
        std::optional<long long> v;
        try {
            v = parseInteger(tok);
        } catch (const std::out_of_range &) {
            throw ConversionError::invalidParameter("channel", overflowValue(tok));
        }
        if (!v) continue;
        if (*v < 1 || !fitsInt(*v)) throw ConversionError::invalidParameter("channel", float(*v));
        channels.push_back(int(*v) - 1);
    }
    return channels;
}
