#include "SCObject.hpp"
#include <sstream>

SCValue::SCValue(const SCObject &obj)
    : mType(SCValueType::Object), mObject(std::make_shared<const SCObject>(obj)) {}

SCValue SCValue::symbol(const std::string &name) {
    SCValue v(name);
    v.mType = SCValueType::Symbol;
    return v;
}

// Escape quotes and backslashes inside a string literal
static std::string quote(const std::string &s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string SCValue::toCode() const {
    switch (mType) {
        case SCValueType::Float: {
            std::ostringstream ss;
            ss << mFloat;
            return ss.str();
        }
        case SCValueType::Int:
            return std::to_string(mInt);
        case SCValueType::String:
            return quote(mString);
        case SCValueType::Symbol:
            return "\\" + mString;
        case SCValueType::Array: {
            std::string code = "[";
            for (size_t i = 0; i < mItems.size(); i++) {
                if (i > 0) code += ", ";
                code += mItems[i].toCode();
            }
            return code + "]";
        }
        case SCValueType::Object:
            return mObject ? mObject->toCode() : "nil";
    }
    return "nil";
}

const SCValue *SCObject::findProperty(const std::string &name) const {
    for (const auto &[key, value] : mProperties) {
        if (key == name) return &value;
    }
    return nullptr;
}

std::string SCObject::toCode() const {
    std::string code = mClassName;

    if (mMethod) {
        code += "." + *mMethod;
    }

    if (!mArgs.empty()) {
        code += "(";
        for (size_t i = 0; i < mArgs.size(); i++) {
            if (i > 0) code += ", ";
            code += mArgs[i].toCode();
        }
        code += ")";
    }

    for (const auto &[name, value] : mProperties) {
        code += "." + name + "(" + value.toCode() + ")";
    }
    return code;
}
