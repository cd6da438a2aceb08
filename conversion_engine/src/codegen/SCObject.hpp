// SCObject - parameter-object tree handed to the code emitter
//
//   SCObject("VBAP").withMethod("ar").arg(8).arg(SCValue::symbol("input")).prop("gain", 0.5f)
//   -> VBAP.ar(8, \input).gain(0.5)
//
// Converters only build these trees; toCode() is the single place that
// turns them into target-engine text.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class SCObject;

enum class SCValueType {
    Float,
    Int,
    String,
    Symbol,
    Array,
    Object
};

class SCValue {
public:
    SCValue(float v) : mType(SCValueType::Float), mFloat(v) {}
    SCValue(double v) : mType(SCValueType::Float), mFloat(float(v)) {}
    SCValue(int v) : mType(SCValueType::Int), mInt(v) {}
    SCValue(unsigned v) : mType(SCValueType::Int), mInt(int(v)) {}
    SCValue(bool v) : mType(SCValueType::Int), mInt(v ? 1 : 0) {}
    SCValue(const char *s) : mType(SCValueType::String), mString(s) {}
    SCValue(const std::string &s) : mType(SCValueType::String), mString(s) {}
    SCValue(std::vector<SCValue> items) : mType(SCValueType::Array), mItems(std::move(items)) {}
    SCValue(const SCObject &obj);

    // \name in the target language
    static SCValue symbol(const std::string &name);

    SCValueType type() const { return mType; }
    float asFloat() const { return mType == SCValueType::Int ? float(mInt) : mFloat; }
    int asInt() const { return mInt; }
    const std::string &asString() const { return mString; }
    const std::vector<SCValue> &items() const { return mItems; }
    const SCObject *object() const { return mObject.get(); }

    std::string toCode() const;

private:
    SCValueType mType;
    float mFloat = 0.0f;
    int mInt = 0;
    std::string mString;
    std::vector<SCValue> mItems;
    std::shared_ptr<const SCObject> mObject;
};

class SCObject {
public:
    explicit SCObject(const std::string &className) : mClassName(className) {}

    SCObject &withMethod(const std::string &method) { mMethod = method; return *this; }
    SCObject &arg(const SCValue &value) { mArgs.push_back(value); return *this; }
    SCObject &prop(const std::string &name, const SCValue &value) {
        mProperties.emplace_back(name, value);
        return *this;
    }

    const std::string &className() const { return mClassName; }
    const std::optional<std::string> &method() const { return mMethod; }
    const std::vector<SCValue> &args() const { return mArgs; }
    const std::vector<std::pair<std::string, SCValue>> &properties() const { return mProperties; }

    // First property with this name, nullptr if absent
    const SCValue *findProperty(const std::string &name) const;

    // Class.method(arg, ...).prop(value)...
    std::string toCode() const;

private:
    std::string mClassName;
    std::optional<std::string> mMethod;
    std::vector<SCValue> mArgs;
    std::vector<std::pair<std::string, SCValue>> mProperties;
};
