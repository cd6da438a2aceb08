// SpeakerConfigLoader - reads the line-oriented speaker geometry text format
//
// FORMAT (one OSC-style message per line):
//   # comment
//   /master/name "Master"
//   /bus/1/format "WFS"
//   /bus/1/name "WFS Bus 1"
//   /bus/1/speakers/aed -39.35 0.0 1.29  -35.37 0.0 1.23 ...
//   /bus/1/speaker/1/aed -39.35 0.0 1.29
//   /bus/1/speaker/1/delay 0.0186
//   /bus/1/speaker/1/gain -3.5
//
// - Every line is kept as an OSCCommand.
// - /bus/N/... lines also build a SpeakerArrayRecord for bus N.
// - speakers/aed triples are assigned to speaker ids 1..k in order.
// - Speaker ids are 1-based; records come out sorted by id.
// - Arrays are returned in order of first appearance of their bus id.

#pragma once

#include <string>
#include <vector>

#include "ConversionTypes.hpp"

enum class OSCValueType {
    Int,
    Float,
    String
};

struct OSCValue {
    OSCValueType type = OSCValueType::Int;
    int         intValue   = 0;
    float       floatValue = 0.0f;
    std::string stringValue;

    // numeric value regardless of Int/Float
    float asFloat() const { return type == OSCValueType::Int ? float(intValue) : floatValue; }
    bool isNumber() const { return type != OSCValueType::String; }
};

struct OSCCommand {
    std::string address;
    std::vector<OSCValue> args;
};

struct SpeakerRecord {
    int id = 0;
    SphericalCoord position;
    float delay = 0.0f;   // seconds
    float gain  = 0.0f;   // dB
};

struct SpeakerArrayRecord {
    int busId = 0;
    std::string format;   // declared label, e.g. "WFS", "HOA", "VBAP"
    std::string name;
    std::vector<SpeakerRecord> speakers;
};

struct SpeakerConfigData {
    std::vector<OSCCommand> commands;
    std::vector<SpeakerArrayRecord> speakerArrays;
};

class SpeakerConfigLoader {
public:
    /// Load a speaker configuration text file.
    /// Throws std::runtime_error if the file can't be opened.
    static SpeakerConfigData loadSpeakerConfig(const std::string &path);

    /// Parse speaker configuration text already in memory.
    /// Malformed lines are dropped (counted and logged once).
    static SpeakerConfigData parseSpeakerConfig(const std::string &text);

private:
    // Split one line into address + typed args. Returns false if the line
    // has no '/' address or an unterminated quoted string.
    static bool parseLine(const std::string &line, OSCCommand &cmd);

    static OSCValue parseToken(const std::string &token);

    static void trim(std::string &s);
};
