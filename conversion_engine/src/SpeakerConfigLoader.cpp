#include "SpeakerConfigLoader.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

// In-place trim whitespace from both ends.
void SpeakerConfigLoader::trim(std::string &s) {
    const char *ws = " \t\r\n";
    s.erase(0, s.find_first_not_of(ws));
    s.erase(s.find_last_not_of(ws) + 1);
}

OSCValue SpeakerConfigLoader::parseToken(const std::string &token) {
    OSCValue v;

    // ints: no '.', no exponent, whole token consumed
    bool looksInt = token.find_first_of(".eE") == std::string::npos;
    try {
        size_t used = 0;
        if (looksInt) {
            int i = std::stoi(token, &used);
            if (used == token.size()) {
                v.type = OSCValueType::Int;
                v.intValue = i;
                return v;
            }
        } else {
            float f = std::stof(token, &used);
            if (used == token.size()) {
                v.type = OSCValueType::Float;
                v.floatValue = f;
                return v;
            }
        }
    } catch (const std::logic_error &) {
        // invalid_argument / out_of_range: fall through to a bare string
    }

    v.type = OSCValueType::String;
    v.stringValue = token;
    return v;
}

bool SpeakerConfigLoader::parseLine(const std::string &line, OSCCommand &cmd) {
    size_t pos = 0;
    const size_t n = line.size();

    auto skipSpace = [&]() {
        while (pos < n && (line[pos] == ' ' || line[pos] == '\t')) pos++;
    };

    skipSpace();
    size_t start = pos;
    while (pos < n && line[pos] != ' ' && line[pos] != '\t') pos++;
    cmd.address = line.substr(start, pos - start);
    if (cmd.address.empty() || cmd.address[0] != '/') return false;

    cmd.args.clear();
    while (true) {
        skipSpace();
        if (pos >= n) break;

        if (line[pos] == '"') {
            size_t close = line.find('"', pos + 1);
            if (close == std::string::npos) return false;
            OSCValue v;
            v.type = OSCValueType::String;
            v.stringValue = line.substr(pos + 1, close - pos - 1);
            cmd.args.push_back(v);
            pos = close + 1;
        } else {
            start = pos;
            while (pos < n && line[pos] != ' ' && line[pos] != '\t') pos++;
            cmd.args.push_back(parseToken(line.substr(start, pos - start)));
        }
    }
    return true;
}

// Split "/bus/1/speaker/3/gain" into ["bus", "1", "speaker", "3", "gain"]
static std::vector<std::string> splitAddress(const std::string &address) {
    std::vector<std::string> parts;
    std::istringstream ss(address);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

static bool toInt(const std::string &s, int &out) {
    try {
        size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::logic_error &) {
        return false;
    }
}

static SpeakerRecord &speakerById(std::vector<SpeakerRecord> &speakers, int id) {
    for (auto &spk : speakers) {
        if (spk.id == id) return spk;
    }
    SpeakerRecord spk;
    spk.id = id;
    speakers.push_back(spk);
    return speakers.back();
}

SpeakerConfigData SpeakerConfigLoader::parseSpeakerConfig(const std::string &text) {
    SpeakerConfigData d;

    std::map<int, size_t> busIndex;   // bus id -> index in d.speakerArrays
    int linesDropped = 0;
    int badValues = 0;

    auto arrayForBus = [&](int busId) -> SpeakerArrayRecord & {
        auto it = busIndex.find(busId);
        if (it != busIndex.end()) return d.speakerArrays[it->second];
        SpeakerArrayRecord rec;
        rec.busId = busId;
        d.speakerArrays.push_back(rec);
        busIndex[busId] = d.speakerArrays.size() - 1;
        return d.speakerArrays.back();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        OSCCommand cmd;
        if (!parseLine(line, cmd)) {
            ++linesDropped;
            continue;
        }
        d.commands.push_back(cmd);

        std::vector<std::string> parts = splitAddress(cmd.address);
        int busId = 0;
        if (parts.size() < 3 || parts[0] != "bus" || !toInt(parts[1], busId)) {
            continue;   // not a bus message, kept as a plain command
        }

        SpeakerArrayRecord &arr = arrayForBus(busId);

        // /bus/N/format, /bus/N/name
        if (parts.size() == 3 && (parts[2] == "format" || parts[2] == "name")) {
            if (cmd.args.empty() || cmd.args[0].type != OSCValueType::String) {
                ++badValues;
                continue;
            }
            if (parts[2] == "format") arr.format = cmd.args[0].stringValue;
            else arr.name = cmd.args[0].stringValue;
            continue;
        }

        // /bus/N/speakers/aed a e d a e d ...
        if (parts.size() == 4 && parts[2] == "speakers" && parts[3] == "aed") {
            size_t triples = cmd.args.size() / 3;
            if (cmd.args.size() % 3 != 0) {
                std::cerr << "[SpeakerConfig] Warning: bus " << busId
                          << " aed list has " << cmd.args.size()
                          << " values (not a multiple of 3), trailing values dropped\n";
            }
            for (size_t t = 0; t < triples; t++) {
                const OSCValue &a = cmd.args[t * 3];
                const OSCValue &e = cmd.args[t * 3 + 1];
                const OSCValue &r = cmd.args[t * 3 + 2];
                if (!a.isNumber() || !e.isNumber() || !r.isNumber()) {
                    ++badValues;
                    continue;
                }
                SpeakerRecord &spk = speakerById(arr.speakers, static_cast<int>(t) + 1);
                spk.position.azimuth = a.asFloat();
                spk.position.elevation = e.asFloat();
                spk.position.distance = r.asFloat();
            }
            continue;
        }

        // /bus/N/speaker/K/{aed,delay,gain}
        int spkId = 0;
        if (parts.size() == 5 && parts[2] == "speaker" && toInt(parts[3], spkId)) {
            const std::string &field = parts[4];
            if (field == "aed") {
                if (cmd.args.size() < 3 || !cmd.args[0].isNumber() || !cmd.args[1].isNumber()
                    || !cmd.args[2].isNumber()) {
                    ++badValues;
                    continue;
                }
                SpeakerRecord &spk = speakerById(arr.speakers, spkId);
                spk.position.azimuth = cmd.args[0].asFloat();
                spk.position.elevation = cmd.args[1].asFloat();
                spk.position.distance = cmd.args[2].asFloat();
            } else if (field == "delay" || field == "gain") {
                if (cmd.args.empty() || !cmd.args[0].isNumber()) {
                    ++badValues;
                    continue;
                }
                SpeakerRecord &spk = speakerById(arr.speakers, spkId);
                if (field == "delay") spk.delay = cmd.args[0].asFloat();
                else spk.gain = cmd.args[0].asFloat();
            }
        }
    }

    for (auto &arr : d.speakerArrays) {
        std::sort(arr.speakers.begin(), arr.speakers.end(),
                  [](const SpeakerRecord &a, const SpeakerRecord &b) { return a.id < b.id; });
    }

    if (linesDropped > 0) {
        std::cerr << "[SpeakerConfig] " << linesDropped
                  << " malformed line(s) dropped.\n";
    }
    if (badValues > 0) {
        std::cerr << "[SpeakerConfig] " << badValues
                  << " bus message(s) with wrong argument types ignored.\n";
    }

    std::cout << "[SpeakerConfig] Parsed " << d.commands.size() << " commands, "
              << d.speakerArrays.size() << " speaker array(s)\n";
    return d;
}

SpeakerConfigData SpeakerConfigLoader::loadSpeakerConfig(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open speaker config: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseSpeakerConfig(buffer.str());
}
