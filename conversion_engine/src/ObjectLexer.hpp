// ObjectLexer - turns a box's maxclass + text into an ObjectKind once
//
// Every downstream component (connection classifier, path analyzer,
// spatial object analyzer, OSC generation) switches over ObjectCategory
// instead of re-parsing "cycle~ 440" style strings. Anything not in the
// tables below lands in Generic and keeps its original text.

#pragma once

#include <optional>
#include <string>
#include <vector>

enum class ObjectCategory {
    ControlWidget,    // flonum, slider, dial ... (classified by maxclass)
    Oscillator,       // cycle~, saw~, phasor~ ...
    Noise,            // noise~, pink~
    AudioInput,       // adc~ family
    AudioOutput,      // dac~ family
    Panoramix,        // spat5.panoramix~
    HoaEncoder,       // spat5.hoa.encoder~
    HoaDecoder,       // spat5.hoa.decoder~
    Vbap,             // spat5.vbap~
    SpatRenderer,     // spat5.spat~
    SpatOscRoute,     // spat5.osc.route
    SpatGeneric,      // any other spat5*
    StereoPanner,     // pan~, pan2~, pan4~, pan8~
    RampGenerator,    // line, line~, curve, curve~
    SignalProcessor,  // any other object whose name ends in '~'
    Message,          // any other text object (control rate)
    Generic           // no text and not a known widget
};

struct ObjectKind {
    ObjectCategory category = ObjectCategory::Generic;
    std::string name;                 // first token of the text (or the maxclass)
    std::vector<std::string> args;    // remaining whitespace separated tokens
    std::string text;                 // original text, empty if none
};

class ObjectLexer {
public:
    static ObjectKind lex(const std::string &maxclass, const std::optional<std::string> &text);

    static std::vector<std::string> tokenize(const std::string &text);

    static std::string categoryName(ObjectCategory category);
};

// Text carries a signal-rate object: contains '~' or is a spat5 object
bool isAudioBearing(const ObjectKind &kind);

// spat5 family, regardless of which member
bool isSpatFamily(const ObjectKind &kind);

// Generator / input objects (candidate audio sources)
bool isSourceCategory(ObjectCategory category);

// Output objects (candidate audio sinks)
bool isSinkCategory(ObjectCategory category);
