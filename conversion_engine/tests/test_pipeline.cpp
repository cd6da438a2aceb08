// End-to-end conversion runs: method dispatch, option gates and error recording

#include <algorithm>
#include <cstdio>
#include <iostream>

#include "TestSupport.hpp"
#include "ConversionErrors.hpp"
#include "ConversionPipeline.hpp"
#include "SpeakerConfigLoader.hpp"

static const char *kTag = "pipeline";

// n speakers, evenly spread from startAz over spanAz, all at ear level
static std::string busText(int bus, const std::string &name, int n, float startAz, float spanAz, float distance) {
    std::string text = "/bus/" + std::to_string(bus) + "/name \"" + name + "\"\n";
    text += "/bus/" + std::to_string(bus) + "/speakers/aed";
    for (int i = 0; i < n; i++) {
        char triple[64];
        std::snprintf(triple, sizeof(triple), " %.3f 0.0 %.2f", startAz + i * spanAz / n, distance);
        text += triple;
    }
    return text + "\n";
}

static SpeakerConfigData ringConfig() {
    return SpeakerConfigLoader::parseSpeakerConfig("# octagon\n" + busText(1, "Ring", 8, 0.0f, 360.0f, 2.0f));
}

static SpeakerConfigData lineConfig() {
    // 16 speakers, 6 degrees apart, in front of the listener
    return SpeakerConfigLoader::parseSpeakerConfig(busText(1, "Front", 16, -45.0f, 96.0f, 3.0f));
}

// oscillator -> spatial object chain -> dac~
static PatchData chainPatch(const std::vector<PatchBox> &spatial) {
    PatchData p;
    p.boxes.push_back(textBox("osc", "cycle~ 440", 2, 1));
    for (const auto &b : spatial) p.boxes.push_back(b);
    p.boxes.push_back(textBox("out", "dac~", 2, 0));

    std::string prev = "osc";
    for (const auto &b : spatial) {
        p.lines.push_back(cable(prev, 0, b.id, 0));
        prev = b.id;
    }
    p.lines.push_back(cable(prev, 0, "out", 0));
    return p;
}

static bool hasClass(const ConversionResult &r, const std::string &className) {
    return std::any_of(r.objects.begin(), r.objects.end(),
                       [&](const SCObject &o) { return o.className() == className; });
}

// Class generated for a box, empty if the box produced nothing
static std::string boxClass(const ConversionResult &r, const std::string &boxId) {
    for (const auto &b : r.boxObjects) {
        if (b.boxId == boxId) return b.object.className();
    }
    return "";
}

static bool anyContains(const std::vector<std::string> &lines, const std::string &needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string &l) { return l.find(needle) != std::string::npos; });
}

static void testHoaWithoutSpeakers() {
    PatchData p = chainPatch({textBox("enc", "spat5.hoa.encoder~ 3", 1, 16),
                              textBox("dec", "spat5.hoa.decoder~ 3", 16, 8)});
    ConversionResult r = ConversionPipeline::run(p, nullptr);

    check(r.graph.nodeCount() == 4 && r.graph.edgeCount() == 3, kTag, "graph shape");
    check(r.chains.size() == 1 && r.chains[0].path.size() == 4, kTag, "one chain through both HOA objects");
    check(r.spatialConfig.processingMethod == SpatialProcessingMethod::Hoa, kTag, "HOA objects select Hoa");
    check(r.objects.size() == 2, kTag, "encoder + binaural decoder expected, got " + std::to_string(r.objects.size()));
    if (r.objects.size() == 2) {
        check(r.objects[0].className() == "HoaEncode", kTag, "order 3 encoder");
        check(r.objects[1].className() == "HoaBinaural", kTag, "no layout falls back to binaural");
    }
    check(anyContains(r.warnings, "binaural"), kTag, "binaural fallback should warn");
    check(r.errors.empty(), kTag, "no errors expected");
    check(r.oscResponders.size() == 3, kTag, "built-in responders only");

    std::string code = ConversionPipeline::render(r);
    check(code.find("HoaEncode.ar(3") != std::string::npos, kTag, "rendered encoder");
    check(code.find("OSCFunc(") != std::string::npos, kTag, "rendered OSC setup");
}

static void testHoaOrderTooHighForLayout() {
    PatchData p = chainPatch({textBox("enc", "spat5.hoa.encoder~ 3", 1, 16),
                              textBox("dec", "spat5.hoa.decoder~ 3", 16, 8)});
    SpeakerConfigData cfg = ringConfig();
    ConversionResult r = ConversionPipeline::run(p, &cfg);

    check(r.spatialConfig.speakerArrays.size() == 1, kTag, "one array from the config");
    check(r.spatialConfig.processingMethod == SpatialProcessingMethod::Hoa, kTag, "HOA outranks VBAP");
    check(r.hoaValidation.size() == 1 && !r.hoaValidation[0].isValid, kTag, "order 3 on 8 speakers is invalid");
    check(r.errors.size() == 1 && anyContains(r.errors, "dec"), kTag, "validation error recorded per object");
    check(hasClass(r, "HoaDecode"), kTag, "decoder still emitted after a failed validation");
}

static void testFoaDecoderType() {
    PatchData p = chainPatch({textBox("enc", "spat5.hoa.encoder~ 1", 1, 4),
                              textBox("dec", "spat5.hoa.decoder~ 1", 4, 8)});
    SpeakerConfigData cfg = ringConfig();

    ConversionResult full = ConversionPipeline::run(p, &cfg);
    ConversionOptions simple;
    simple.simplified = true;
    ConversionResult reduced = ConversionPipeline::run(p, &cfg, simple);

    for (const auto *r : {&full, &reduced}) {
        check(r->objects.size() == 2 && r->objects[1].className() == "FoaDecode", kTag, "FOA decoder");
    }
    if (full.objects.size() == 2 && reduced.objects.size() == 2) {
        const SCValue *t1 = full.objects[1].findProperty("decoder_type");
        const SCValue *t2 = reduced.objects[1].findProperty("decoder_type");
        check(t1 && t1->asString() == "maxRe", kTag, "full decoder uses maxRe");
        check(t2 && t2->asString() == "basic", kTag, "simplified decoder uses basic");
        check(full.objects[1].args()[1].type() == SCValueType::Array, kTag, "FOA decoder carries its matrix");
    }
}

static void testEncoderErrorIsRecorded() {
    PatchData p = chainPatch({textBox("bad", "spat5.hoa.encoder~ 0", 1, 1),
                              textBox("good", "spat5.hoa.encoder~ 2", 1, 9)});
    ConversionResult r = ConversionPipeline::run(p, nullptr);

    check(r.errors.size() == 1, kTag, "order 0 encoder should record one error");
    check(r.objects.size() == 1 && r.objects[0].className() == "HoaEncode", kTag,
          "the run continues after a conversion error");
}

static void testVbapRing() {
    PatchData p = chainPatch({textBox("pan", "spat5.vbap~ 8", 1, 8)});
    SpeakerConfigData cfg = ringConfig();
    ConversionResult r = ConversionPipeline::run(p, &cfg);

    check(r.spatialConfig.processingMethod == SpatialProcessingMethod::Vbap, kTag, "ring selects VBAP");
    check(r.objects.size() == 2, kTag, "setup + panner expected");
    if (r.objects.size() == 2) {
        check(r.objects[0].className() == "VBAPSpeakerSetup", kTag, "speaker setup first");
        check(r.objects[1].className() == "VBAP", kTag, "ring pans in 2D");
        const SCValue *setup = r.objects[1].findProperty("speaker_setup");
        check(setup && setup->asString() == "Ring", kTag, "panner refers to the array name");
    }
    check(r.vbapValidation.size() == 1 && r.vbapValidation[0].isValid, kTag, "ring validates");
    check(r.warnings.empty(), kTag, "matching speaker count should not warn");
    check(boxClass(r, "pan").empty(), kTag, "VBAP method owns the spat5.vbap~ box");

    PatchData mismatch = chainPatch({textBox("pan", "spat5.vbap~ 6", 1, 6)});
    ConversionResult m = ConversionPipeline::run(mismatch, &cfg);
    check(anyContains(m.warnings, "expects 6 speakers"), kTag, "speaker count mismatch should warn");
}

static void testVbapDome() {
    std::string text = busText(1, "Low", 4, 0.0f, 360.0f, 2.0f);
    text += "/bus/1/speaker/5/aed 45.0 60.0 3.0\n";
    SpeakerConfigData cfg = SpeakerConfigLoader::parseSpeakerConfig(text);
    PatchData p = chainPatch({textBox("pan", "spat5.vbap~ 5", 1, 5)});

    ConversionResult full = ConversionPipeline::run(p, &cfg);
    check(full.spatialConfig.speakerArrays.size() == 1
          && full.spatialConfig.speakerArrays[0].speakers.size() == 5, kTag, "five speakers in one array");
    check(hasClass(full, "VBAP3D"), kTag, "elevated layout pans in 3D");

    ConversionOptions simple;
    simple.simplified = true;
    ConversionResult reduced = ConversionPipeline::run(p, &cfg, simple);
    check(hasClass(reduced, "VBAP") && !hasClass(reduced, "VBAP3D"), kTag, "simplified forces 2D panning");
}

static void testWfsLine() {
    PatchData p = chainPatch({textBox("pano", "spat5.panoramix~ @inputs 1 @outputs 16", 1, 16)});
    SpeakerConfigData cfg = lineConfig();
    ConversionResult r = ConversionPipeline::run(p, &cfg);

    check(r.spatialConfig.processingMethod == SpatialProcessingMethod::Wfs, kTag, "frontal line selects WFS");
    check(r.objects.size() == 3, kTag, "array + prefilter + distance compensation expected, got "
                                       + std::to_string(r.objects.size()));
    if (r.objects.size() == 3) {
        check(r.objects[0].className() == "WFSArrayLinear", kTag, "linear array");
        check(r.objects[1].className() == "WFSPrefilter", kTag, "prefilter");
        check(r.objects[2].className() == "WFSDistanceCompensation", kTag, "distance compensation");
        check(near(r.objects[2].args()[2].asFloat(), 3.0f, 1e-4f), kTag, "reference is the mean speaker distance");
    }
    check(r.chains.size() == 1 && r.summary.audioSinks == 1, kTag, "panoramix feeding dac~ is not a sink");

    check(boxClass(r, "pano") == "SpatPanoramix", kTag, "panoramix box converted alongside the WFS array");
    for (const auto &b : r.boxObjects) {
        if (b.boxId != "pano") continue;
        check(b.object.args().size() == 4 && b.object.args()[1].asInt() == 1 && b.object.args()[2].asInt() == 16,
              kTag, "panoramix counts from @inputs / @outputs");
    }
}

static void testOptionGates() {
    PatchData p = chainPatch({textBox("pan", "spat5.vbap~ 8", 1, 8)});
    SpeakerConfigData cfg = ringConfig();

    ConversionOptions noSpatial;
    noSpatial.skipSpatial = true;
    ConversionResult a = ConversionPipeline::run(p, &cfg, noSpatial);
    check(a.objects.empty() && a.spatialConfig.spatialObjects.empty(), kTag, "skip_spatial emits nothing spatial");
    check(a.boxObjects.empty(), kTag, "skip_spatial converts no boxes");
    check(a.chains.size() == 1, kTag, "graph analysis still runs");
    check(a.oscResponders.size() == 3, kTag, "OSC responders still generated");

    ConversionOptions noMulti;
    noMulti.skipMultichannel = true;
    ConversionResult b = ConversionPipeline::run(p, &cfg, noMulti);
    check(b.spatialConfig.speakerArrays.empty(), kTag, "skip_multichannel ignores the speaker config");
    check(b.spatialConfig.processingMethod == SpatialProcessingMethod::Stereo, kTag, "falls back to stereo");
    check(b.objects.empty(), kTag, "stereo emits no layout objects");
    check(boxClass(b, "pan") == "VBAP", kTag, "stereo still converts the spat5.vbap~ box");
    check(boxClass(b, "out") == "Out", kTag, "dac~ becomes Out.ar");

    ConversionOptions noOsc;
    noOsc.generateOsc = false;
    ConversionResult c = ConversionPipeline::run(p, &cfg, noOsc);
    check(c.oscResponders.empty(), kTag, "no OSC responders");
    check(ConversionPipeline::render(c).find("OSCFunc") == std::string::npos, kTag, "no OSC setup rendered");
}

static void testPlaceholderAndOscRoute() {
    PatchData p = chainPatch({textBox("rev", "spat5.reverb~", 1, 2), textBox("eq", "spat5.equalizer~", 1, 4)});
    p.boxes.push_back(textBox("route-1", "spat5.osc.route /src/1/aed /src/2/aed /src/1/aed", 1, 3));
    ConversionResult r = ConversionPipeline::run(p, nullptr);

    check(r.objects.empty(), kTag, "no layout objects without speakers");
    check(boxClass(r, "rev") == "JPverb", kTag, "spat5.reverb~ becomes JPverb");
    check(boxClass(r, "eq") == "SPAT5_Placeholder", kTag, "only the unknown spat5 object gets a placeholder");
    check(boxClass(r, "route-1").empty(), kTag, "spat5.osc.route is left to the OSC responders");
    for (const auto &b : r.boxObjects) {
        if (b.boxId != "eq") continue;
        const SCValue *ch = b.object.findProperty("channels");
        check(ch && ch->asInt() == 4, kTag, "placeholder keeps the channel count");
        check(b.object.args()[0].asString() == "spat5.equalizer~", kTag, "placeholder names the object");
    }
    check(anyContains(r.warnings, "spat5.equalizer~"), kTag, "placeholder should warn");
    check(!anyContains(r.warnings, "spat5.reverb~"), kTag, "converted objects do not warn");

    check(r.oscResponders.size() == 5, kTag, "3 built-in + 2 distinct routed addresses, got "
                                             + std::to_string(r.oscResponders.size()));
    if (r.oscResponders.size() == 5) {
        check(r.oscResponders[3].address == "/src/1/aed", kTag, "routed address order");
        check(r.oscResponders[3].action.find("~handle_route_1") != std::string::npos, kTag,
              "handler named after the sanitized box id");
    }
}

static void testBoxConversions() {
    PatchData p;
    p.boxes = {textBox("in", "adc~ 1 2", 0, 2),
               textBox("pan", "pan~ 0.25", 2, 2),
               textBox("quad", "pan4~", 3, 4),
               textBox("mix", "matrix~ 2 4", 2, 5),
               textBox("pack", "mc.pack~ 4", 4, 1),
               textBox("mcout", "mc.dac~", 4, 0),
               textBox("rot", "spat5.hoa.rotate~ 3", 16, 16),
               textBox("bad", "dac~ 0", 1, 0),
               textBox("gain", "live.gain~", 2, 2),
               widgetBox("knob", "dial")};
    ConversionResult r = ConversionPipeline::run(p, nullptr);

    check(r.spatialConfig.processingMethod == SpatialProcessingMethod::Stereo, kTag, "no layout, no HOA: stereo");
    check(boxClass(r, "in") == "SoundIn", kTag, "adc~ becomes SoundIn");
    check(boxClass(r, "pan") == "Pan2", kTag, "pan~ becomes Pan2");
    check(boxClass(r, "quad") == "Pan4", kTag, "pan4~ becomes Pan4");
    check(boxClass(r, "mix") == "Matrix", kTag, "matrix~ becomes Matrix");
    check(boxClass(r, "pack") == "Array", kTag, "mc.pack~ becomes an array");
    check(boxClass(r, "mcout") == "Out", kTag, "mc.dac~ becomes Out");
    check(boxClass(r, "rot") == "HoaRotate", kTag, "HOA rotation converted per box");
    check(boxClass(r, "gain").empty() && boxClass(r, "knob").empty(), kTag, "other boxes produce nothing");
    check(boxClass(r, "bad").empty() && r.errors.size() == 1 && anyContains(r.errors, "bad"), kTag,
          "channel 0 is recorded as an error for its box");

    std::string code = ConversionPipeline::render(r);
    check(code.find("Pan2.ar(\\input, -0.5, 1)") != std::string::npos, kTag, "pan position mapped to -1..1");
    check(code.find("// mcout") != std::string::npos, kTag, "box lines carry the box id");

    ConversionOptions noMulti;
    noMulti.skipMultichannel = true;
    ConversionResult m = ConversionPipeline::run(p, nullptr, noMulti);
    check(boxClass(m, "pack").empty() && boxClass(m, "mcout").empty(), kTag, "skip_multichannel skips mc.* boxes");
    check(boxClass(m, "pan") == "Pan2", kTag, "other boxes still convert");
}

static void testInvalidRoutingPropagates() {
    PatchData p = chainPatch({});
    p.lines.push_back(cable("osc", 0, "missing", 0));

    bool thrown = false;
    try {
        ConversionPipeline::run(p, nullptr);
    } catch (const AnalysisError &e) {
        thrown = e.kind() == AnalysisError::Kind::InvalidRouting;
    }
    check(thrown, kTag, "unknown cable destination should abort the run");
}

int main() {
    testHoaWithoutSpeakers();
    testHoaOrderTooHighForLayout();
    testFoaDecoderType();
    testEncoderErrorIsRecorded();
    testVbapRing();
    testVbapDome();
    testWfsLine();
    testOptionGates();
    testPlaceholderAndOscRoute();
    testBoxConversions();
    testInvalidRoutingPropagates();
    return testResult(kTag);
}
