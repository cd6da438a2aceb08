// WFS / VBAP / HOA parameter generation, gain math and validation

#include <iostream>
#include <numeric>
#include <utility>

#include "TestSupport.hpp"
#include "ConversionErrors.hpp"
#include "codegen/SCObject.hpp"
#include "codegen/WFSConverter.hpp"
#include "codegen/VBAPConverter.hpp"
#include "codegen/HOAConverter.hpp"
#include "spatial/SpeakerArrayClassifier.hpp"

static const char *kTag = "converters";

static SpeakerArray makeArray(const std::string &id, std::vector<Speaker> speakers) {
    SpeakerArray a;
    a.id = id;
    a.speakers = std::move(speakers);
    a.type = SpeakerArrayClassifier::classifyArrayType(a.speakers);
    if (a.type.kind == SpeakerArrayKind::Wfs) a.wfsConfig = SpeakerArrayClassifier::deriveWfsConfig(a.type);
    return a;
}

static SpeakerArray ring8() {
    std::vector<Speaker> s;
    for (int i = 0; i < 8; i++) s.push_back({i + 1, {i * 45.0f, 0.0f, 2.5f}, 0.001f * i, -2.0f});
    return makeArray("ring", s);
}

static SpeakerArray line16() {
    std::vector<Speaker> s;
    for (int i = 0; i < 16; i++) s.push_back({i + 1, {-45.0f + i * 6.0f, 0.0f, 3.0f}, 0.0005f * i, 0.0f});
    return makeArray("line", s);
}

static SpeakerArray irregular4() {
    return makeArray("odd", {{1, {0.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
                             {2, {90.0f, 30.0f, 2.0f}, 0.0f, 0.0f},
                             {3, {200.0f, -10.0f, 4.0f}, 0.0f, 0.0f},
                             {4, {300.0f, 60.0f, 6.0f}, 0.0f, 0.0f}});
}

// Six speakers on the axes
static std::vector<Speaker> octahedron() {
    return {{1, {0.0f, 0.0f, 1.0f}, 0.0f, 0.0f},  {2, {90.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
            {3, {180.0f, 0.0f, 1.0f}, 0.0f, 0.0f}, {4, {270.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
            {5, {0.0f, 90.0f, 1.0f}, 0.0f, 0.0f},  {6, {0.0f, -90.0f, 1.0f}, 0.0f, 0.0f}};
}

template <typename Fn>
static bool throwsConversion(Fn fn, ConversionError::Kind kind) {
    try {
        fn();
    } catch (const ConversionError &e) {
        return e.kind() == kind;
    }
    return false;
}

static void testParameterObjects() {
    SCObject obj = SCObject("Pan2")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(0.5f)
        .arg(std::vector<SCValue>{1, 2.5f, "x"})
        .prop("gain", true)
        .prop("inner", SCObject("Line").withMethod("kr").arg(0).arg(1));

    check(obj.toCode() == "Pan2.ar(\\input, 0.5, [1, 2.5, \"x\"]).gain(1).inner(Line.kr(0, 1))", kTag,
          "toCode rendering: " + obj.toCode());
    check(SCObject("Out").toCode() == "Out", kTag, "bare class renders as its name");
    check(obj.findProperty("gain") && obj.findProperty("gain")->asInt() == 1, kTag, "findProperty");
    check(!obj.findProperty("missing"), kTag, "findProperty of absent name");
    check(SCValue(std::string("a\"b")).toCode() == "\"a\\\"b\"", kTag, "string escaping");
}

static void testWfs() {
    SCObject linear = WFSConverter::generateWfsArray(line16());
    check(linear.className() == "WFSArrayLinear" && linear.method() == std::string("ar"), kTag, "linear class/method");
    check(linear.args().size() == 8, kTag, "linear args: input, az, dist, n, length, spacing, delays, gains");
    if (linear.args().size() == 8) {
        check(linear.args()[3].asInt() == 16, kTag, "linear speaker count");
        check(linear.args()[6].items().size() == 16, kTag, "one delay per speaker");
        check(near(linear.args()[6].items()[2].asFloat(), 0.001f, 1e-7f), kTag, "delays carried unchanged");
    }
    check(linear.findProperty("aliasing_frequency") != nullptr, kTag, "linear array reports aliasing frequency");

    SCObject circular = WFSConverter::generateWfsArray(ring8());
    check(circular.className() == "WFSArrayCircular" && circular.args().size() == 7, kTag, "circular array");
    if (circular.args().size() == 7) {
        check(near(circular.args()[4].asFloat(), 2.5f, 1e-5f), kTag, "circular radius");
        check(circular.args()[6].items()[0].asFloat() == -2.0f, kTag, "gains carried unchanged");
    }

    SCObject irregular = WFSConverter::generateWfsArray(irregular4());
    check(irregular.className() == "WFSArrayIrregular" && irregular.args().size() == 9, kTag, "irregular array");

    SpeakerArray empty;
    check(throwsConversion([&] { WFSConverter::generateWfsArray(empty); }, ConversionError::Kind::MissingAttribute),
          kTag, "empty array should be MissingAttribute");

    // geometry mode: virtual source on speaker 1 of the ring
    WfsGenerationOptions geo;
    geo.useGeometry = true;
    geo.sourceAzimuth = 0.0f;
    geo.sourceDistance = 2.5f;
    geo.referenceDistance = 2.5f;
    SCObject recomputed = WFSConverter::generateWfsArray(ring8(), geo);
    if (recomputed.args().size() == 7) {
        const auto &delays = recomputed.args()[5].items();
        const auto &gains = recomputed.args()[6].items();
        check(near(delays[0].asFloat(), 0.0f, 1e-6f), kTag, "speaker at the source has zero delay");
        check(near(delays[4].asFloat(), 5.0f / speedOfSound(20.0f), 1e-5f), kTag, "opposite speaker delay");
        check(near(gains[0].asFloat(), 1.0f, 1e-6f), kTag, "amplitude at reference distance");
    }

    SphericalCoord spk{0.0f, 0.0f, 3.0f};
    check(WFSConverter::calculateWfsAmplitude(spk, 0.0f, 3.0f) == 1.0f, kTag, "plane wave amplitude is exactly 1");
    check(WFSConverter::calculateWfsAmplitude(spk, -2.0f, 3.0f) == 1.0f, kTag, "negative distance is a plane wave");
    check(near(WFSConverter::calculateWfsAmplitude(spk, 12.0f, 3.0f), 0.5f, 1e-6f), kTag,
          "sqrt(3/12) * sqrt(3/3)");
    check(near(WFSConverter::calculateWfsAmplitude({0.0f, 0.0f, 0.0f}, 4.0f, 1.0f), 0.5f, 1e-6f), kTag,
          "zero speaker distance uses speaker factor 1");

    float d = WFSConverter::calculateSpeakerDelay({90.0f, 0.0f, 3.0f}, 0.0f, 4.0f, 343.0f);
    check(near(d, 5.0f / 343.0f, 1e-6f), kTag, "3-4-5 triangle delay");
    d = WFSConverter::calculateSpeakerDelay({0.0f, 45.0f, 3.0f}, 0.0f, 3.0f, 343.0f);
    check(near(d, 0.0f, 1e-6f), kTag, "delay ignores elevation");

    check(WFSConverter::generatePrefilter(1000.0f).toCode()
          == "WFSPrefilter.ar(\\input, 1000).comment(\"WFS prefilter for spatial aliasing reduction\")", kTag,
          "prefilter rendering");
    check(WFSConverter::generateFocusedSource(30.0f, 2.0f, 1.0f).args().size() == 4, kTag, "focused source args");
    check(WFSConverter::generatePlaneWave(45.0f).className() == "WFSPlaneWave", kTag, "plane wave class");
    check(WFSConverter::generateDistanceCompensation(2.0f).className() == "WFSDistanceCompensation", kTag,
          "distance compensation class");
}

static void testVbapSetupAndValidation() {
    SpeakerArray ring = ring8();
    std::swap(ring.speakers[0], ring.speakers[5]);   // setup must sort angles itself
    SCObject setup = VBAPConverter::generateSpeakerSetup(ring);
    check(setup.className() == "VBAPSpeakerSetup" && setup.method() == std::string("new"), kTag, "ring setup class");
    const SCValue *dim = setup.findProperty("dimension");
    check(dim && dim->asString() == "2D", kTag, "ring setup is 2D");
    if (setup.args().size() == 4) {
        const auto &angles = setup.args()[3].items();
        check(angles.size() == 8 && angles[0].asFloat() == 0.0f && angles[7].asFloat() == 315.0f, kTag,
              "ring angles sorted");
    }

    SCObject lin = VBAPConverter::generateSpeakerSetup(line16());
    check(lin.args().size() == 3 && lin.args()[1].asString() == "linear", kTag, "linear setup");
    check(lin.args()[2].items()[0].items().size() == 3, kTag, "linear setup positions are [az, el, dist]");

    SCObject irr = VBAPConverter::generateSpeakerSetup(irregular4());
    const SCValue *tri = irr.findProperty("triangulation");
    check(tri && tri->asString() == "auto", kTag, "irregular setup triangulation");
    if (irr.args().size() == 3) {
        const auto &p0 = irr.args()[2].items()[0].items();
        check(near(p0[0].asFloat(), 1.0f, 1e-6f) && near(p0[1].asFloat(), 0.0f, 1e-6f), kTag,
              "irregular setup uses cartesian positions");
    }

    check(near(VBAPConverter::calculateOptimalSpread(ring8()), 45.0f, 1.0f), kTag, "8-ring spread ~45 deg");

    VbapValidationResult ok = VBAPConverter::validateSpeakerSetup(ring8());
    check(ok.isValid && ok.warnings.empty() && ok.errors.empty(), kTag, "8-ring validates cleanly");
    check(near(ok.optimalSpread, 45.0f, 1.0f), kTag, "validation reports spread");

    SpeakerArray two = makeArray("two", {{1, {0.0f, 0.0f, 1.0f}, 0.0f, 0.0f}, {2, {90.0f, 0.0f, 1.0f}, 0.0f, 0.0f}});
    VbapValidationResult bad = VBAPConverter::validateSpeakerSetup(two);
    check(!bad.isValid && bad.errors.size() == 1, kTag, "fewer than 3 speakers is invalid");

    SpeakerArray close = makeArray("close", {{1, {359.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
                                             {2, {1.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
                                             {3, {120.0f, 0.0f, 1.0f}, 0.0f, 0.0f},
                                             {4, {240.0f, 0.0f, 1.0f}, 0.0f, 0.0f}});
    VbapValidationResult wrapped = VBAPConverter::validateSpeakerSetup(close);
    check(wrapped.isValid && wrapped.warnings.size() == 1, kTag, "359 and 1 deg should warn as 2 deg apart");

    check(VBAPConverter::generatePanner(8, "ring", false).className() == "VBAP", kTag, "2D panner");
    check(VBAPConverter::generatePanner(8, "dome", true).className() == "VBAP3D", kTag, "3D panner");
    SCObject dist = VBAPConverter::generateDistancePanner(8, DistanceCompensation::InverseSquare);
    check(dist.args().size() == 7 && dist.args()[6].asFloat() == 2.0f, kTag, "inverse-square factor 2");
    SCObject spread = VBAPConverter::generateSpreadPanner(8, SpreadType::Gaussian);
    check(spread.args().back().asString() == "gaussian", kTag, "spread method");

    check(throwsConversion([] { VBAPConverter::generateSpeakerSetup(SpeakerArray{}); },
                           ConversionError::Kind::MissingAttribute), kTag, "empty VBAP setup");
}

static void testVbapGains() {
    std::vector<Speaker> oct = octahedron();

    // direction equidistant from front, left and top
    const float el = 35.26439f;
    auto triangle = VBAPConverter::findOptimalTriangle(45.0f, el, oct);
    check(triangle.has_value(), kTag, "triangle should be found");
    if (triangle) {
        check((*triangle)[0] == 0 && (*triangle)[1] == 1 && (*triangle)[2] == 4, kTag, "front/left/top triangle");
        auto g = VBAPConverter::calculateVbapGains(45.0f, el, *triangle, oct);
        for (float v : g) check(near(v, 0.57735f, 1e-3f), kTag, "equal gains expected");
    }

    auto onAxis = VBAPConverter::computePanningGains(90.0f, 0.0f, oct);
    check(onAxis.size() == 6 && near(onAxis[1], 1.0f, 1e-3f), kTag, "source on a speaker gets full gain");
    float power = std::inner_product(onAxis.begin(), onAxis.end(), onAxis.begin(), 0.0f);
    check(near(power, 1.0f, 1e-3f), kTag, "gains are power normalized");

    check(!VBAPConverter::findOptimalTriangle(0.0f, 0.0f, {oct[0], oct[1]}), kTag, "two speakers have no triangle");

    check(throwsConversion([&] { VBAPConverter::calculateVbapGains(0.0f, 0.0f, {0, 1, 9}, oct); },
                           ConversionError::Kind::InvalidParameter), kTag, "out-of-range speaker index");
    check(throwsConversion([&] { VBAPConverter::calculateVbapGains(0.0f, 0.0f, {0, 2, 4}, oct); },
                           ConversionError::Kind::InvalidParameter), kTag, "degenerate triangle");

    // horizontal ring: pairwise panning
    SpeakerArray ring = ring8();
    check(VBAPConverter::isHorizontalLayout(ring.speakers), kTag, "ring is horizontal");
    auto half = VBAPConverter::computePanningGains(22.5f, 0.0f, ring.speakers);
    check(half.size() == 8 && half[0] > 0.0f && near(half[0], half[1], 1e-3f), kTag,
          "halfway between two speakers");
    check(near(half[4], 0.0f, 1e-6f) && near(half[2], 0.0f, 1e-6f), kTag, "speakers outside the pair silent");
    auto wrap = VBAPConverter::computePanningGains(350.0f, 0.0f, ring.speakers);
    check(wrap[0] > wrap[7] && wrap[7] > 0.0f, kTag, "pair across the 315/0 wrap");

    // a source on a speaker stays on it even when a wider triplet of its
    // neighbours also encloses the direction
    std::vector<Speaker> dome = {{1, {0.0f, 0.0f, 2.0f}, 0.0f, 0.0f},
                                 {2, {30.0f, 20.0f, 2.0f}, 0.0f, 0.0f},
                                 {3, {-30.0f, 20.0f, 2.0f}, 0.0f, 0.0f},
                                 {4, {30.0f, -20.0f, 2.0f}, 0.0f, 0.0f},
                                 {5, {-30.0f, -20.0f, 2.0f}, 0.0f, 0.0f},
                                 {6, {90.0f, 0.0f, 2.0f}, 0.0f, 0.0f},
                                 {7, {180.0f, 0.0f, 2.0f}, 0.0f, 0.0f},
                                 {8, {-90.0f, 0.0f, 2.0f}, 0.0f, 0.0f}};
    check(!VBAPConverter::isHorizontalLayout(dome), kTag, "dome is 3D");
    auto front = VBAPConverter::computePanningGains(0.0f, 0.0f, dome);
    check(front.size() == 8 && near(front[0], 1.0f, 1e-3f), kTag, "front speaker takes the source");
    for (size_t i = 1; i < front.size(); i++) {
        check(near(front[i], 0.0f, 1e-3f), kTag, "other dome speakers silent");
    }
    auto domeTri = VBAPConverter::findOptimalTriangle(0.0f, 0.0f, dome);
    check(domeTri.has_value() && (*domeTri)[0] == 0, kTag, "mesh triangle contains the front speaker");

    check(near(VBAPConverter::computePanningGains(123.0f, 45.0f, {oct[0]})[0], 1.0f, 1e-6f), kTag,
          "single speaker takes everything");

    check(throwsConversion([] { VBAPConverter::computePanningGains(0.0f, 0.0f, {}); },
                           ConversionError::Kind::MissingAttribute), kTag, "no speakers to pan to");
}

static void testHoa() {
    SCObject foa2 = HOAConverter::generateEncoder(1, 2);
    check(foa2.className() == "FoaEncode" && foa2.findProperty("channels")->asInt() == 3, kTag, "FOA 2D has 3 channels");
    SCObject foa3 = HOAConverter::generateEncoder(1, 3);
    check(foa3.className() == "FoaEncode" && foa3.findProperty("channels")->asInt() == 4, kTag, "FOA 3D has 4 channels");
    SCObject hoa3 = HOAConverter::generateEncoder(3, 3);
    check(hoa3.className() == "HoaEncode" && hoa3.findProperty("channels")->asInt() == 16, kTag,
          "order 3 has 16 channels");

    check(throwsConversion([] { HOAConverter::generateEncoder(2, 2); }, ConversionError::Kind::UnsupportedObject),
          kTag, "2D order 2 is unsupported");
    check(throwsConversion([] { HOAConverter::generateEncoder(0, 3); }, ConversionError::Kind::InvalidParameter),
          kTag, "order 0 is invalid");
    check(throwsConversion([] { HOAConverter::generateEncoder(1, 4); }, ConversionError::Kind::InvalidParameter),
          kTag, "dimension 4 is invalid");
    check(throwsConversion([] { HOAConverter::generateEncoder(70000, 3); }, ConversionError::Kind::InvalidParameter),
          kTag, "order 70000 is invalid");
    check(throwsConversion([] { HOAConverter::generateRotation(8); }, ConversionError::Kind::InvalidParameter),
          kTag, "rotation order 8 is invalid");

    SpeakerArray ring = ring8();
    HoaDecoderMatrix m = HOAConverter::computeFoaDecoderMatrix(ring);
    check(m.order == 1 && m.rows.size() == 8 && m.rows[0].size() == 4, kTag, "FOA matrix shape");
    if (m.rows.size() == 8) {
        check(near(m.rows[0][0], 0.125f, 1e-6f) && near(m.rows[0][3], 0.125f, 1e-6f)
              && near(m.rows[0][1], 0.0f, 1e-6f), kTag, "front speaker row W/Y/Z/X");
        check(near(m.rows[2][1], 0.125f, 1e-6f), kTag, "left speaker picks up Y");
    }

    SCObject foaDec = HOAConverter::generateDecoder(1, ring, HoaDecoderType::MaxRe, m);
    check(foaDec.className() == "FoaDecode", kTag, "order 1 decoder is FoaDecode");
    check(foaDec.args().size() == 2 && foaDec.args()[1].type() == SCValueType::Array
          && foaDec.args()[1].items().size() == 8, kTag, "explicit matrix emitted as argument");
    check(foaDec.findProperty("decoder_type")->asString() == "maxRe", kTag, "decoder type");

    SCObject symbolic = HOAConverter::generateDecoder(1, ring, HoaDecoderType::Basic);
    check(symbolic.args()[1].type() == SCValueType::Symbol, kTag, "no matrix leaves a symbol");

    SCObject hoaDec = HOAConverter::generateDecoder(3, ring, HoaDecoderType::InPhase);
    check(hoaDec.className() == "HoaDecode" && hoaDec.findProperty("channels")->asInt() == 16, kTag, "order 3 decoder");

    check(throwsConversion([&] { HOAConverter::generateDecoder(2, ring, HoaDecoderType::Basic, m); },
                           ConversionError::Kind::InvalidParameter), kTag, "matrix order mismatch");
    check(throwsConversion([] { HOAConverter::generateDecoder(1, SpeakerArray{}, HoaDecoderType::Basic); },
                           ConversionError::Kind::MissingAttribute), kTag, "decoder needs speakers");

    // sound field transforms
    SCObject foaMirror = HOAConverter::generateMirror(1, HoaMirrorAxis::YZ);
    check(foaMirror.className() == "FoaMirror" && foaMirror.args()[1].asString() == "yz", kTag, "FOA mirror axis");
    SCObject hoaMirror = HOAConverter::generateMirror(3, HoaMirrorAxis::X);
    check(hoaMirror.className() == "HoaMirror" && hoaMirror.args()[0].asInt() == 3, kTag, "HOA mirror carries order");
    SCObject zoom = HOAConverter::generateFocus(2, HoaFocusType::Zoom);
    check(zoom.className() == "HoaFocus" && zoom.args().size() == 5
          && zoom.findProperty("focus_type")->asString() == "zoom", kTag, "HOA focus");
    check(HOAConverter::generateFocus(1, HoaFocusType::Press).args().size() == 4, kTag, "FOA focus has no order arg");
    check(HOAConverter::generateNearFieldCompensation(1).className() == "FoaNFC", kTag, "FOA NFC");
    check(HOAConverter::generateNearFieldCompensation(4).className() == "HoaNFC", kTag, "HOA NFC");
    check(HOAConverter::generateOrderConverter(2, 2).className() == "Through", kTag, "same order passes through");
    SCObject up = HOAConverter::generateOrderConverter(1, 3);
    check(up.className() == "HoaConvert" && up.findProperty("channels")->asInt() == 16, kTag, "order 1 to 3");
    check(throwsConversion([] { HOAConverter::generateOrderConverter(1, 9); }, ConversionError::Kind::InvalidParameter),
          kTag, "target order 9 is invalid");

    check(HOAConverter::generateRotation(1).className() == "FoaRotate", kTag, "FOA rotation");
    check(HOAConverter::generateRotation(4).className() == "HoaRotate", kTag, "HOA rotation");
    check(HOAConverter::generateBinauralDecoder(1, HrtfType::Cipic).findProperty("channels")->asInt() == 2, kTag,
          "binaural is 2 channels");
    check(HOAConverter::generateBinauralDecoder(3, HrtfType::Listen).className() == "HoaBinaural", kTag,
          "HOA binaural class");

    check(HOAConverter::calculateOptimalOrder(size_t(16)) == 2, kTag, "16 speakers -> order 2");
    check(HOAConverter::calculateOptimalOrder(size_t(3)) == 1, kTag, "order clamps at 1");
    check(HOAConverter::calculateOptimalOrder(size_t(1000)) == 7, kTag, "order clamps at 7");
    check(HOAConverter::calculateOptimalOrder(ring) == 1, kTag, "8-ring -> order 1");

    HoaValidationResult v1 = HOAConverter::validateHoaConfig(2, 16);
    check(v1.isValid, kTag, "order 2 with 16 speakers is valid");
    check(v1.warnings.size() == 1, kTag, "16 < 18 recommended speakers should warn");
    check(v1.recommendedOrder == 1, kTag, "recommended order for 16 speakers");

    HoaValidationResult v2 = HOAConverter::validateHoaConfig(3, 8);
    check(!v2.isValid && v2.errors.size() == 1, kTag, "order 3 with 8 speakers is invalid");

    HoaValidationResult v3 = HOAConverter::validateHoaConfig(1, 8);
    check(v3.isValid && v3.warnings.empty(), kTag, "order 1 with 8 speakers is clean");
    check(HOAConverter::validateHoaConfig(1, 200).recommendedOrder == 5, kTag, "recommended order clamps at 5");

    HoaValidationResult huge = HOAConverter::validateHoaConfig(70000, 8);
    check(!huge.isValid && huge.errors.size() == 1, kTag, "order 70000 is invalid");
    check(!HOAConverter::validateHoaConfig(8, 1000).isValid, kTag, "order 8 exceeds the maximum");
}

int main() {
    testParameterObjects();
    testWfs();
    testVbapSetupAndValidation();
    testVbapGains();
    testHoa();
    return testResult(kTag);
}
