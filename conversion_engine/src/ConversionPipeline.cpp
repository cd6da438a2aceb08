#include "ConversionPipeline.hpp"
#include "ConversionErrors.hpp"
#include "codegen/WFSConverter.hpp"
#include "codegen/AudioIOConverter.hpp"
#include "codegen/MultichannelConverter.hpp"
#include "codegen/SpatialObjectConverter.hpp"
#include <iostream>

static void recordError(ConversionResult &result, const ConversionError &e) {
    std::cerr << "[Pipeline] Conversion error: " << e.what() << "\n";
    result.errors.push_back(e.what());
}

static void recordWarning(ConversionResult &result, const std::string &msg) {
    std::cerr << "[Pipeline] Warning: " << msg << "\n";
    result.warnings.push_back(msg);
}

// Largest array, or nullptr if there are none
static const SpeakerArray *largestArray(const SpatialConfig &config) {
    const SpeakerArray *best = nullptr;
    for (const auto &a : config.speakerArrays) {
        if (!best || a.speakers.size() > best->speakers.size()) best = &a;
    }
    return best;
}

ConversionResult ConversionPipeline::run(const PatchData &patch,
                                         const SpeakerConfigData *speakerConfig,
                                         const ConversionOptions &options) {
    ConversionResult result;

    // graph errors are fatal for the whole patch
    result.graph = SignalFlowGraphBuilder::build(patch, options.verbose);
    result.summary = PathAnalyzer::summarize(result.graph);
    result.chains = PathAnalyzer::analyzeSignalChains(result.graph, options.pathLimits, options.verbose);

    result.spatialConfig = SpatialAnalyzer::analyzeSpatialConfig(patch, speakerConfig, options);

    if (!options.skipSpatial) {
        switch (result.spatialConfig.processingMethod) {
            case SpatialProcessingMethod::Wfs:
                convertWfs(options, result);
                break;
            case SpatialProcessingMethod::Vbap:
                convertVbap(options, result);
                break;
            case SpatialProcessingMethod::Hoa:
                convertHoa(options, result);
                break;
            case SpatialProcessingMethod::Stereo:
                std::cout << "[Pipeline] Stereo output, no spatial converter needed\n";
                break;
        }
        convertBoxes(patch, options, result);
    }

    if (options.generateOsc) {
        result.oscResponders = OSCResponderGen::generateResponders(patch);
    }

    std::cout << "[Pipeline] Done: " << result.objects.size() << " objects, "
              << result.boxObjects.size() << " box objects, "
              << result.warnings.size() << " warnings, " << result.errors.size() << " errors\n";
    return result;
}

void ConversionPipeline::convertWfs(const ConversionOptions &options, ConversionResult &result) {
    WfsGenerationOptions wfsOptions;
    wfsOptions.temperatureCelsius = options.temperatureCelsius;

    for (const auto &array : result.spatialConfig.speakerArrays) {
        if (array.type.kind != SpeakerArrayKind::Wfs) continue;

        try {
            result.objects.push_back(WFSConverter::generateWfsArray(array, wfsOptions));

            if (array.wfsConfig) {
                if (array.wfsConfig->prefilterCutoff > 0.0f) {
                    result.objects.push_back(WFSConverter::generatePrefilter(array.wfsConfig->prefilterCutoff));
                }
                if (array.wfsConfig->distanceCompensation) {
                    float ref = SpeakerArrayClassifier::averageDistance(array.speakers);
                    result.objects.push_back(WFSConverter::generateDistanceCompensation(ref));
                }
            }
        } catch (const ConversionError &e) {
            recordError(result, e);
        }
    }
}

void ConversionPipeline::convertVbap(const ConversionOptions &options, ConversionResult &result) {
    const SpeakerArray *array = largestArray(result.spatialConfig);
    if (!array) {
        recordWarning(result, "VBAP selected but no speaker array available");
        return;
    }

    VbapValidationResult validation = VBAPConverter::validateSpeakerSetup(*array);
    for (const auto &w : validation.warnings) recordWarning(result, "[" + array->id + "] " + w);
    for (const auto &e : validation.errors) {
        std::cerr << "[Pipeline] VBAP validation failed: " << e << "\n";
        result.errors.push_back("[" + array->id + "] " + e);
    }
    result.vbapValidation.push_back(validation);

    // mismatch between the patch's spat5.vbap~ and the physical layout
    for (const auto &obj : result.spatialConfig.spatialObjects) {
        if (obj.type.kind == SpatialObjectKind::Vbap
            && size_t(obj.type.numSpeakers) != array->speakers.size()) {
            recordWarning(result, obj.id + " expects " + std::to_string(obj.type.numSpeakers)
                                  + " speakers, layout '" + array->id + "' has "
                                  + std::to_string(array->speakers.size()));
        }
    }

    try {
        result.objects.push_back(VBAPConverter::generateSpeakerSetup(*array));

        bool use3D = !options.simplified
            && array->type.kind != SpeakerArrayKind::Ring
            && !VBAPConverter::isHorizontalLayout(array->speakers);
        result.objects.push_back(VBAPConverter::generatePanner(int(array->speakers.size()), array->id, use3D));
    } catch (const ConversionError &e) {
        recordError(result, e);
    }
}

void ConversionPipeline::convertHoa(const ConversionOptions &options, ConversionResult &result) {
    const SpeakerArray *array = largestArray(result.spatialConfig);
    HoaDecoderType decoderType = options.simplified ? HoaDecoderType::Basic : HoaDecoderType::MaxRe;

    for (const auto &obj : result.spatialConfig.spatialObjects) {
        try {
            if (obj.type.kind == SpatialObjectKind::HoaEncoder) {
                result.objects.push_back(HOAConverter::generateEncoder(obj.type.order, obj.format.dimension));
            } else if (obj.type.kind == SpatialObjectKind::HoaDecoder) {
                if (!array) {
                    recordWarning(result, obj.id + ": no speaker layout, decoding to binaural");
                    result.objects.push_back(HOAConverter::generateBinauralDecoder(obj.type.order, HrtfType::Diffuse));
                    continue;
                }

                HoaValidationResult validation =
                    HOAConverter::validateHoaConfig(obj.type.order, array->speakers.size());
                for (const auto &w : validation.warnings) recordWarning(result, obj.id + ": " + w);
                for (const auto &e : validation.errors) {
                    std::cerr << "[Pipeline] HOA validation failed: " << e
                              << " (recommended order " << validation.recommendedOrder << ")\n";
                    result.errors.push_back(obj.id + ": " + e);
                }
                result.hoaValidation.push_back(validation);

                HoaDecoderMatrix matrix;
                if (obj.type.order == 1) {
                    matrix = HOAConverter::computeFoaDecoderMatrix(*array);
                }
                result.objects.push_back(HOAConverter::generateDecoder(obj.type.order, *array, decoderType, matrix));
            }
        } catch (const ConversionError &e) {
            recordError(result, e);
        }
    }
}

// Boxes the selected method already converted from the layout
static bool handledByMethod(ObjectCategory category, SpatialProcessingMethod method) {
    switch (category) {
        case ObjectCategory::HoaEncoder:
        case ObjectCategory::HoaDecoder:
            return method == SpatialProcessingMethod::Hoa;
        case ObjectCategory::Vbap:
            return method == SpatialProcessingMethod::Vbap;
        default:
            return false;
    }
}

static bool isMultichannelName(const std::string &name) {
    return name.compare(0, 3, "mc.") == 0;
}

void ConversionPipeline::convertBoxes(const PatchData &patch, const ConversionOptions &options,
                                      ConversionResult &result) {
    SpatialProcessingMethod method = result.spatialConfig.processingMethod;

    for (const auto &box : patch.boxes) {
        if (!box.text) continue;
        ObjectKind kind = ObjectLexer::lex(box.maxclass, box.text);
        if (kind.category == ObjectCategory::ControlWidget) continue;
        if (handledByMethod(kind.category, method)) continue;

        try {
            std::optional<SCObject> obj;
            if (isMultichannelName(kind.name)) {
                if (options.skipMultichannel) continue;
                obj = MultichannelConverter::convert(kind, box);
            } else {
                obj = AudioIOConverter::convert(kind);
                if (!obj) obj = SpatialObjectConverter::convert(kind, box);
            }
            if (!obj) continue;

            if (obj->className() == "SPAT5_Placeholder") {
                recordWarning(result, box.id + ": no converter for " + kind.name + ", emitting placeholder");
            }
            if (options.verbose) {
                std::cout << "[Pipeline]   " << box.id << ": " << kind.name << " -> " << obj->className() << "\n";
            }
            result.boxObjects.push_back({box.id, std::move(*obj)});
        } catch (const ConversionError &e) {
            std::cerr << "[Pipeline] Conversion error: " << box.id << ": " << e.what() << "\n";
            result.errors.push_back(box.id + ": " + e.what());
        }
    }
}

std::string ConversionPipeline::render(const ConversionResult &result) {
    std::string out;
    for (const auto &obj : result.objects) {
        out += obj.toCode() + ";\n";
    }
    for (const auto &box : result.boxObjects) {
        out += box.object.toCode() + ";  // " + box.boxId + "\n";
    }
    if (!result.oscResponders.empty()) {
        out += OSCResponderGen::renderSetupCode(result.oscResponders);
    }
    return out;
}
