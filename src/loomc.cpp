// loomc, command line JSON Schema generator and instantiator for classes described by a class manifest.
#include "loom/ClassLibrary.hpp"
#include "loom/CompiledSchema.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/SchemaLibrary.hpp"
#include "loom/SourceFile.hpp"
#include "loom/ValueDumpJSON.hpp"

#include "gflags/gflags.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

DEFINE_string(manifest, "", "Path to the JSON class manifest describing the available classes.");
DEFINE_string(className, "", "Generate the schema of the class registered under this name.");
DEFINE_string(script, "", "Generate the schema of the script class stored at this path.");
DEFINE_string(type, "", "Generate the schema of a single property of this type, such as 'int' or 'Array'.");
DEFINE_string(typeClassName, "", "Class name or enum path of the --type property.");
DEFINE_string(hint, "NONE", "Hint kind of the --type property, such as 'ARRAY_TYPE'.");
DEFINE_string(hintString, "", "Hint string of the --type property.");
DEFINE_bool(enumUsage, false, "Mark the --type property as enum valued.");
DEFINE_string(arrayItem, "", "If set, emit a schema for arrays of the generated type, named this in $defs.");
DEFINE_string(responseFormat, "", "If set, wrap the schema as a structured output response format of this name.");
DEFINE_string(input, "", "Path to a JSON file to validate and instantiate against the generated schema.");
DEFINE_bool(pretty, true, "Pretty-print JSON output.");
DEFINE_uint64(maxDepth, loom::kDefaultMaxDepth, "Maximum class nesting depth for generation and instantiation.");
DEFINE_string(logFile, "", "If set, write log output to this file instead of stderr.");
DEFINE_bool(debugLogs, false, "Set log output level to debug (verbose).");
DEFINE_bool(traceLogs, false, "Set log output level to trace (very verbose).");

namespace {

std::optional<loom::PropertyInfo> typeInfoFromFlags() {
    loom::PropertyInfo property;
    property.name = "value";
    auto kind = loom::variantKindNamed(FLAGS_type);
    if (!kind) {
        SPDLOG_ERROR("Unknown type '{}'.", FLAGS_type);
        return std::nullopt;
    }
    property.kind = *kind;
    auto hint = loom::propertyHintNamed(FLAGS_hint);
    if (!hint) {
        SPDLOG_ERROR("Unknown hint '{}'.", FLAGS_hint);
        return std::nullopt;
    }
    property.hint = *hint;
    property.className = FLAGS_typeClassName;
    property.hintString = FLAGS_hintString;
    if (FLAGS_enumUsage) {
        property.usage |= loom::kUsageClassIsEnum;
    }
    return property;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("loomc --manifest=<classes.json> (--className=<name> | --script=<path> | --type=<type>)");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    std::shared_ptr<spdlog::logger> logger;
    if (FLAGS_logFile.size()) {
        logger = spdlog::basic_logger_mt("file", FLAGS_logFile);
    } else {
        logger = spdlog::stderr_color_mt("stderr");
    }
    logger->set_level(spdlog::level::info);
    if (FLAGS_debugLogs) {
        logger->set_level(spdlog::level::level_enum::debug);
    }
    if (FLAGS_traceLogs) {
        logger->set_level(spdlog::level::level_enum::trace);
    }
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    auto errorReporter = std::make_shared<loom::ErrorReporter>();
    loom::ClassLibrary classLibrary(errorReporter);
    if (FLAGS_manifest.size() && !classLibrary.scanFile(FLAGS_manifest)) {
        return -1;
    }
    SPDLOG_INFO("Loaded {} classes.", classLibrary.numberOfClasses());

    loom::SchemaLibrary schemaLibrary(&classLibrary);
    schemaLibrary.setMaxDepth(FLAGS_maxDepth);

    std::shared_ptr<const loom::CompiledSchema> schema;
    if (FLAGS_className.size()) {
        schema = schemaLibrary.generateNamedClassSchema(FLAGS_className, errorReporter);
    } else if (FLAGS_script.size()) {
        auto source = classLibrary.findScript(FLAGS_script);
        if (!source) {
            SPDLOG_ERROR("No script class at '{}'.", FLAGS_script);
            return -1;
        }
        schema = schemaLibrary.generateClassSchema(*source, errorReporter);
    } else if (FLAGS_type.size()) {
        auto property = typeInfoFromFlags();
        if (!property) {
            return -1;
        }
        schema = schemaLibrary.generateTypeInfoSchema(*property, errorReporter);
    } else {
        std::cerr << gflags::ProgramUsage() << std::endl;
        return -1;
    }
    if (!schema) {
        return -1;
    }

    if (FLAGS_arrayItem.size()) {
        schema = schema->arraySchema(FLAGS_arrayItem, errorReporter);
        if (!schema) {
            return -1;
        }
    }

    if (FLAGS_input.size()) {
        loom::SourceFile inputFile(FLAGS_input, errorReporter);
        if (!inputFile.read()) {
            return -1;
        }
        loom::Value value;
        if (!schema->instantiate(inputFile.contents(), &classLibrary, errorReporter, value, FLAGS_maxDepth)) {
            return -1;
        }
        loom::ValueDumpJSON dump;
        dump.dump(value, FLAGS_pretty);
        std::cout << dump.json() << std::endl;
        return 0;
    }

    std::string json;
    if (FLAGS_responseFormat.size()) {
        if (!schema->responseFormat(FLAGS_responseFormat, json, FLAGS_pretty, errorReporter)) {
            return -1;
        }
    } else if (FLAGS_pretty) {
        json = schema->json();
    } else if (!schema->compactJSON(json, errorReporter)) {
        return -1;
    }
    std::cout << json << std::endl;

    return 0;
}
