#include "loom/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("ErrorReporter collects errors") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK_EQ(er.errorCount(), 0);
        CHECK(er.firstError() == nullptr);
    }
    SUBCASE("records code and message in order") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kMissingProperty, "Missing property 'age'.");
        er.addError(ErrorReporter::kClassNotFound, "No class named 'Ghost'.");
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK(!er.ok());
        CHECK_EQ(er.firstError()->code, ErrorReporter::kMissingProperty);
        CHECK_EQ(er.firstError()->message, "Missing property 'age'.");
        CHECK(er.hasError(ErrorReporter::kClassNotFound));
        CHECK(!er.hasError(ErrorReporter::kUnknownVariant));
        er.clear();
        CHECK(er.ok());
    }
    SUBCASE("validation errors carry issues") {
        ErrorReporter er(true);
        er.addValidationError("failed", {{"required", "#/", "#"}});
        REQUIRE_EQ(er.errorCount(), 1);
        CHECK_EQ(er.firstError()->code, ErrorReporter::kValidationFailed);
        REQUIRE_EQ(er.firstError()->issues.size(), 1);
        CHECK_EQ(er.firstError()->issues[0].keyword, "required");
    }
    SUBCASE("file errors") {
        ErrorReporter er(true);
        er.addFileNotFoundError("nowhere.json");
        CHECK(er.hasError(ErrorReporter::kFileError));
    }
}

TEST_CASE("ErrorReporter categories") {
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kEnumPathMalformed), ErrorReporter::kResolution);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kUnsupportedHint), ErrorReporter::kResolution);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kDanglingReference), ErrorReporter::kGraph);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kValidationFailed), ErrorReporter::kValidation);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kExpectedIntegerGotFloat), ErrorReporter::kConversion);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kTupleArityMismatch), ErrorReporter::kConversion);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kHostConstructionFailed), ErrorReporter::kHost);
    CHECK_EQ(ErrorReporter::category(ErrorReporter::kJSONParseError), ErrorReporter::kInput);
    CHECK_EQ(ErrorReporter::codeName(ErrorReporter::kUnknownVariant), "UnknownVariant");
}

} // namespace loom
