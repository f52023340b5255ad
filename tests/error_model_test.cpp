/**
 * @file error_model_test.cpp
 * @brief Unit tests for error codes, ErrorResponse and the exception hierarchy
 */

#include <gtest/gtest.h>
#include "common/error_codes.h"
#include "common/exceptions.h"

using namespace holomodel::common;

// =============================================================================
// Error code mapping
// =============================================================================

TEST(ErrorCodeTest, NamesMatchEnumerators) {
    EXPECT_EQ(errorCodeToString(ErrorCode::REQUEST_INVALID_MULTIPART), "REQUEST_INVALID_MULTIPART");
    EXPECT_EQ(errorCodeToString(ErrorCode::REQUEST_MISSING_FILE), "REQUEST_MISSING_FILE");
    EXPECT_EQ(errorCodeToString(ErrorCode::STORAGE_INIT_FAILED), "STORAGE_INIT_FAILED");
    EXPECT_EQ(errorCodeToString(ErrorCode::STORAGE_WRITE_FAILED), "STORAGE_WRITE_FAILED");
    EXPECT_EQ(errorCodeToString(ErrorCode::CONFIG_INVALID_VALUE), "CONFIG_INVALID_VALUE");
    EXPECT_EQ(errorCodeToString(ErrorCode::SYSTEM_INTERNAL_ERROR), "SYSTEM_INTERNAL_ERROR");
}

TEST(ErrorCodeTest, HttpStatusMapping) {
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::REQUEST_INVALID_MULTIPART), 422);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::REQUEST_MISSING_FILE), 422);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::STORAGE_INIT_FAILED), 500);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::STORAGE_WRITE_FAILED), 500);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::CONFIG_INVALID_VALUE), 500);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::SYSTEM_INTERNAL_ERROR), 500);
}

// =============================================================================
// ErrorResponse
// =============================================================================

TEST(ErrorResponseTest, JsonEnvelope) {
    ErrorResponse error(ErrorCode::REQUEST_MISSING_FILE, "Multipart field 'file' is required");
    error.setRequestId("REQ-1-2");

    Json::Value json = error.toJson();
    EXPECT_FALSE(json["success"].asBool());
    EXPECT_EQ(json["error"]["code"].asString(), "REQUEST_MISSING_FILE");
    EXPECT_EQ(json["error"]["numericCode"].asInt(), 4002);
    EXPECT_EQ(json["error"]["message"].asString(), "Multipart field 'file' is required");
    EXPECT_EQ(json["requestId"].asString(), "REQ-1-2");
    EXPECT_EQ(error.getHttpStatus(), 422);
}

TEST(ErrorResponseTest, RequestIdOmittedWhenUnset) {
    ErrorResponse error(ErrorCode::SYSTEM_INTERNAL_ERROR, "Internal server error");
    EXPECT_FALSE(error.toJson().isMember("requestId"));
}

// =============================================================================
// Exceptions
// =============================================================================

TEST(ExceptionTest, MissingFileCarriesCodeAndField) {
    MissingFileException e("file");
    EXPECT_EQ(e.getCode(), ErrorCode::REQUEST_MISSING_FILE);
    EXPECT_NE(std::string(e.what()).find("'file'"), std::string::npos);
    EXPECT_EQ(e.getDetails(), "Field: file");
}

TEST(ExceptionTest, StorageDetailsStayOutOfClientBody) {
    StorageWriteException e("/srv/uploads/x.jpg", "No space left on device");

    EXPECT_EQ(e.getCode(), ErrorCode::STORAGE_WRITE_FAILED);
    EXPECT_NE(e.getDetails().find("No space left on device"), std::string::npos);

    Json::Value body = e.toErrorResponse().toJson();
    EXPECT_EQ(body["error"]["code"].asString(), "STORAGE_WRITE_FAILED");
    EXPECT_FALSE(body["error"].isMember("details"));
    EXPECT_EQ(body["error"]["message"].asString().find("/srv/uploads"), std::string::npos);
}

TEST(ExceptionTest, HierarchyCatchableAsBase) {
    try {
        throw StorageInitException("/readonly", "Permission denied");
    } catch (const StorageException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::STORAGE_INIT_FAILED);
    }

    EXPECT_THROW(throw InvalidMultipartException(), RequestException);
    EXPECT_THROW(throw ConfigException("SERVER_PORT", "bad"), HolomodelException);
}
