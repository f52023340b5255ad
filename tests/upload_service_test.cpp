/**
 * @file upload_service_test.cpp
 * @brief Unit tests for UploadService and ModelService
 *
 * Uploads go to a scratch LocalFileStorage; failure paths use a storage
 * double that always throws.
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "services/upload_service.h"
#include "services/model_service.h"
#include "storage/local_file_storage.h"
#include "domain/models/job_id.h"
#include "infrastructure/app_config.h"
#include "common/exceptions.h"
#include "test_helpers.h"

namespace fs = std::filesystem;

using holomodel::domain::models::JobId;
using holomodel::infrastructure::kDefaultModelUrl;
using holomodel::services::ModelService;
using holomodel::services::UploadService;
using holomodel::storage::IFileStorage;
using holomodel::storage::LocalFileStorage;
using test_helpers::TempDir;
using test_helpers::bytesOf;
using test_helpers::countFiles;
using test_helpers::readFile;

namespace {

/// Storage double simulating a full disk
class FailingStorage : public IFileStorage {
public:
    std::string store(const std::string& fileName, const std::vector<uint8_t>& /* content */) override {
        throw holomodel::common::StorageWriteException(fileName, "No space left on device");
    }
    bool isAvailable() const override { return true; }
    std::string baseDir() const override { return "/dev/full"; }
};

// --- Test Fixtures ---

class UploadServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = std::make_unique<TempDir>();
        uploadDir_ = tmp_->path() / "storage" / "uploads";
        storage_ = std::make_unique<LocalFileStorage>(uploadDir_.string());
        modelService_ = std::make_unique<ModelService>(kDefaultModelUrl);
        service_ = std::make_unique<UploadService>(storage_.get(), modelService_.get());
    }

    std::unique_ptr<TempDir> tmp_;
    fs::path uploadDir_;
    std::unique_ptr<LocalFileStorage> storage_;
    std::unique_ptr<ModelService> modelService_;
    std::unique_ptr<UploadService> service_;
};

} // anonymous namespace

// =============================================================================
// UploadService
// =============================================================================

TEST_F(UploadServiceTest, TenByteUploadReturnsJobIdAndModelUrl) {
    auto content = bytesOf("0123456789");
    auto receipt = service_->uploadImage(content);

    EXPECT_TRUE(JobId::isValidFormat(receipt.jobId)) << receipt.jobId;
    EXPECT_EQ(receipt.modelUrl, kDefaultModelUrl);
    EXPECT_EQ(receipt.sizeBytes, 10);

    fs::path expected = uploadDir_ / (receipt.jobId + ".jpg");
    EXPECT_EQ(fs::path(receipt.storagePath), expected);
    EXPECT_EQ(readFile(expected), content);
}

TEST_F(UploadServiceTest, EmptyUploadIsAccepted) {
    auto receipt = service_->uploadImage({});

    EXPECT_TRUE(JobId::isValidFormat(receipt.jobId));
    EXPECT_EQ(receipt.modelUrl, kDefaultModelUrl);
    EXPECT_EQ(fs::file_size(receipt.storagePath), 0u);
}

TEST_F(UploadServiceTest, NonImageContentStoredAsJpg) {
    auto content = bytesOf("%PDF-1.7 definitely not an image");
    auto receipt = service_->uploadImage(content);

    EXPECT_EQ(fs::path(receipt.storagePath).extension(), ".jpg");
    EXPECT_EQ(readFile(receipt.storagePath), content);
    EXPECT_EQ(receipt.modelUrl, kDefaultModelUrl);
}

TEST_F(UploadServiceTest, SequentialUploadsDoNotCrossContaminate) {
    auto first = bytesOf("first image payload");
    auto second = bytesOf("second");

    auto r1 = service_->uploadImage(first);
    auto r2 = service_->uploadImage(second);

    EXPECT_NE(r1.jobId, r2.jobId);
    EXPECT_NE(r1.storagePath, r2.storagePath);
    EXPECT_EQ(countFiles(uploadDir_), 2u);
    EXPECT_EQ(readFile(r1.storagePath), first);
    EXPECT_EQ(readFile(r2.storagePath), second);
    EXPECT_EQ(r1.modelUrl, r2.modelUrl);
}

TEST_F(UploadServiceTest, ReceiptJsonHasOnlyClientFields) {
    auto receipt = service_->uploadImage(bytesOf("abc"));
    Json::Value json = receipt.toJson();

    EXPECT_EQ(json.size(), 2u);
    EXPECT_EQ(json["job_id"].asString(), receipt.jobId);
    EXPECT_EQ(json["model_url"].asString(), kDefaultModelUrl);
}

TEST_F(UploadServiceTest, ConfiguredModelUrlIsReturned) {
    ModelService custom("https://example.com/assets/chair.glb");
    UploadService service(storage_.get(), &custom);

    auto receipt = service.uploadImage(bytesOf("img"));
    EXPECT_EQ(receipt.modelUrl, "https://example.com/assets/chair.glb");
}

TEST(UploadServiceErrorTest, StorageFailurePropagates) {
    FailingStorage storage;
    ModelService modelService(kDefaultModelUrl);
    UploadService service(&storage, &modelService);

    EXPECT_THROW(service.uploadImage(bytesOf("data")), holomodel::common::StorageWriteException);
}

TEST(UploadServiceErrorTest, NullDependenciesRejected) {
    FailingStorage storage;
    ModelService modelService(kDefaultModelUrl);

    EXPECT_THROW(UploadService(nullptr, &modelService), std::invalid_argument);
    EXPECT_THROW(UploadService(&storage, nullptr), std::invalid_argument);
}

// =============================================================================
// ModelService
// =============================================================================

TEST(ModelServiceTest, SameUrlForAnyJobId) {
    ModelService service(kDefaultModelUrl);

    EXPECT_EQ(service.getModel(JobId::generate().toString()).modelUrl, kDefaultModelUrl);
    EXPECT_EQ(service.getModel("never-issued").modelUrl, kDefaultModelUrl);
    EXPECT_EQ(service.getModel("").modelUrl, kDefaultModelUrl);
    EXPECT_EQ(service.getModel("../../etc/passwd").modelUrl, kDefaultModelUrl);
}

TEST(ModelServiceTest, ReferenceJson) {
    ModelService service(kDefaultModelUrl);
    Json::Value json = service.getModel("x").toJson();

    EXPECT_EQ(json.size(), 1u);
    EXPECT_EQ(json["model_url"].asString(), kDefaultModelUrl);
}

TEST(ModelServiceTest, EmptyUrlRejected) {
    EXPECT_THROW(ModelService(""), std::invalid_argument);
}
