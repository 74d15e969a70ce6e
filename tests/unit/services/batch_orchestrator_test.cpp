#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>
#include <filesystem>
#include <memory>

#include <sys/resource.h>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "scribe_core/errors.hpp"
#include "scribe_core/services/batch_orchestrator.hpp"

namespace scribe_tests {

using namespace scribe_core;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

// Caps the size of files this process may write until it goes out of scope
class FileSizeLimit {
 public:
  explicit FileSizeLimit(rlim_t max_bytes) {
    getrlimit(RLIMIT_FSIZE, &previous_);
    previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
    rlimit limit = previous_;
    limit.rlim_cur = max_bytes;
    setrlimit(RLIMIT_FSIZE, &limit);
  }

  ~FileSizeLimit() {
    setrlimit(RLIMIT_FSIZE, &previous_);
    std::signal(SIGXFSZ, previous_handler_);
  }

  FileSizeLimit(const FileSizeLimit&) = delete;
  FileSizeLimit& operator=(const FileSizeLimit&) = delete;

 private:
  rlimit previous_{};
  void (*previous_handler_)(int) = SIG_DFL;
};

class BatchOrchestratorTest : public TempDirectoryTestBase {
 protected:
  void SetUp() override {
    TempDirectoryTestBase::SetUp();
    mock_service_ = std::make_shared<StrictMock<MockOcrService>>();
  }

  std::unique_ptr<BatchOrchestrator> make_orchestrator(bool embed_images = false,
                                                       BatchOptions options = BatchOptions{}) {
    PipelineOptions pipeline_options;
    pipeline_options.embed_images = embed_images;
    options.embed_images = embed_images;
    auto pipeline = std::make_shared<DocumentPipeline>(
        mock_service_, pipeline_options,
        std::make_shared<MimeTypeResolver>(std::vector<std::filesystem::path>{}));
    return std::make_unique<BatchOrchestrator>(pipeline, std::make_shared<MarkdownSynthesizer>(),
                                               options);
  }

  // Full PDF round trip against the mock service
  void expect_pdf_conversion(const std::string& file_name,
                             const std::string& handle,
                             const OcrResult& result) {
    EXPECT_CALL(*mock_service_, stage(_, file_name, "ocr")).WillOnce(Return(handle));
    EXPECT_CALL(*mock_service_, locate(handle)).WillOnce(Return("https://files/" + handle));
    EXPECT_CALL(*mock_service_,
                process(Field(&DocumentRef::value, "https://files/" + handle), _))
        .WillOnce(Return(result));
    EXPECT_CALL(*mock_service_, release(handle)).Times(1);
  }

  void expect_image_conversion(const OcrResult& result) {
    EXPECT_CALL(*mock_service_,
                process(Field(&DocumentRef::type, DocumentRef::Type::InlineData), false))
        .WillOnce(Return(result));
  }

  std::shared_ptr<StrictMock<MockOcrService>> mock_service_;
};

TEST_F(BatchOrchestratorTest, Discover_FiltersAndSortsCandidates) {
  create_test_file("a.pdf", "pdf");
  create_test_file("B.PNG", "png");
  create_test_file("c.jpg", "jpg");
  create_test_file("d.jpeg", "jpeg");
  create_test_file("e.webp", "webp");
  create_test_file("notes.md", "# notes");
  create_test_file("readme.txt", "text");
  std::filesystem::create_directories(test_dir_ / "folder.pdf");

  std::vector<SourceFile> candidates = make_orchestrator()->discover(test_dir_);

  ASSERT_EQ(candidates.size(), 5u);
  EXPECT_EQ(candidates[0].file_name(), "B.PNG");
  EXPECT_EQ(candidates[0].kind, FileKind::Image);
  EXPECT_EQ(candidates[1].file_name(), "a.pdf");
  EXPECT_EQ(candidates[1].kind, FileKind::PDF);
  EXPECT_EQ(candidates[2].file_name(), "c.jpg");
  EXPECT_EQ(candidates[3].file_name(), "d.jpeg");
  EXPECT_EQ(candidates[4].file_name(), "e.webp");
}

TEST_F(BatchOrchestratorTest, Discover_MarkdownNeverCandidateEvenIfConfigured) {
  create_test_file("notes.md", "# notes");
  create_test_file("a.png", "png");
  BatchOptions options;
  options.supported_extensions = {".md", ".png"};

  std::vector<SourceFile> candidates = make_orchestrator(false, options)->discover(test_dir_);

  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0].file_name(), "a.png");
}

TEST_F(BatchOrchestratorTest, RunBatch_MissingDirectory_ThrowsDirectoryListError) {
  EXPECT_THROW(make_orchestrator()->run_batch(test_dir_ / "does_not_exist"), DirectoryListError);
}

TEST_F(BatchOrchestratorTest, RunBatch_NoCandidates_ReturnsEmptySummaryWithoutRemoteCalls) {
  create_test_file("notes.md", "# notes");
  create_test_file("readme.txt", "text");

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.candidates, 0u);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(summary.skipped, 0u);
  EXPECT_EQ(summary.errors, 0u);
  EXPECT_FALSE(summary.has_errors());
}

TEST_F(BatchOrchestratorTest, RunBatch_PdfAndImage_BothConverted) {
  create_test_file("a.pdf", "%PDF-1.4");
  create_test_file("b.png", "png-bytes");
  expect_pdf_conversion("a.pdf", "file-a", MockUtilities::create_test_result({"A1", "A2"}));
  expect_image_conversion(MockUtilities::create_test_result({"B text"}));

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.candidates, 2u);
  EXPECT_EQ(summary.processed, 2u);
  EXPECT_EQ(summary.skipped, 0u);
  EXPECT_EQ(summary.errors, 0u);
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "a.md"), "A1\n\n---\n\nA2");
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "b.md"), "B text");
}

TEST_F(BatchOrchestratorTest, RunBatch_SecondRun_SkipsEverythingWithoutRemoteCalls) {
  create_test_file("a.pdf", "%PDF-1.4");
  create_test_file("b.png", "png-bytes");
  expect_pdf_conversion("a.pdf", "file-a", MockUtilities::create_test_result({"A"}));
  expect_image_conversion(MockUtilities::create_test_result({"B"}));

  auto orchestrator = make_orchestrator();
  RunSummary first = orchestrator->run_batch(test_dir_);
  ASSERT_EQ(first.processed, 2u);
  const std::string a_after_first = TestUtilities::read_file(test_dir_ / "a.md");
  const std::string b_after_first = TestUtilities::read_file(test_dir_ / "b.md");
  ::testing::Mock::VerifyAndClearExpectations(mock_service_.get());

  // StrictMock with no expectations: any remote call fails the test
  RunSummary second = orchestrator->run_batch(test_dir_);

  EXPECT_EQ(second.candidates, 2u);
  EXPECT_EQ(second.skipped, 2u);
  EXPECT_EQ(second.processed, 0u);
  EXPECT_EQ(second.errors, 0u);
  for (const auto& report : second.files) {
    EXPECT_EQ(report.skip_reason, SkipReason::OutputExists);
  }
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "a.md"), a_after_first);
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "b.md"), b_after_first);
}

TEST_F(BatchOrchestratorTest, RunBatch_PreExistingOutput_SkippedWithoutRemoteCall) {
  create_test_file("c.png", "png-bytes");
  create_test_file("c.md", "existing");

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.candidates, 1u);
  EXPECT_EQ(summary.skipped, 1u);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "c.md"), "existing");
}

TEST_F(BatchOrchestratorTest, RunBatch_ZeroPageResult_WritesEmptyFileAndCountsProcessed) {
  create_test_file("blank.png", "png-bytes");
  expect_image_conversion(OcrResult{});

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.processed, 1u);
  EXPECT_EQ(summary.errors, 0u);
  ASSERT_TRUE(std::filesystem::exists(test_dir_ / "blank.md"));
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "blank.md"), "");
}

TEST_F(BatchOrchestratorTest, RunBatch_RemoteFailure_CountedAndBatchContinues) {
  create_test_file("a.png", "png-a");
  create_test_file("b.png", "png-b");
  EXPECT_CALL(*mock_service_, process(_, _))
      .WillOnce(Throw(OcrServiceError("status 500")))
      .WillOnce(Return(MockUtilities::create_test_result({"B"})));

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.candidates, 2u);
  EXPECT_EQ(summary.errors, 1u);
  EXPECT_EQ(summary.processed, 1u);
  EXPECT_TRUE(summary.has_errors());
  ASSERT_EQ(summary.files.size(), 2u);
  EXPECT_EQ(summary.files[0].outcome, Outcome::Failed);
  EXPECT_EQ(summary.files[0].error_kind, ErrorKind::RemoteServiceError);
  EXPECT_FALSE(std::filesystem::exists(test_dir_ / "a.md"));
  EXPECT_TRUE(std::filesystem::exists(test_dir_ / "b.md"));
}

TEST_F(BatchOrchestratorTest, RunBatch_LocalFailure_CountedAsLocalIoError) {
  create_test_file("empty.png", "");

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.errors, 1u);
  ASSERT_EQ(summary.files.size(), 1u);
  EXPECT_EQ(summary.files[0].error_kind, ErrorKind::LocalIoError);
}

TEST_F(BatchOrchestratorTest, RunBatch_OutputAppearsDuringConversion_WriteErrorWithoutOverwrite) {
  create_test_file("race.png", "png-bytes");
  const auto output = test_dir_ / "race.md";
  EXPECT_CALL(*mock_service_, process(_, _))
      .WillOnce(Invoke([&output](const DocumentRef&, bool) {
        TestUtilities::write_file(output, "written by someone else");
        return MockUtilities::create_test_result({"ours"});
      }));

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.errors, 1u);
  EXPECT_EQ(summary.files[0].error_kind, ErrorKind::WriteError);
  EXPECT_EQ(TestUtilities::read_file(output), "written by someone else");
}

TEST_F(BatchOrchestratorTest, RunBatch_ShortWrite_RemovesPartialOutputSoNextRunRetries) {
  create_test_file("big.png", "png-bytes");
  const auto output = test_dir_ / "big.md";
  const std::string page(100000, 'x');
  EXPECT_CALL(*mock_service_, process(_, false))
      .Times(2)
      .WillRepeatedly(Return(MockUtilities::create_test_result({page})));
  auto orchestrator = make_orchestrator();

  RunSummary first;
  {
    FileSizeLimit limit(4096);
    first = orchestrator->run_batch(test_dir_);
  }

  EXPECT_EQ(first.errors, 1u);
  EXPECT_EQ(first.files[0].error_kind, ErrorKind::WriteError);
  EXPECT_FALSE(std::filesystem::exists(output));

  RunSummary second = orchestrator->run_batch(test_dir_);

  EXPECT_EQ(second.processed, 1u);
  EXPECT_EQ(second.skipped, 0u);
  EXPECT_EQ(TestUtilities::read_file(output), page);
}

TEST_F(BatchOrchestratorTest, RunBatch_ReleaseFailure_StillProcessed) {
  create_test_file("a.pdf", "%PDF-1.4");
  EXPECT_CALL(*mock_service_, stage(_, "a.pdf", "ocr")).WillOnce(Return("file-a"));
  EXPECT_CALL(*mock_service_, locate("file-a")).WillOnce(Return("https://files/file-a"));
  EXPECT_CALL(*mock_service_, process(_, _))
      .WillOnce(Return(MockUtilities::create_test_result({"A"})));
  EXPECT_CALL(*mock_service_, release("file-a"))
      .Times(1)
      .WillOnce(Throw(OcrServiceError("delete failed")));

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.processed, 1u);
  EXPECT_EQ(summary.errors, 0u);
  EXPECT_TRUE(std::filesystem::exists(test_dir_ / "a.md"));
}

TEST_F(BatchOrchestratorTest, RunBatch_EmbedImages_OnlyAppliedToPdfs) {
  create_test_file("doc.pdf", "%PDF-1.4");
  create_test_file("pic.png", "png-bytes");

  OcrResult pdf_result;
  pdf_result.pages.push_back(
      MockUtilities::create_test_page(0, "![fig1](fig1)", {{"fig1", "QQ=="}}));
  OcrResult image_result;
  image_result.pages.push_back(
      MockUtilities::create_test_page(0, "![fig1](fig1)", {{"fig1", "QQ=="}}));

  EXPECT_CALL(*mock_service_, stage(_, "doc.pdf", "ocr")).WillOnce(Return("file-doc"));
  EXPECT_CALL(*mock_service_, locate("file-doc")).WillOnce(Return("https://files/file-doc"));
  EXPECT_CALL(*mock_service_,
              process(Field(&DocumentRef::type, DocumentRef::Type::DocumentLocator), true))
      .WillOnce(Return(pdf_result));
  EXPECT_CALL(*mock_service_, release("file-doc")).Times(1);
  expect_image_conversion(image_result);

  RunSummary summary = make_orchestrator(true)->run_batch(test_dir_);

  EXPECT_EQ(summary.processed, 2u);
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "doc.md"),
            "![fig1](data:image/png;base64,QQ==)");
  EXPECT_EQ(TestUtilities::read_file(test_dir_ / "pic.md"), "![fig1](fig1)");
}

TEST_F(BatchOrchestratorTest, RunBatch_SelfFile_Skipped) {
  auto self = create_test_file("tool.png", "not really an image");
  BatchOptions options;
  options.self_path = self;

  RunSummary summary = make_orchestrator(false, options)->run_batch(test_dir_);

  EXPECT_EQ(summary.skipped, 1u);
  ASSERT_EQ(summary.files.size(), 1u);
  EXPECT_EQ(summary.files[0].skip_reason, SkipReason::SelfFile);
}

TEST_F(BatchOrchestratorTest, RunBatch_CountersAlwaysAddUpToCandidates) {
  create_test_file("a.png", "png-a");
  create_test_file("b.png", "");
  create_test_file("c.png", "png-c");
  create_test_file("c.md", "existing");
  expect_image_conversion(MockUtilities::create_test_result({"A"}));

  RunSummary summary = make_orchestrator()->run_batch(test_dir_);

  EXPECT_EQ(summary.processed + summary.skipped + summary.errors, summary.candidates);
  EXPECT_EQ(summary.candidates, 3u);
  EXPECT_EQ(summary.files.size(), 3u);
}

}  // namespace scribe_tests
