#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include "handles/file_handles.hpp"
#include "handles/image_read_handle.hpp"
#include "image/local_image_service.hpp"
#include "transfer/image_transfer.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace imgxfer::transfer;
using imgxfer::image::Context;
using imgxfer::image::ImageChunkIterator;
using imgxfer::image::LocalImageService;
using imgxfer::test::BlockingReadHandle;
using imgxfer::test::EndlessReadHandle;
using imgxfer::test::FailingReadHandle;
using imgxfer::test::MockHandleFactory;
using imgxfer::test::MockImageService;
using imgxfer::test::RecordingWriteHandle;
using imgxfer::test::ScriptedReadHandle;
using imgxfer::test::VectorChunkIterator;
using imgxfer::test::status;
using ::testing::_;
using ::testing::ByMove;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::IsNull;
using ::testing::Ref;
using ::testing::Return;

namespace {

// Orchestrator whose transfer routine is replaced by a mock
class MockImageTransfer : public ImageTransfer {
public:
  using ImageTransfer::ImageTransfer;

  MOCK_METHOD(void, start_transfer,
              (const Context& context, std::chrono::seconds timeout, ReadHandle& read_handle,
               uint64_t max_data_size, WriteHandle* write_handle, const UploadTarget* upload_target),
              (override));
};

// Writes downloads into a local directory instead of a datastore
class LocalHandleFactory : public imgxfer::handles::HandleFactory {
public:
  explicit LocalHandleFactory(const std::filesystem::path& root) : root_(root) {}

  std::unique_ptr<ReadHandle> create_image_read_handle(
    std::unique_ptr<ImageChunkIterator> iterator) override {
    return std::make_unique<imgxfer::handles::ImageReadHandle>(std::move(iterator));
  }

  std::unique_ptr<WriteHandle> create_file_write_handle(
    const std::string& /*host*/, const std::string& /*data_center_name*/,
    const std::string& /*datastore_name*/, const imgxfer::handles::Cookies& /*cookies*/,
    const std::string& file_path, uint64_t /*file_size*/) override {
    return std::make_unique<imgxfer::handles::LocalFileWriteHandle>(root_ / file_path);
  }

private:
  std::filesystem::path root_;
};

Chunk make_pattern(std::size_t size) {
  Chunk data(size);
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>(i % 251);
  }
  return data;
}

std::vector<Chunk> split(const Chunk& data, std::size_t piece) {
  std::vector<Chunk> chunks;
  for (std::size_t offset = 0; offset < data.size(); offset += piece) {
    std::size_t size = std::min(piece, data.size() - offset);
    chunks.emplace_back(data.begin() + offset, data.begin() + offset + size);
  }
  return chunks;
}

Chunk read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  return Chunk(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

class ImageTransferTest : public ::testing::Test {
protected:
  const Context context{"req-42", "token", "project"};
  std::filesystem::path test_dir;
  MockHandleFactory handle_factory;
  TransferConfig config;

  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() /
      ("image_transfer_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
    config.poll_interval = std::chrono::milliseconds(10);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }
};

TEST_F(ImageTransferTest, DownloadFlatImageBuildsHandlesAndStartsTransfer) {
  MockImageService image_service;
  MockImageTransfer image_transfer(handle_factory, config);

  const std::string image_id = "image-7";
  std::unique_ptr<ImageChunkIterator> iterator = std::make_unique<VectorChunkIterator>(std::vector<Chunk>{});
  ImageChunkIterator* iterator_ptr = iterator.get();
  std::unique_ptr<ReadHandle> read_handle = std::make_unique<ScriptedReadHandle>(std::vector<Chunk>{});
  ReadHandle* read_handle_ptr = read_handle.get();
  std::unique_ptr<WriteHandle> write_handle = std::make_unique<RecordingWriteHandle>();
  WriteHandle* write_handle_ptr = write_handle.get();

  FlatImageDownload destination;
  destination.image_size = 1000;
  destination.host = "127.0.0.1";
  destination.data_center_name = "dc1";
  destination.datastore_name = "ds1";
  destination.cookies = {};
  destination.file_path = "/fake_path";

  EXPECT_CALL(image_service, download(Eq(context), image_id))
    .Times(1)
    .WillOnce(Return(ByMove(std::move(iterator))));

  ImageChunkIterator* received_iterator = nullptr;
  EXPECT_CALL(handle_factory, create_image_read_handle(_))
    .Times(1)
    .WillOnce([&](std::unique_ptr<ImageChunkIterator> it) -> std::unique_ptr<ReadHandle> {
      received_iterator = it.get();
      return std::move(read_handle);
    });

  EXPECT_CALL(handle_factory, create_file_write_handle("127.0.0.1", "dc1", "ds1",
                                                       imgxfer::handles::Cookies{}, "/fake_path", 1000u))
    .Times(1)
    .WillOnce(Return(ByMove(std::move(write_handle))));

  EXPECT_CALL(image_transfer, start_transfer(Eq(context), Eq(std::chrono::seconds(10)),
                                             Ref(*read_handle_ptr), 1000u,
                                             write_handle_ptr, IsNull()))
    .Times(1);

  image_transfer.download_flat_image(context, std::chrono::seconds(10), image_service, image_id, destination);
  EXPECT_EQ(received_iterator, iterator_ptr);
}

TEST_F(ImageTransferTest, DownloadFailureToOpenHandlesRaisesTransferError) {
  MockImageService image_service;
  MockImageTransfer image_transfer(handle_factory, config);

  EXPECT_CALL(image_service, download(_, _))
    .WillOnce(Invoke([](const Context&, const std::string&) -> std::unique_ptr<ImageChunkIterator> {
      throw imgxfer::image::ImageServiceError("no such image");
    }));
  EXPECT_CALL(handle_factory, create_image_read_handle(_)).Times(0);
  EXPECT_CALL(image_transfer, start_transfer(_, _, _, _, _, _)).Times(0);

  EXPECT_THROW(image_transfer.download_flat_image(context, std::chrono::seconds(10), image_service,
                                                  "missing", FlatImageDownload{}),
               TransferError);
}

TEST_F(ImageTransferTest, StartTransferCopiesDirectly) {
  ImageTransfer image_transfer(handle_factory, config);
  Chunk data = make_pattern(10000);
  ScriptedReadHandle read_handle(split(data, 3000));
  RecordingWriteHandle write_handle;

  image_transfer.start_transfer(context, std::chrono::seconds(10), read_handle, data.size(),
                                &write_handle, nullptr);

  Chunk written;
  for (const auto& chunk : write_handle.written()) {
    written.insert(written.end(), chunk.begin(), chunk.end());
  }
  EXPECT_EQ(written, data);
  EXPECT_EQ(read_handle.close_count.load(), 1);
  EXPECT_EQ(write_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, StartTransferReadFailureClosesHandles) {
  ImageTransfer image_transfer(handle_factory, config);
  FailingReadHandle read_handle;
  RecordingWriteHandle write_handle;

  try {
    image_transfer.start_transfer(context, std::chrono::seconds(10), read_handle, 100, &write_handle, nullptr);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::IO_FAILURE);
  }
  EXPECT_EQ(read_handle.close_count.load(), 1);
  EXPECT_EQ(write_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, StartTransferTimesOut) {
  ImageTransfer image_transfer(handle_factory, config);
  EndlessReadHandle read_handle(std::chrono::milliseconds(5));
  RecordingWriteHandle write_handle;

  auto started = std::chrono::steady_clock::now();
  try {
    image_transfer.start_transfer(context, std::chrono::seconds(1), read_handle, 1000, &write_handle, nullptr);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::TIMEOUT);
  }
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_GE(elapsed, std::chrono::seconds(1));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  EXPECT_EQ(read_handle.close_count.load(), 1);
  EXPECT_EQ(write_handle.close_count.load(), 1);
  EXPECT_EQ(write_handle.cancel_count.load(), 1);
}

TEST_F(ImageTransferTest, TimeoutCancelsBlockedRead) {
  ImageTransfer image_transfer(handle_factory, config);
  BlockingReadHandle read_handle;
  RecordingWriteHandle write_handle;

  auto started = std::chrono::steady_clock::now();
  try {
    image_transfer.start_transfer(context, std::chrono::seconds(1), read_handle, 1000, &write_handle, nullptr);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::TIMEOUT);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
  EXPECT_EQ(read_handle.cancel_count.load(), 1);
  EXPECT_EQ(write_handle.cancel_count.load(), 1);
  EXPECT_EQ(read_handle.close_count.load(), 1);
  EXPECT_EQ(write_handle.close_count.load(), 1);
  EXPECT_TRUE(write_handle.written().empty());
}

TEST_F(ImageTransferTest, StartTransferWithoutDestinationFails) {
  ImageTransfer image_transfer(handle_factory, config);
  ScriptedReadHandle read_handle({Chunk(10, 1)});

  EXPECT_THROW(image_transfer.start_transfer(context, std::chrono::seconds(10), read_handle, 10,
                                             nullptr, nullptr),
               TransferError);
  EXPECT_EQ(read_handle.read_count.load(), 0);
  EXPECT_EQ(read_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, UploadImageThroughQueue) {
  LocalImageService image_service(test_dir / "images");
  image_service.create_image("image-up");
  ImageTransfer image_transfer(handle_factory, config);

  Chunk data = make_pattern(300 * 1024 + 17);
  ScriptedReadHandle read_handle(split(data, 50000));

  image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-up",
                              read_handle, data.size(), {{"disk_format", "vmdk"}});

  EXPECT_EQ(image_service.show(context, "image-up").status, "active");
  EXPECT_EQ(read_file(image_service.image_path("image-up")), data);
  EXPECT_EQ(image_service.metadata("image-up").at("disk_format"), "vmdk");
  EXPECT_EQ(read_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, UploadStopsAtDeclaredSize) {
  LocalImageService image_service(test_dir / "images");
  image_service.create_image("image-cut");
  ImageTransfer image_transfer(handle_factory, config);

  ScriptedReadHandle read_handle({Chunk(100, 1), Chunk(100, 2), Chunk(100, 3), Chunk(100, 4)});
  image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-cut",
                              read_handle, 250);

  EXPECT_EQ(std::filesystem::file_size(image_service.image_path("image-cut")), 250u);
  EXPECT_EQ(image_service.show(context, "image-cut").status, "active");
}

TEST_F(ImageTransferTest, UploadShorterThanDeclaredSizeFails) {
  LocalImageService image_service(test_dir / "images");
  image_service.create_image("image-short");
  ImageTransfer image_transfer(handle_factory, config);

  ScriptedReadHandle read_handle({Chunk(500, 1)});
  try {
    image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-short",
                                read_handle, 1000);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::IO_FAILURE);
    EXPECT_NE(std::string(e.what()).find("500 of 1000 bytes"), std::string::npos);
  }
  EXPECT_EQ(image_service.show(context, "image-short").status, "killed");
  EXPECT_EQ(read_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, UploadProducerFailureKillsImage) {
  LocalImageService image_service(test_dir / "images");
  image_service.create_image("image-broken");
  ImageTransfer image_transfer(handle_factory, config);

  FailingReadHandle read_handle({Chunk(100, 1)});
  try {
    image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-broken",
                                read_handle, 1000);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::IO_FAILURE);
    EXPECT_NE(std::string(e.what()).find("simulated read failure"), std::string::npos);
  }
  EXPECT_EQ(read_handle.read_count.load(), 2);
  EXPECT_EQ(image_service.show(context, "image-broken").status, "killed");
  EXPECT_EQ(read_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, UploadKilledImageFails) {
  MockImageService image_service;
  ImageTransfer image_transfer(handle_factory, config);
  ScriptedReadHandle read_handle({Chunk(64, 1), Chunk(64, 2)});

  EXPECT_CALL(image_service, update(Eq(context), "image-k", _, _))
    .WillOnce(Invoke([](const Context&, const std::string&, const imgxfer::image::ImageMetadata&,
                        ReadHandle& data) { imgxfer::test::read_all(data, 32); }));
  EXPECT_CALL(image_service, show(Eq(context), "image-k")).WillOnce(Return(status("killed")));

  try {
    image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-k", read_handle, 128);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::IMAGE_KILLED);
  }
}

TEST_F(ImageTransferTest, UploadFailsFastWhenServiceRejectsData) {
  MockImageService image_service;
  ImageTransfer image_transfer(handle_factory, config);
  EndlessReadHandle read_handle;

  EXPECT_CALL(image_service, update(_, _, _, _))
    .WillOnce(Invoke([](const Context&, const std::string&, const imgxfer::image::ImageMetadata&,
                        ReadHandle&) { throw imgxfer::image::ImageServiceError("quota exceeded"); }));
  EXPECT_CALL(image_service, show(_, _)).Times(0);

  auto started = std::chrono::steady_clock::now();
  try {
    image_transfer.upload_image(context, std::chrono::seconds(30), image_service, "image-q",
                                read_handle, 1u << 30);
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferErrorKind::IO_FAILURE);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
  EXPECT_EQ(read_handle.close_count.load(), 1);
}

TEST_F(ImageTransferTest, DownloadFlatImageEndToEnd) {
  Chunk data = make_pattern(200 * 1024);
  std::filesystem::create_directories(test_dir / "images");
  {
    std::ofstream file(test_dir / "images" / "image-d.img", std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  }
  LocalImageService image_service(test_dir / "images");
  LocalHandleFactory local_factory(test_dir);
  ImageTransfer image_transfer(local_factory, config);

  FlatImageDownload destination;
  destination.image_size = data.size();
  destination.host = "127.0.0.1";
  destination.data_center_name = "dc1";
  destination.datastore_name = "ds1";
  destination.file_path = "disk.vmdk";

  image_transfer.download_flat_image(context, std::chrono::seconds(30), image_service, "image-d", destination);
  EXPECT_EQ(read_file(test_dir / "disk.vmdk"), data);
}
