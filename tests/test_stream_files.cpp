#include <doctest/doctest.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "data_stream/file_info.hpp"
#include "data_stream/incoming_stream_manager.hpp"
#include "data_stream/outgoing_stream_manager.hpp"
#include "data_stream/stream_error.hpp"
#include "test_support.hpp"

using namespace data_stream;

namespace {

void write_file(const std::filesystem::path &path,
                const std::vector<uint8_t> &data) {
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

// Outgoing manager wired straight into an inline incoming manager.
struct Loopback {
  IncomingStreamManager incoming{inline_executor()};
  std::shared_ptr<OutgoingStreamManager> outgoing;
  std::vector<ByteStreamReader> readers;

  explicit Loopback(size_t chunk_size = 1000) {
    outgoing = OutgoingStreamManager::create(
        [this](const v1::DataPacket &packet) { incoming.handle_packet(packet); },
        chunk_size);
    incoming.register_byte_stream_handler(
        "files", [this](ByteStreamReader reader, const std::string &) {
          readers.push_back(reader);
        });
  }
};

} // namespace

TEST_CASE("MIME lookup by extension") {
  CHECK(mime_type_for_extension("png") == std::optional<std::string>("image/png"));
  CHECK(mime_type_for_extension(".PDF") ==
        std::optional<std::string>("application/pdf"));
  CHECK_FALSE(mime_type_for_extension("nope"));

  CHECK(preferred_extension("application/octet-stream") ==
        std::optional<std::string>("bin"));
  CHECK(preferred_extension("image/jpeg") == std::optional<std::string>("jpeg"));
  CHECK(preferred_extension("text/plain") == std::optional<std::string>("txt"));
  CHECK_FALSE(preferred_extension("application/x-unknown"));
}

TEST_CASE("received file names") {
  CHECK(resolve_file_name(std::string("report.pdf"), "id", "text/plain") ==
        "report.pdf");
  CHECK(resolve_file_name(std::string("report"), "id", "application/pdf") ==
        "report.pdf");
  CHECK(resolve_file_name(std::nullopt, "ABC", "image/png") == "ABC.png");
  CHECK(resolve_file_name(std::nullopt, "ABC", "application/x-unknown") ==
        "ABC.bin");
  CHECK(resolve_file_name(std::nullopt, "ABC", kByteMimeType) == "ABC.bin");
}

TEST_CASE("file_info describes regular files only") {
  test_support::TempDir dir;
  const auto path = dir.path() / "photo.png";
  write_file(path, test_support::pattern_bytes(123));

  auto info = file_info(path.string());
  REQUIRE(info);
  CHECK(info->name == "photo.png");
  CHECK(info->size == 123);
  CHECK(info->mime_type == std::optional<std::string>("image/png"));

  const auto plain = dir.path() / "README";
  write_file(plain, {});
  auto plain_info = file_info(plain.string());
  REQUIRE(plain_info);
  CHECK(plain_info->size == 0);
  CHECK_FALSE(plain_info->mime_type);

  CHECK_FALSE(file_info(dir.path().string()));
  CHECK_FALSE(file_info((dir.path() / "missing.txt").string()));
}

TEST_CASE("send_file arrives byte for byte in the output directory") {
  test_support::TempDir source_dir;
  test_support::TempDir output_dir;
  const auto data = test_support::pattern_bytes(4500, 9);
  const auto source = source_dir.path() / "capture.wav";
  write_file(source, data);

  Loopback loop;
  StreamByteOptions options;
  options.topic = "files";
  auto sent = loop.outgoing->send_file(source.string(), options);

  CHECK(sent.name == std::optional<std::string>("capture.wav"));
  CHECK(sent.mime_type == "audio/wav");
  CHECK(sent.total_length == 4500u);

  REQUIRE(loop.readers.size() == 1);
  CHECK(loop.readers[0].info().name == std::optional<std::string>("capture.wav"));
  const std::string written =
      loop.readers[0].write_to_file(output_dir.path().string());
  CHECK(written == (output_dir.path() / "capture.wav").string());
  CHECK(read_file(written) == data);
}

TEST_CASE("write_to_file names and confines the output") {
  test_support::TempDir output_dir;
  Loopback loop;

  StreamByteOptions options;
  options.topic = "files";
  options.id = "STREAM-1";
  options.mime_type = "image/png";
  auto writer = loop.outgoing->stream_bytes(options);
  writer.write(std::vector<uint8_t>{1, 2, 3});
  writer.close();
  REQUIRE(loop.readers.size() == 1);

  SUBCASE("falls back to the stream id") {
    auto path = loop.readers[0].write_to_file(output_dir.path().string());
    CHECK(path == (output_dir.path() / "STREAM-1.png").string());
    CHECK(read_file(path) == std::vector<uint8_t>{1, 2, 3});
  }
  SUBCASE("override keeps only the file name") {
    auto path = loop.readers[0].write_to_file(output_dir.path().string(),
                                              std::string("../../escape.dat"));
    CHECK(path == (output_dir.path() / "escape.dat").string());
  }
}

TEST_CASE("write_to_file rejects a missing directory") {
  test_support::TempDir dir;
  Loopback loop;
  StreamByteOptions options;
  options.topic = "files";
  auto writer = loop.outgoing->stream_bytes(options);
  writer.close();
  REQUIRE(loop.readers.size() == 1);

  try {
    loop.readers[0].write_to_file((dir.path() / "missing").string());
    FAIL("expected NotDirectory");
  } catch (const StreamError &e) {
    CHECK(e.code() == StreamError::Code::NotDirectory);
  }
}

TEST_CASE("send_file on a missing file opens no stream") {
  test_support::TempDir dir;
  Loopback loop;
  StreamByteOptions options;
  options.topic = "files";

  try {
    loop.outgoing->send_file((dir.path() / "missing.bin").string(), options);
    FAIL("expected FileInfoUnavailable");
  } catch (const StreamError &e) {
    CHECK(e.code() == StreamError::Code::FileInfoUnavailable);
  }
  CHECK(loop.outgoing->open_stream_count() == 0);
  CHECK(loop.readers.empty());
}
