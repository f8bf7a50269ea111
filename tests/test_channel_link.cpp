#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <string>
#include <vector>

#include "data_stream/channel_link.hpp"
#include "data_stream/stream_error.hpp"
#include "test_support.hpp"

using namespace data_stream;

namespace {

struct LinkPair {
  std::unique_ptr<ChannelLink> sender;
  std::unique_ptr<ChannelLink> receiver;
};

LinkPair link_pair(size_t chunk_size = kDefaultChunkSize) {
  auto channels = test_support::channel_pair();
  LinkPair links;
  links.sender = std::make_unique<ChannelLink>(std::move(channels.connector),
                                               "alice", chunk_size);
  links.receiver = std::make_unique<ChannelLink>(std::move(channels.acceptor),
                                                 "bob", chunk_size);
  return links;
}

} // namespace

TEST_CASE("text stream crosses the channel with the sender identity") {
  auto links = link_pair();
  std::promise<std::pair<std::string, std::string>> result;
  auto received = result.get_future();
  links.receiver->incoming().register_text_stream_handler(
      "chat", [&result](TextStreamReader reader, const std::string &from) {
        result.set_value({from, reader.read_all()});
      });
  links.receiver->start();
  links.sender->start();

  StreamTextOptions options;
  options.topic = "chat";
  links.sender->outgoing().send_text("hello over the socket", options);

  REQUIRE(received.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  auto [from, text] = received.get();
  CHECK(from == "alice");
  CHECK(text == "hello over the socket");
}

TEST_CASE("large byte stream is chunked and reassembled") {
  auto links = link_pair(4096);
  const auto data = test_support::pattern_bytes(100 * 1024, 3);

  std::promise<std::vector<uint8_t>> result;
  auto received = result.get_future();
  links.receiver->incoming().register_byte_stream_handler(
      "files", [&result](ByteStreamReader reader, const std::string &) {
        result.set_value(reader.read_all());
      });
  links.receiver->start();
  links.sender->start();

  StreamByteOptions options;
  options.topic = "files";
  options.total_size = data.size();
  auto writer = links.sender->outgoing().stream_bytes(options);
  writer.write(data);
  writer.close();

  REQUIRE(received.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  CHECK(received.get() == data);
}

TEST_CASE("closing one side ends the other side's pump") {
  auto links = link_pair();
  links.receiver->start();
  links.sender->start();

  links.sender->close();
  CHECK(links.sender->is_closed());

  auto done = std::async(std::launch::async, [&links]() { links.receiver->wait(); });
  REQUIRE(done.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  CHECK(links.receiver->is_closed());
}

TEST_CASE("close is idempotent and safe before start") {
  auto links = link_pair();
  links.receiver->close();
  links.receiver->close();
  CHECK(links.receiver->is_closed());
  CHECK(links.receiver->local_identity() == "bob");
}

TEST_CASE("wait returns only after handlers finish writing") {
  auto links = link_pair(1024);
  const auto data = test_support::pattern_bytes(16 * 1024, 5);
  std::atomic<size_t> written{0};
  std::atomic<bool> done{false};

  links.receiver->incoming().register_byte_stream_handler(
      "files", [&](ByteStreamReader reader, const std::string &) {
        // Slower than the pump.
        while (auto piece = reader.next()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
          written += piece->size();
        }
        done = true;
      });
  links.receiver->start();
  links.sender->start();

  StreamByteOptions options;
  options.topic = "files";
  options.total_size = data.size();
  auto writer = links.sender->outgoing().stream_bytes(options);
  writer.write(data);
  writer.close();
  links.sender->close();

  links.receiver->wait();
  CHECK(done.load());
  CHECK(written.load() == data.size());
}

TEST_CASE("streams left open when the channel ends are terminated") {
  auto links = link_pair();
  std::promise<std::optional<StreamError::Code>> result;
  auto outcome = result.get_future();
  links.receiver->incoming().register_byte_stream_handler(
      "files", [&result](ByteStreamReader reader, const std::string &) {
        try {
          reader.read_all();
          result.set_value(std::nullopt);
        } catch (const StreamError &e) {
          result.set_value(e.code());
        }
      });
  links.receiver->start();
  links.sender->start();

  StreamByteOptions options;
  options.topic = "files";
  auto writer = links.sender->outgoing().stream_bytes(options);
  writer.write(std::vector<uint8_t>{1, 2, 3});
  REQUIRE(test_support::wait_for(
      [&links]() { return links.receiver->incoming().open_stream_count() == 1; }));
  links.sender->close();

  links.receiver->wait();
  REQUIRE(outcome.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  CHECK(outcome.get() ==
        std::optional<StreamError::Code>(StreamError::Code::Terminated));
}

TEST_CASE("writers kept past the link see a closed channel") {
  auto links = link_pair();
  links.receiver->start();
  links.sender->start();

  std::shared_ptr<OutgoingStreamManager> outgoing =
      links.sender->outgoing().shared_from_this();
  StreamByteOptions options;
  options.topic = "files";
  auto writer = outgoing->stream_bytes(options);

  links.sender.reset();

  try {
    writer.write(std::vector<uint8_t>{1, 2, 3});
    FAIL("expected ConnectionClosed");
  } catch (const transport::ChannelError &e) {
    CHECK(e.code() == transport::ChannelError::Code::ConnectionClosed);
  }
}
