#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "transport/cancel_token.hpp"
#include "transport/channel_error.hpp"
#include "transport/frame_codec.hpp"
#include "transport/unix_socket.hpp"

namespace transport {

// Backoff between connection attempts while the acceptor is not bound yet.
constexpr std::chrono::milliseconds kRestartDelay{100};

// One decoded message: typed header plus the raw bytes that followed it.
// payload is nullopt when the frame carried no payload bytes.
template <typename Header> struct Message {
  Header header;
  std::optional<std::vector<uint8_t>> payload;
};

// Serializes msg with deterministic map ordering.
// Returns false if protobuf refuses to serialize it.
bool serialize_deterministic(const google::protobuf::MessageLite &msg,
                             std::string &out);

/**
 * @brief Bidirectional framed message connection over a Unix domain socket.
 *
 * Each message is a protobuf header plus an optional opaque payload, framed
 * by frame_codec. Any protobuf message type can be used as header; both ends
 * must agree on it.
 *
 * send() and receive() may be called from different threads. Concurrent
 * senders are serialized so frames never interleave on the wire. close()
 * may be called from any thread and unblocks pending send/receive calls.
 */
class Channel {
public:
  enum class Role { Acceptor, Connector };
  enum class State { Ready, Closed, Failed };

  // Waits for the first peer on socket_path.
  // Throws ChannelError(Cancelled) if cancel fires first.
  static std::unique_ptr<Channel> accept(const std::string &socket_path,
                                         const CancelToken &cancel,
                                         uint32_t max_message_bytes = kMaxMessageBytes);

  // Connects to socket_path, retrying every restart_delay while the acceptor
  // does not exist yet.
  static std::unique_ptr<Channel>
  connect(const std::string &socket_path, const CancelToken &cancel,
          std::chrono::milliseconds restart_delay = kRestartDelay,
          uint32_t max_message_bytes = kMaxMessageBytes);

  Channel(Role role, UnixSocket socket,
          uint32_t max_message_bytes = kMaxMessageBytes);
  ~Channel();

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  // Writes one frame. Throws ChannelError:
  //  - ConnectionClosed if the channel was closed locally
  //  - MessageTooLarge if the frame would exceed the maximum size
  //  - Transport on socket failure
  void send(const google::protobuf::MessageLite &header,
            const std::vector<uint8_t> *payload = nullptr);

  void send(const google::protobuf::MessageLite &header,
            const std::vector<uint8_t> &payload) {
    send(header, &payload);
  }

  // Pulls the next raw frame from the incoming sequence.
  // Returns false at the end of the sequence (clean peer close or local
  // close). Throws ChannelError(CorruptMessage) on malformed frames and
  // ChannelError(Transport) when the connection breaks mid-frame.
  bool receive_frame(Frame &out);

  // Pulls and decodes the next message. nullopt marks the end of the sequence.
  template <typename Header> std::optional<Message<Header>> receive() {
    Frame frame;
    if (!receive_frame(frame)) {
      return std::nullopt;
    }
    Message<Header> msg;
    if (!msg.header.ParseFromString(frame.header_bytes)) {
      fail();
      throw ChannelError(ChannelError::Code::CorruptMessage,
                         "failed to decode message header");
    }
    if (!frame.payload.empty()) {
      msg.payload = std::move(frame.payload);
    }
    return msg;
  }

  // Idempotent.
  void close();

  // Advisory snapshot; a concurrent close or failure may race with it.
  bool is_closed() const { return state_.load() != State::Ready; }
  State state() const { return state_.load(); }
  Role role() const { return role_; }

private:
  void fail();

  Role role_;
  uint32_t max_message_bytes_;
  UnixSocket socket_;
  std::atomic<State> state_{State::Ready};

  std::mutex write_mutex_;

  std::mutex read_mutex_;
  FrameAssembler assembler_;
  std::vector<uint8_t> read_buf_;
};

} // namespace transport
