#include "transport/channel.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "logging.hpp"

namespace transport {

namespace {

constexpr size_t kReadChunkBytes = 64 * 1024;

const char *role_name(Channel::Role role) {
  return role == Channel::Role::Acceptor ? "acceptor" : "connector";
}

} // namespace

bool serialize_deterministic(const google::protobuf::MessageLite &msg,
                             std::string &out) {
  out.clear();
  google::protobuf::io::StringOutputStream sink(&out);
  google::protobuf::io::CodedOutputStream coded(&sink);
  coded.SetSerializationDeterministic(true);
  if (!msg.SerializeToCodedStream(&coded)) {
    return false;
  }
  coded.Trim();
  return !coded.HadError();
}

std::unique_ptr<Channel> Channel::accept(const std::string &socket_path,
                                         const CancelToken &cancel,
                                         uint32_t max_message_bytes) {
  UnixSocket sock = accept_first_connection(socket_path, cancel);
  return std::make_unique<Channel>(Role::Acceptor, std::move(sock),
                                   max_message_bytes);
}

std::unique_ptr<Channel> Channel::connect(const std::string &socket_path,
                                          const CancelToken &cancel,
                                          std::chrono::milliseconds restart_delay,
                                          uint32_t max_message_bytes) {
  UnixSocket sock = connect_with_retry(socket_path, cancel, restart_delay);
  return std::make_unique<Channel>(Role::Connector, std::move(sock),
                                   max_message_bytes);
}

Channel::Channel(Role role, UnixSocket socket, uint32_t max_message_bytes)
    : role_(role), max_message_bytes_(max_message_bytes),
      socket_(std::move(socket)), assembler_(max_message_bytes),
      read_buf_(kReadChunkBytes) {}

Channel::~Channel() { close(); }

void Channel::send(const google::protobuf::MessageLite &header,
                   const std::vector<uint8_t> *payload) {
  if (is_closed()) {
    throw ChannelError(ChannelError::Code::ConnectionClosed,
                       "send on closed channel");
  }

  std::string encoded;
  if (!serialize_deterministic(header, encoded)) {
    throw ChannelError(ChannelError::Code::CorruptMessage,
                       "failed to encode message header");
  }

  std::vector<uint8_t> wire;
  std::string err;
  if (!encode_frame(encoded, payload, wire, err, max_message_bytes_)) {
    throw ChannelError(ChannelError::Code::MessageTooLarge, err);
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (is_closed()) {
    throw ChannelError(ChannelError::Code::ConnectionClosed,
                       "send on closed channel");
  }
  try {
    socket_.write_all(wire.data(), wire.size());
  } catch (const ChannelError &) {
    if (state_.load() == State::Closed) {
      throw ChannelError(ChannelError::Code::ConnectionClosed,
                         "channel closed during send");
    }
    fail();
    throw;
  }
}

bool Channel::receive_frame(Frame &out) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  std::string err;

  for (;;) {
    if (assembler_.next(out, err)) {
      return true;
    }
    if (!err.empty()) {
      fail();
      throw ChannelError(ChannelError::Code::CorruptMessage, err);
    }
    if (is_closed()) {
      return false;
    }

    size_t n = 0;
    try {
      n = socket_.read_some(read_buf_.data(), read_buf_.size());
    } catch (const ChannelError &) {
      if (state_.load() == State::Closed) {
        return false;
      }
      fail();
      throw;
    }

    if (n == 0) {
      bool mid_frame = assembler_.buffered() > 0;
      State expected = State::Ready;
      bool peer_closed = state_.compare_exchange_strong(expected, State::Closed);
      if (mid_frame && peer_closed) {
        state_.store(State::Failed);
        throw ChannelError(ChannelError::Code::Transport,
                           "peer closed connection mid-frame");
      }
      if (peer_closed) {
        broadcast_ipc::logging::info(std::string("peer closed ") +
                                     role_name(role_) + " channel");
      }
      socket_.shutdown();
      return false;
    }
    assembler_.append(read_buf_.data(), n);
  }
}

void Channel::close() {
  State expected = State::Ready;
  if (state_.compare_exchange_strong(expected, State::Closed)) {
    broadcast_ipc::logging::debug(std::string("closing ") + role_name(role_) +
                                  " channel");
  }
  socket_.shutdown();
}

void Channel::fail() {
  State expected = State::Ready;
  state_.compare_exchange_strong(expected, State::Failed);
  socket_.shutdown();
}

} // namespace transport
