#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "data_stream/incoming_stream_manager.hpp"
#include "data_stream/outgoing_stream_manager.hpp"
#include "transport/channel.hpp"

namespace data_stream {

/**
 * @brief Runs the data stream layer over one Channel of DataPacket headers.
 *
 * Outgoing packets are stamped with the local identity and sent on the
 * channel. After start(), a pump thread feeds every received packet to the
 * incoming manager. Stream errors raised by a packet are logged and only
 * affect that stream.
 */
class ChannelLink {
public:
  ChannelLink(std::unique_ptr<transport::Channel> channel,
              std::string local_identity,
              size_t chunk_size = kDefaultChunkSize,
              Executor executor = detached_thread_executor());
  ~ChannelLink();

  ChannelLink(const ChannelLink &) = delete;
  ChannelLink &operator=(const ChannelLink &) = delete;

  OutgoingStreamManager &outgoing() { return *outgoing_; }
  IncomingStreamManager &incoming() { return incoming_; }

  // Register handlers before starting, or early streams are dropped.
  void start();

  // Blocks until the peer closes the channel or close() is called, then until
  // every stream handler has returned. Streams still open when the channel
  // ends fail with StreamError(Terminated).
  void wait();

  // Idempotent.
  void close();
  bool is_closed() const { return channel_->is_closed(); }

  const std::string &local_identity() const { return local_identity_; }

private:
  void pump();

  std::shared_ptr<transport::Channel> channel_;
  std::string local_identity_;
  IncomingStreamManager incoming_;
  std::shared_ptr<OutgoingStreamManager> outgoing_;
  std::unique_ptr<std::thread> pump_thread_;
  std::atomic<bool> started_{false};
};

} // namespace data_stream
