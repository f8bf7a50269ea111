#include "data_stream/channel_link.hpp"

#include "data_stream/stream_error.hpp"
#include "logging.hpp"

namespace data_stream {

namespace logging = ::broadcast_ipc::logging;

ChannelLink::ChannelLink(std::unique_ptr<transport::Channel> channel,
                         std::string local_identity, size_t chunk_size,
                         Executor executor)
    : channel_(std::move(channel)), local_identity_(std::move(local_identity)),
      incoming_(std::move(executor)) {
  // Writers can outlive the link through the outgoing manager; sending on the
  // closed channel then raises ConnectionClosed.
  std::shared_ptr<transport::Channel> ch = channel_;
  const std::string identity = local_identity_;
  outgoing_ = OutgoingStreamManager::create(
      [ch, identity](const v1::DataPacket &packet) {
        v1::DataPacket stamped = packet;
        stamped.set_participant_identity(identity);
        ch->send(stamped);
      },
      chunk_size);
}

ChannelLink::~ChannelLink() {
  close();
  wait();
}

void ChannelLink::start() {
  if (started_.exchange(true)) {
    return;
  }
  pump_thread_ = std::make_unique<std::thread>(&ChannelLink::pump, this);
}

void ChannelLink::wait() {
  if (pump_thread_ && pump_thread_->joinable()) {
    pump_thread_->join();
  }
  incoming_.wait_for_handlers();
}

void ChannelLink::close() { channel_->close(); }

void ChannelLink::pump() {
  try {
    while (auto msg = channel_->receive<v1::DataPacket>()) {
      try {
        incoming_.handle_packet(msg->header);
      } catch (const StreamError &e) {
        logging::warn(std::string("dropping data packet: ") + e.what());
      }
    }
  } catch (const transport::ChannelError &e) {
    logging::error(std::string("data stream channel failed: ") + e.what());
  }
  // No more chunks can arrive for streams left open.
  incoming_.terminate_open_streams();
  logging::debug("data stream pump stopped");
}

} // namespace data_stream
