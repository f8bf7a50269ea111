#include "data_stream/stream_info.hpp"

namespace data_stream {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

void fill_common(const StreamInfo &info, v1::DataStreamHeader &header) {
  header.set_stream_id(info.id);
  header.set_timestamp(to_millis(info.timestamp));
  header.set_topic(info.topic);
  header.set_mime_type(info.mime_type);
  if (info.total_length) {
    header.set_total_length(*info.total_length);
  }
  for (const auto &[key, value] : info.attributes) {
    (*header.mutable_attributes())[key] = value;
  }
}

void read_common(const v1::DataStreamHeader &header, StreamInfo &info) {
  info.id = header.stream_id();
  info.timestamp = from_millis(header.timestamp());
  info.topic = header.topic();
  info.mime_type = header.mime_type();
  if (header.has_total_length()) {
    info.total_length = header.total_length();
  }
  info.attributes.insert(header.attributes().begin(),
                         header.attributes().end());
}

} // namespace

OperationType operation_type_from_proto(v1::OperationType type) {
  switch (type) {
  case v1::OPERATION_TYPE_UPDATE:
    return OperationType::Update;
  case v1::OPERATION_TYPE_DELETE:
    return OperationType::Delete;
  case v1::OPERATION_TYPE_REACTION:
    return OperationType::Reaction;
  default:
    return OperationType::Create;
  }
}

v1::OperationType operation_type_to_proto(OperationType type) {
  switch (type) {
  case OperationType::Update:
    return v1::OPERATION_TYPE_UPDATE;
  case OperationType::Delete:
    return v1::OPERATION_TYPE_DELETE;
  case OperationType::Reaction:
    return v1::OPERATION_TYPE_REACTION;
  case OperationType::Create:
    break;
  }
  return v1::OPERATION_TYPE_CREATE;
}

v1::DataStreamHeader to_header(const ByteStreamInfo &info) {
  v1::DataStreamHeader header;
  fill_common(info, header);
  auto *byte_header = header.mutable_byte_header();
  if (info.name) {
    byte_header->set_name(*info.name);
  }
  return header;
}

v1::DataStreamHeader to_header(const TextStreamInfo &info) {
  v1::DataStreamHeader header;
  fill_common(info, header);
  auto *text_header = header.mutable_text_header();
  text_header->set_operation_type(operation_type_to_proto(info.operation_type));
  text_header->set_version(info.version);
  if (info.reply_to_stream_id) {
    text_header->set_reply_to_stream_id(*info.reply_to_stream_id);
  }
  for (const auto &id : info.attached_stream_ids) {
    text_header->add_attached_stream_ids(id);
  }
  text_header->set_generated(info.generated);
  return header;
}

ByteStreamInfo byte_info_from_header(const v1::DataStreamHeader &header) {
  ByteStreamInfo info;
  read_common(header, info);
  const auto &byte_header = header.byte_header();
  if (!byte_header.name().empty()) {
    info.name = byte_header.name();
  }
  return info;
}

TextStreamInfo text_info_from_header(const v1::DataStreamHeader &header) {
  TextStreamInfo info;
  read_common(header, info);
  const auto &text_header = header.text_header();
  info.operation_type = operation_type_from_proto(text_header.operation_type());
  info.version = text_header.version();
  if (!text_header.reply_to_stream_id().empty()) {
    info.reply_to_stream_id = text_header.reply_to_stream_id();
  }
  info.attached_stream_ids.assign(text_header.attached_stream_ids().begin(),
                                  text_header.attached_stream_ids().end());
  info.generated = text_header.generated();
  return info;
}

} // namespace data_stream
