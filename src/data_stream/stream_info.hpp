#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "data_stream.pb.h"

namespace data_stream {

namespace v1 = ::broadcast_ipc::v1;

constexpr const char *kTextMimeType = "text/plain";
constexpr const char *kByteMimeType = "application/octet-stream";

using Attributes = std::map<std::string, std::string>;

// Metadata shared by every stream, fixed when the stream is opened.
struct StreamInfo {
  std::string id;
  std::string mime_type;
  std::string topic;
  std::chrono::system_clock::time_point timestamp;
  std::optional<uint64_t> total_length;
  Attributes attributes;
};

struct ByteStreamInfo : StreamInfo {
  std::optional<std::string> name;
};

enum class OperationType { Create = 0, Update, Delete, Reaction };

struct TextStreamInfo : StreamInfo {
  OperationType operation_type = OperationType::Create;
  int32_t version = 0;
  std::optional<std::string> reply_to_stream_id;
  std::vector<std::string> attached_stream_ids;
  bool generated = false;
};

v1::DataStreamHeader to_header(const ByteStreamInfo &info);
v1::DataStreamHeader to_header(const TextStreamInfo &info);

// The header must carry the matching content header.
ByteStreamInfo byte_info_from_header(const v1::DataStreamHeader &header);
TextStreamInfo text_info_from_header(const v1::DataStreamHeader &header);

OperationType operation_type_from_proto(v1::OperationType type);
v1::OperationType operation_type_to_proto(OperationType type);

} // namespace data_stream
