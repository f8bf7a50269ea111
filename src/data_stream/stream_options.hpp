#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "data_stream/stream_info.hpp"

namespace data_stream {

struct StreamTextOptions {
  std::string topic;
  Attributes attributes;
  std::vector<std::string> destination_identities;
  std::optional<std::string> id; // random UUID when unset

  int32_t version = 0;
  std::vector<std::string> attached_stream_ids;
  std::optional<std::string> reply_to_stream_id;
};

struct StreamByteOptions {
  std::string topic;
  Attributes attributes;
  std::vector<std::string> destination_identities;
  std::optional<std::string> id; // random UUID when unset

  std::optional<std::string> mime_type;
  std::optional<std::string> name;
  std::optional<uint64_t> total_size;
};

} // namespace data_stream
