#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "clseg/config.hpp"

namespace clseg {

// Descriptive key/value pairs for one source file. Keys named after libsndfile
// string tags ("title", "artist", "comment", ...) are stamped into audio files;
// every key goes into the JSON side-car.
using metadata_record = std::map<std::string, std::string>;

// Tags of the source file plus its format and the segmentation parameters.
[[nodiscard]] std::expected<metadata_record, std::string>
extract_metadata(std::filesystem::path const &file, segment_config const &config);

// Rewrite an existing audio file with the record's tags, keeping its format
// and samples. Throws std::runtime_error on I/O failure.
void stamp_metadata(std::filesystem::path const &file, metadata_record const &record);

// Writes <base_path>_<kind>.json and returns its path. Throws on I/O failure.
std::filesystem::path
export_metadata(metadata_record const &record,
  std::filesystem::path const &base_path, std::string_view kind
);

}
