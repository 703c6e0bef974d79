#include "clseg/metadata.hpp"

#include <array>
#include <format>
#include <fstream>
#include <optional>
#include <system_error>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <sndfile.hh>

namespace clseg {

namespace {

using nlohmann::json;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::runtime_error;
using std::string, std::string_view;

constexpr std::array sndfile_string_tags{
  std::pair{SF_STR_TITLE,       string_view("title")},
  std::pair{SF_STR_COPYRIGHT,   string_view("copyright")},
  std::pair{SF_STR_SOFTWARE,    string_view("software")},
  std::pair{SF_STR_ARTIST,      string_view("artist")},
  std::pair{SF_STR_COMMENT,     string_view("comment")},
  std::pair{SF_STR_DATE,        string_view("date")},
  std::pair{SF_STR_ALBUM,       string_view("album")},
  std::pair{SF_STR_LICENSE,     string_view("license")},
  std::pair{SF_STR_TRACKNUMBER, string_view("tracknumber")},
  std::pair{SF_STR_GENRE,       string_view("genre")}
};

// Deletes a staged file on scope exit unless it was committed.
class staged_file {
  path file_;
  bool committed_ = false;

public:
  explicit staged_file(path file) : file_(std::move(file)) {}

  staged_file(const staged_file&) = delete;
  staged_file& operator=(const staged_file&) = delete;

  ~staged_file()
  {
    if (committed_) return;
    std::error_code ec;
    std::filesystem::remove(file_, ec);
  }

  void commit(path const &target)
  {
    std::filesystem::rename(file_, target);
    committed_ = true;
  }
};

}

expected<metadata_record, string>
extract_metadata(path const &file, segment_config const &config)
{
  SndfileHandle sf(file.string());
  if (sf.error()) {
    return unexpected("Failed to open audio file: " + file.generic_string());
  }

  metadata_record record;
  for (auto const &[type, key]: sndfile_string_tags) {
    if (const char *value = sf.getString(type); value && *value)
      record.emplace(key, value);
  }

  record["source_file"]         = file.filename().string();
  record["source_sample_rate"]  = std::to_string(sf.samplerate());
  record["source_channels"]     = std::to_string(sf.channels());
  record["source_frames"]       = std::to_string(sf.frames());
  record["segmentation_method"] = string(to_string(config.method));
  record["min_length"]          = std::format("{}", config.min_length);
  record["fade_duration_ms"]    = std::to_string(config.fade_duration_ms);
  record["fade_curve"]          = string(to_string(config.curve));
  record["filter"]              = std::format("{} {} Hz", to_string(config.filter_kind),
                                              config.filter_frequency);
  record["normalisation"]       = std::format("{} {} dB", to_string(config.normalisation),
                                              config.normalisation_level);

  return record;
}

void stamp_metadata(path const &file, metadata_record const &record)
{
  SndfileHandle in(file.string());
  if (in.error()) {
    throw runtime_error("Failed to open audio file: " + file.generic_string());
  }

  // Raw sample values: integer PCM survives the rewrite bit for bit.
  in.command(SFC_SET_NORM_FLOAT, nullptr, SF_FALSE);

  const auto channels = static_cast<std::size_t>(in.channels());
  std::vector<float> samples(static_cast<std::size_t>(in.frames()) * channels);
  const sf_count_t frames = in.readf(samples.data(), in.frames());
  if (frames != in.frames()) {
    throw runtime_error("Failed to read audio data from file: " + file.generic_string());
  }

  path staged_path = file;
  staged_path += ".tags";

  // Only a file this call created may be cleaned up.
  std::optional<staged_file> staged;
  {
    SndfileHandle out(staged_path.string(), SFM_WRITE, in.format(), in.channels(), in.samplerate());
    if (out.error() != SF_ERR_NO_ERROR)
      throw runtime_error(staged_path.generic_string() + ": " + out.strError());
    staged.emplace(staged_path);

    out.command(SFC_SET_NORM_FLOAT, nullptr, SF_FALSE);
    out.command(SFC_SET_ADD_PEAK_CHUNK, nullptr, SF_FALSE);

    for (auto const &[type, key]: sndfile_string_tags) {
      auto it = record.find(string(key));
      if (it == record.end() || it->second.empty()) continue;
      if (out.setString(type, it->second.c_str()) != SF_ERR_NO_ERROR)
        throw runtime_error(std::format("{}: cannot set tag '{}': {}",
                                        file.generic_string(), key, out.strError()));
    }

    if (out.writef(samples.data(), frames) != frames)
      throw runtime_error(std::format("{}: short write while tagging",
                                      file.generic_string()));
  }

  staged->commit(file);
}

path export_metadata(metadata_record const &record,
  path const &base_path, string_view kind
) {
  path out_path = base_path;
  out_path += std::format("_{}.json", kind);

  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(out_path, std::ios::trunc);

  out << json(record).dump(2) << '\n';

  return out_path;
}

}
