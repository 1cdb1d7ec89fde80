// Copyright 2026 The cdr_decoder_cpp Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef CDR_DECODER_CPP__COMPRESSED_VIDEO_HPP_
#define CDR_DECODER_CPP__COMPRESSED_VIDEO_HPP_

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "cdr_decoder_cpp/options.hpp"
#include "cdr_decoder_cpp/record_traits.hpp"
#include "cdr_decoder_cpp/schema_registry.hpp"

namespace cdr_decoder_cpp
{

constexpr const char COMPRESSED_VIDEO_SCHEMA_NAME[] = "foxglove.CompressedVideo";

constexpr uint64_t NANOSECONDS_PER_SECOND = 1000000000ull;
/// Duration given to the first frame of a topic, when no previous frame can be measured.
constexpr uint64_t FIRST_FRAME_DURATION = NANOSECONDS_PER_SECOND / 30;

struct Timestamp
{
  uint32_t sec;
  uint32_t nsec;

  uint64_t nanoseconds() const {return sec * NANOSECONDS_PER_SECOND + nsec;}
};

struct CompressedVideo
{
  Timestamp timestamp;
  std::string frame_id;
  std::vector<uint8_t> data;
  std::string format;
};

template<>
struct RecordTraits<Timestamp>
{
  static RecordSpec spec();
  static Timestamp materialize(const DynamicValue & value);
};

template<>
struct RecordTraits<CompressedVideo>
{
  static RecordSpec spec();
  static CompressedVideo materialize(const DynamicValue & value);
};

/// Register the video schemas under their log schema names.
void register_video_schemas(SchemaRegistry & registry);

/// One message as stored in a log container.
struct LoggedMessage
{
  std::string schema_name;
  std::string topic;
  std::vector<uint8_t> data;
  /// nanoseconds
  uint64_t publish_time = 0;
};

/// Sequential access to the messages of a log, in log order.
class MessageSource
{
public:
  virtual ~MessageSource() = default;

  /// Rewind to the first message.
  virtual void reset() = 0;

  /// Fill message with the next message. Returns false at the end of the log.
  virtual bool read_next(LoggedMessage & message) = 0;
};

/// Timestamps and durations are in nanoseconds.
struct VideoFrame
{
  std::vector<uint8_t> data;
  uint64_t pts;
  uint64_t dts;
  uint64_t duration;
};

/// Receives encoded frames, e.g. a muxer writing a container file.
class FrameSink
{
public:
  virtual ~FrameSink() = default;

  /// Returns false if the frame was refused; no further frames are pushed after that.
  virtual bool push_frame(const VideoFrame & frame) = 0;

  virtual void end_of_stream() = 0;
};

struct ExtractionResult
{
  size_t frames_written = 0;
  /// messages on the topic that could not be decoded
  size_t messages_skipped = 0;
  bool sink_refused_frame = false;
};

/// Topics carrying COMPRESSED_VIDEO_SCHEMA_NAME messages, sorted.
std::set<std::string> find_video_topics(MessageSource & source);

/// Whole seconds between the embedded timestamps of the first and the last decodable
/// frame on topic. 0 with fewer than two frames or if the last is before the first.
uint64_t get_topic_duration(
  MessageSource & source, const std::string & topic,
  const DecoderOptions & options = DecoderOptions{});

/// Push every decodable frame on topic to sink, timed by the publish time of its
/// message. Undecodable messages are skipped. end_of_stream() is always signalled.
ExtractionResult extract_video(
  MessageSource & source, const std::string & topic, FrameSink & sink,
  const DecoderOptions & options = DecoderOptions{});

/// "/camera/front" -> "_camera_front.mp4"
std::string output_filename_for_topic(const std::string & topic);

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__COMPRESSED_VIDEO_HPP_
