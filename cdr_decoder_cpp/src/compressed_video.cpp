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
#include "cdr_decoder_cpp/compressed_video.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include "cdr_decoder_cpp/exceptions.hpp"
#include "rcutils/logging_macros.h"

namespace cdr_decoder_cpp
{

RecordSpec RecordTraits<Timestamp>::spec()
{
  return RecordSpec("Timestamp")
         .field("sec", cdr::UInt32())
         .field("nsec", cdr::UInt32());
}

Timestamp RecordTraits<Timestamp>::materialize(const DynamicValue & value)
{
  Timestamp t;
  t.sec = value.at("sec").as<uint32_t>();
  t.nsec = value.at("nsec").as<uint32_t>();
  return t;
}

RecordSpec RecordTraits<CompressedVideo>::spec()
{
  return RecordSpec("CompressedVideo")
         .field("timestamp", cdr::Record(RecordTraits<Timestamp>::spec()))
         .field("frame_id", cdr::Str())
         .field("data", cdr::Bytes())
         .field("format", cdr::Str());
}

CompressedVideo RecordTraits<CompressedVideo>::materialize(const DynamicValue & value)
{
  CompressedVideo video;
  video.timestamp = RecordTraits<Timestamp>::materialize(value.at("timestamp"));
  video.frame_id = value.at("frame_id").as_string();
  video.data = value.at("data").as_bytes();
  video.format = value.at("format").as_string();
  return video;
}

void register_video_schemas(SchemaRegistry & registry)
{
  registry.register_record<CompressedVideo>(COMPRESSED_VIDEO_SCHEMA_NAME);
}

namespace
{
bool is_video_message(const LoggedMessage & message)
{
  return message.schema_name == COMPRESSED_VIDEO_SCHEMA_NAME;
}

/// Returns false, after logging, if message could not be decoded.
bool try_decode_video(
  const LoggedMessage & message, const DecoderOptions & options, CompressedVideo * video)
{
  try {
    *video = deserialize_as<CompressedVideo>(message.data.data(), message.data.size(), options);
  } catch (const DeserializationException & e) {
    RCUTILS_LOG_WARN_NAMED(
      "cdr_decoder_cpp", "skipping message on '%s' published at %llu: %s: %s",
      message.topic.c_str(), static_cast<unsigned long long>(message.publish_time),
      to_string(e.kind()), e.what());
    return false;
  }
  return true;
}
}  // namespace

std::set<std::string> find_video_topics(MessageSource & source)
{
  std::set<std::string> topics;
  LoggedMessage message;
  source.reset();
  while (source.read_next(message)) {
    if (is_video_message(message)) {
      topics.insert(message.topic);
    }
  }
  return topics;
}

uint64_t get_topic_duration(
  MessageSource & source, const std::string & topic, const DecoderOptions & options)
{
  bool have_first = false;
  uint64_t first_timestamp = 0;
  uint64_t last_timestamp = 0;
  size_t n_frames = 0;

  LoggedMessage message;
  CompressedVideo video;
  source.reset();
  while (source.read_next(message)) {
    if (!is_video_message(message) || message.topic != topic) {
      continue;
    }
    if (!try_decode_video(message, options, &video)) {
      continue;
    }
    if (!have_first) {
      first_timestamp = video.timestamp.nanoseconds();
      have_first = true;
    }
    last_timestamp = video.timestamp.nanoseconds();
    n_frames++;
  }

  if (n_frames < 2 || last_timestamp < first_timestamp) {
    return 0;
  }
  return (last_timestamp - first_timestamp) / NANOSECONDS_PER_SECOND;
}

ExtractionResult extract_video(
  MessageSource & source, const std::string & topic, FrameSink & sink,
  const DecoderOptions & options)
{
  ExtractionResult result;
  bool have_previous = false;
  uint64_t previous_publish_time = 0;

  LoggedMessage message;
  CompressedVideo video;
  source.reset();
  while (source.read_next(message)) {
    if (!is_video_message(message) || message.topic != topic) {
      continue;
    }
    if (!try_decode_video(message, options, &video)) {
      result.messages_skipped++;
      continue;
    }

    VideoFrame frame;
    frame.pts = message.publish_time;
    frame.dts = message.publish_time;
    if (have_previous) {
      int64_t delta = static_cast<int64_t>(message.publish_time - previous_publish_time);
      frame.duration = static_cast<uint64_t>(std::max<int64_t>(1, delta));
    } else {
      frame.duration = FIRST_FRAME_DURATION;
    }
    frame.data = std::move(video.data);

    if (!sink.push_frame(frame)) {
      RCUTILS_LOG_ERROR_NAMED(
        "cdr_decoder_cpp", "sink refused frame %zu of '%s', stopping",
        result.frames_written, topic.c_str());
      result.sink_refused_frame = true;
      break;
    }
    previous_publish_time = message.publish_time;
    have_previous = true;
    result.frames_written++;
  }

  sink.end_of_stream();
  return result;
}

std::string output_filename_for_topic(const std::string & topic)
{
  std::string name = topic;
  std::replace(name.begin(), name.end(), '/', '_');
  return name + ".mp4";
}

}  // namespace cdr_decoder_cpp
