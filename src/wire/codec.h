#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "message.h"
#include "wire_format.h"

namespace XtSim {
namespace wire {

/// Message field numbers
static constexpr uint32_t kFieldSenderId = 1;
static constexpr uint32_t kFieldXTRequest = 2;
static constexpr uint32_t kFieldVote = 3;
static constexpr uint32_t kFieldDecided = 4;
static constexpr uint32_t kFieldBlock = 5;

/**
 * Serializes msg: sender_id (field 1) followed by the single payload field.
 * A message with an empty payload serializes to the sender_id only.
 */
std::string EncodeMessage(const Message& msg);

/**
 * Parses one serialized message (without the frame prefix).
 * Unknown fields are skipped. If several payload fields are present the
 * last one wins, as with a protobuf oneof.
 * @param msg Output; only meaningful when kOk is returned
 * @return kOk, or the error that made the buffer unparseable
 */
DecodeError DecodeMessage(const uint8_t* data, size_t len, Message* msg);

inline DecodeError DecodeMessage(const std::string& bytes, Message* msg) {
	return DecodeMessage(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), msg);
}

}  // namespace wire
}  // namespace XtSim
