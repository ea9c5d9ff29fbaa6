#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Protobuf-compatible wire primitives for the shared publisher protocol.
 * Only the subset the protocol needs is produced (varint and
 * length-delimited); fixed32/fixed64 are understood so they can be skipped.
 */

namespace XtSim {
namespace wire {

enum WireType : uint8_t {
	kWireVarint = 0,
	kWireFixed64 = 1,
	kWireLengthDelimited = 2,
	kWireStartGroup = 3,
	kWireEndGroup = 4,
	kWireFixed32 = 5,
};

enum class DecodeError {
	kOk = 0,
	kMalformedVarint,   // buffer ended inside a varint, or varint longer than 10 bytes
	kTruncatedMessage,  // declared length runs past the end of the buffer
	kInvalidWireType,   // groups and reserved wire types are not supported
};

const char* DecodeErrorName(DecodeError err);

static constexpr size_t kMaxVarintBytes = 10;

inline constexpr uint32_t MakeTag(uint32_t field_number, WireType type) {
	return (field_number << 3) | static_cast<uint32_t>(type);
}

size_t VarintSize(uint64_t value);

void AppendVarint(uint64_t value, std::string* out);

void AppendTag(uint32_t field_number, WireType type, std::string* out);

// Tag, varint length, then the raw bytes. The length is always a full varint.
void AppendLengthDelimited(uint32_t field_number, const std::string& bytes, std::string* out);

void AppendVarintField(uint32_t field_number, uint64_t value, std::string* out);

inline void AppendBoolField(uint32_t field_number, bool value, std::string* out) {
	AppendVarintField(field_number, value ? 1 : 0, out);
}

/**
 * Decodes one varint starting at data[*pos]; advances *pos past it.
 * On error *pos and *value are left untouched.
 */
DecodeError ReadVarint(const uint8_t* data, size_t len, size_t* pos, uint64_t* value);

/**
 * Cursor over the tag/value pairs of one serialized message.
 */
class FieldReader {
	public:
		FieldReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
		explicit FieldReader(const std::string& bytes)
			: data_(reinterpret_cast<const uint8_t*>(bytes.data())), len_(bytes.size()) {}

		bool Done() const { return pos_ >= len_; }

		DecodeError ReadTag(uint32_t* field_number, WireType* type);
		DecodeError ReadVarint(uint64_t* value);
		DecodeError ReadBool(bool* value);
		DecodeError ReadUint32(uint32_t* value);

		// Length-delimited value; *data points into the underlying buffer.
		DecodeError ReadLengthDelimited(const uint8_t** data, size_t* len);
		DecodeError ReadBytes(std::string* out);

		// Skips the value that follows a tag of the given wire type.
		DecodeError Skip(WireType type);

	private:
		const uint8_t* data_;
		size_t len_;
		size_t pos_ = 0;
};

}  // namespace wire
}  // namespace XtSim
