#include "wire_format.h"

namespace XtSim {
namespace wire {

const char* DecodeErrorName(DecodeError err) {
	switch (err) {
		case DecodeError::kOk:
			return "Ok";
		case DecodeError::kMalformedVarint:
			return "MalformedVarint";
		case DecodeError::kTruncatedMessage:
			return "TruncatedMessage";
		case DecodeError::kInvalidWireType:
			return "InvalidWireType";
	}
	return "Unknown";
}

size_t VarintSize(uint64_t value) {
	size_t n = 1;
	while (value >= 0x80) {
		value >>= 7;
		++n;
	}
	return n;
}

void AppendVarint(uint64_t value, std::string* out) {
	while (value >= 0x80) {
		out->push_back(static_cast<char>((value & 0x7F) | 0x80));
		value >>= 7;
	}
	out->push_back(static_cast<char>(value));
}

void AppendTag(uint32_t field_number, WireType type, std::string* out) {
	AppendVarint(MakeTag(field_number, type), out);
}

void AppendLengthDelimited(uint32_t field_number, const std::string& bytes, std::string* out) {
	AppendTag(field_number, kWireLengthDelimited, out);
	AppendVarint(bytes.size(), out);
	out->append(bytes);
}

void AppendVarintField(uint32_t field_number, uint64_t value, std::string* out) {
	AppendTag(field_number, kWireVarint, out);
	AppendVarint(value, out);
}

DecodeError ReadVarint(const uint8_t* data, size_t len, size_t* pos, uint64_t* value) {
	uint64_t result = 0;
	size_t p = *pos;
	for (size_t i = 0; i < kMaxVarintBytes; ++i) {
		if (p >= len) {
			return DecodeError::kMalformedVarint;
		}
		uint8_t byte = data[p++];
		result |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
		if ((byte & 0x80) == 0) {
			*pos = p;
			*value = result;
			return DecodeError::kOk;
		}
	}
	return DecodeError::kMalformedVarint;
}

DecodeError FieldReader::ReadTag(uint32_t* field_number, WireType* type) {
	uint64_t tag;
	DecodeError err = ReadVarint(&tag);
	if (err != DecodeError::kOk) {
		return err;
	}
	uint32_t wire_type = static_cast<uint32_t>(tag & 0x7);
	if (wire_type == kWireStartGroup || wire_type == kWireEndGroup || wire_type > kWireFixed32) {
		return DecodeError::kInvalidWireType;
	}
	*field_number = static_cast<uint32_t>(tag >> 3);
	*type = static_cast<WireType>(wire_type);
	return DecodeError::kOk;
}

DecodeError FieldReader::ReadVarint(uint64_t* value) {
	return wire::ReadVarint(data_, len_, &pos_, value);
}

DecodeError FieldReader::ReadBool(bool* value) {
	uint64_t v;
	DecodeError err = ReadVarint(&v);
	if (err == DecodeError::kOk) {
		*value = (v != 0);
	}
	return err;
}

DecodeError FieldReader::ReadUint32(uint32_t* value) {
	uint64_t v;
	DecodeError err = ReadVarint(&v);
	if (err == DecodeError::kOk) {
		// uint32 fields keep the low 32 bits, as protobuf parsers do
		*value = static_cast<uint32_t>(v);
	}
	return err;
}

DecodeError FieldReader::ReadLengthDelimited(const uint8_t** data, size_t* len) {
	uint64_t length;
	DecodeError err = ReadVarint(&length);
	if (err != DecodeError::kOk) {
		return err;
	}
	if (length > len_ - pos_) {
		return DecodeError::kTruncatedMessage;
	}
	*data = data_ + pos_;
	*len = static_cast<size_t>(length);
	pos_ += static_cast<size_t>(length);
	return DecodeError::kOk;
}

DecodeError FieldReader::ReadBytes(std::string* out) {
	const uint8_t* data;
	size_t len;
	DecodeError err = ReadLengthDelimited(&data, &len);
	if (err == DecodeError::kOk) {
		out->assign(reinterpret_cast<const char*>(data), len);
	}
	return err;
}

DecodeError FieldReader::Skip(WireType type) {
	switch (type) {
		case kWireVarint: {
			uint64_t ignored;
			return ReadVarint(&ignored);
		}
		case kWireLengthDelimited: {
			const uint8_t* ignored;
			size_t len;
			return ReadLengthDelimited(&ignored, &len);
		}
		case kWireFixed64:
		case kWireFixed32: {
			size_t width = (type == kWireFixed64) ? 8 : 4;
			if (width > len_ - pos_) {
				return DecodeError::kTruncatedMessage;
			}
			pos_ += width;
			return DecodeError::kOk;
		}
		default:
			return DecodeError::kInvalidWireType;
	}
}

}  // namespace wire
}  // namespace XtSim
