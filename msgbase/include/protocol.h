#ifndef BBS_MSGBASE_PROTOCOL_H
#define BBS_MSGBASE_PROTOCOL_H

#include <cstdint>
#include <string>
#include <vector>

// Little-endian primitives for the values kept in the state store.
namespace bbs::msgbase::proto {

bool WriteUint8(std::uint8_t v, std::vector<std::uint8_t>& out);
bool ReadUint8(const std::vector<std::uint8_t>& data, std::size_t& offset,
               std::uint8_t& out);

bool WriteUint32(std::uint32_t v, std::vector<std::uint8_t>& out);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t& offset,
                std::uint32_t& out);

bool WriteUint64(std::uint64_t v, std::vector<std::uint8_t>& out);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t& offset,
                std::uint64_t& out);

bool WriteInt64(std::int64_t v, std::vector<std::uint8_t>& out);
bool ReadInt64(const std::vector<std::uint8_t>& data, std::size_t& offset,
               std::int64_t& out);

// u16 length prefix; fails above 65535 bytes.
bool WriteString(const std::string& s, std::vector<std::uint8_t>& out);
bool ReadString(const std::vector<std::uint8_t>& data, std::size_t& offset,
                std::string& out);

// u32 length prefix.
bool WriteLongString(const std::string& s, std::vector<std::uint8_t>& out);
bool ReadLongString(const std::vector<std::uint8_t>& data, std::size_t& offset,
                    std::string& out);

}  // namespace bbs::msgbase::proto

#endif  // BBS_MSGBASE_PROTOCOL_H
