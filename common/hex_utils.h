#ifndef BBS_MSGBASE_HEX_UTILS_H
#define BBS_MSGBASE_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bbs::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string StringToHex(std::string_view text);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
bool HexToString(std::string_view hex, std::string& out);

}  // namespace bbs::common

#endif  // BBS_MSGBASE_HEX_UTILS_H
