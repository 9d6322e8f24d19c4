#ifndef PEERDROP_PEER_ID_HPP
#define PEERDROP_PEER_ID_HPP

#include <string>

namespace peerdrop {
namespace session {

// Human friendly id such as "happy-apple-sunset"
std::string generate_peer_id();

// 1..64 characters of [A-Za-z0-9_-], alphanumeric at both ends
bool is_valid_peer_id(const std::string& id);

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_PEER_ID_HPP
