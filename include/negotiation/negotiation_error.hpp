#ifndef PEERDROP_NEGOTIATION_ERROR_HPP
#define PEERDROP_NEGOTIATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop {
namespace negotiation {

// Peer not found, remote error or leave, candidate exchange or engine failure
class NegotiationError : public std::runtime_error {
public:
    explicit NegotiationError(const std::string& message)
        : std::runtime_error("Negotiation error: " + message) {}
};

class NegotiationTimeout : public NegotiationError {
public:
    explicit NegotiationTimeout(const std::string& message)
        : NegotiationError("timed out " + message) {}
};

class NegotiationCancelled : public NegotiationError {
public:
    NegotiationCancelled()
        : NegotiationError("cancelled") {}
};

} // namespace negotiation
} // namespace peerdrop

#endif // PEERDROP_NEGOTIATION_ERROR_HPP
