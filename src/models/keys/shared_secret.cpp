#include "peerlink/models/keys/shared_secret.hpp"

namespace peerlink::transfer::models {
    SharedSecret::SharedSecret(crypto::SecureMemoryHandle handle)
        : handle_(std::move(handle)) {
    }
}
