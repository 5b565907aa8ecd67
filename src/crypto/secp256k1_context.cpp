#include "frostcoord/crypto/secp256k1_context.hpp"

#include <stdexcept>

namespace frostcoord {

secp256k1_context* SecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created =
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

}  // namespace frostcoord
