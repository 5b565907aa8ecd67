#pragma once

extern "C" {
#include <secp256k1.h>
}

namespace frostcoord {

// Shared sign+verify context, created on first use.
secp256k1_context* SecpContext();

}  // namespace frostcoord
