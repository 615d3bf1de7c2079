#include "common/defs.hpp"

#include <climits>
#include <type_traits>

namespace lusitano {

static_assert(CHAR_BIT == 8, "Bytes with a size other than 8 bits are not supported.");
static_assert(std::is_same_v<unsigned char, u8>, "uint8_t must be unsigned char.");
static_assert(sizeof(f64) == 8, "Real numbers are stored as 64 bit doubles.");

} // namespace lusitano
