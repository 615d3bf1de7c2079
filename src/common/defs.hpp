#ifndef LUSITANO_COMMON_DEFS_HPP
#define LUSITANO_COMMON_DEFS_HPP

#include <cstddef>
#include <cstdint>

namespace lusitano {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f64 = double;

using std::size_t;

#if !defined(LUSITANO_DEBUG) && !defined(NDEBUG)
#    define LUSITANO_DEBUG 1
#endif

#if defined(__GNUC__) || defined(__clang__)
#    define LUSITANO_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#    define LUSITANO_COLD __attribute__((cold, noinline))
#elif defined(_MSC_VER)
#    define LUSITANO_UNLIKELY(x) (!!(x))
#    define LUSITANO_COLD __declspec(noinline)
#else
#    define LUSITANO_UNLIKELY(x) (x)
#    define LUSITANO_COLD
#endif

/// Points into the compiler's own source code. Used by errors and failed assertions.
/// All fields are empty in release builds.
struct SourceLocation {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;

    explicit constexpr operator bool() const { return file != nullptr; }
};

#ifdef LUSITANO_DEBUG
#    define LUSITANO_SOURCE_LOCATION() (::lusitano::SourceLocation{__FILE__, __LINE__, __func__})
#else
#    define LUSITANO_SOURCE_LOCATION() (::lusitano::SourceLocation{})
#endif

} // namespace lusitano

#endif // LUSITANO_COMMON_DEFS_HPP
