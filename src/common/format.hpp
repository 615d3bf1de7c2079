#ifndef LUSITANO_COMMON_FORMAT_HPP
#define LUSITANO_COMMON_FORMAT_HPP

#include "common/defs.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

/// Opt into one of the custom formatting interfaces in order to support user defined
/// types in fmt format strings.
///
/// LUSITANO_ENABLE_MEMBER_FORMAT(Type) will opt into the member function interface, i.e. `object.format(FormatStream&)`.
/// LUSITANO_ENABLE_FREE_TO_STRING(Type) will use a free to_string function, i.e. `to_string(object)`.
///
/// The macro invocations must be in the global namespace.
#define LUSITANO_ENABLE_MEMBER_FORMAT(...)                           \
    LUSITANO_ENABLE_FORMAT_MODE_IMPL(LUSITANO_SINGLE_ARG(__VA_ARGS__), \
        ::lusitano::FormatMode::MemberFormat)
#define LUSITANO_ENABLE_FREE_TO_STRING(...) \
    LUSITANO_ENABLE_FORMAT_MODE_IMPL(       \
        LUSITANO_SINGLE_ARG(__VA_ARGS__), ::lusitano::FormatMode::FreeToString)

#define LUSITANO_SINGLE_ARG(...) __VA_ARGS__

#define LUSITANO_ENABLE_FORMAT_MODE_IMPL(Type, Mode)            \
    template<>                                                  \
    struct lusitano::EnableFormatMode<Type> {                   \
        static constexpr ::lusitano::FormatMode value = (Mode); \
    };

namespace lusitano {

enum class FormatMode {
    None,         // Not specialized.
    MemberFormat, // Object has a member function `obj.format(FormatStream&)`.
    FreeToString, // There is a free function `to_string(obj)` that returns a string / string_view / const char*
};

template<typename T, typename Enable = void>
struct EnableFormatMode {
    static constexpr FormatMode value = FormatMode::None;
};

/// Base class for all format streams.
class FormatStream {
public:
    FormatStream() = default;
    virtual ~FormatStream() = default;

    FormatStream(const FormatStream&) = delete;
    FormatStream& operator=(const FormatStream&) = delete;

    template<typename... Args>
    FormatStream& format(std::string_view format_str, const Args&... args) {
        do_vformat(format_str, fmt::make_format_args(args...));
        return *this;
    }

protected:
    virtual void do_vformat(std::string_view format, fmt::format_args args) = 0;
};

/// A stream that outputs all formatted output into a string.
class StringFormatStream final : public FormatStream {
public:
    /// Returns the current output string.
    const std::string& str() const { return buffer_; }

    /// Moves the output string out of the stream. The stream's output buffer will become empty.
    std::string take_str();

private:
    void do_vformat(std::string_view format, fmt::format_args args) override;

private:
    std::string buffer_;
};

/// A stream that appends all formatted output to the given output iterator.
template<typename OutputIterator>
class OutputIteratorStream final : public FormatStream {
public:
    explicit OutputIteratorStream(const OutputIterator& out)
        : out_(out) {}

    ~OutputIteratorStream() = default;

    const OutputIterator& out() const { return out_; }

private:
    void do_vformat(std::string_view format, fmt::format_args args) override {
        out_ = fmt::vformat_to(out_, format, args);
    }

private:
    OutputIterator out_;
};

/// Prefixes every line written to it with `indent` spaces before forwarding it to `base`.
class IndentStream final : public FormatStream {
public:
    IndentStream(FormatStream& base, size_t indent)
        : base_(base)
        , indent_(indent) {}

private:
    void do_vformat(std::string_view format, fmt::format_args args) override;

private:
    FormatStream& base_;
    size_t indent_;
    bool line_start_ = true;
};

template<typename T>
struct Repeat final {
    T value;
    size_t count;

    void format(FormatStream& stream) const {
        for (size_t i = 0; i < count; ++i) {
            stream.format("{}", value);
        }
    }
};

template<typename T>
auto repeat(const T& value, size_t count) {
    return Repeat<T>{value, count};
}

inline auto spaces(size_t count) {
    return repeat(' ', count);
}

template<typename T>
struct EnableFormatMode<Repeat<T>> {
    static constexpr FormatMode value = FormatMode::MemberFormat;
};

namespace detail {

template<typename T>
inline constexpr bool has_custom_format = EnableFormatMode<T>::value != FormatMode::None;

template<typename T, typename Stream>
void call_member_format(const T& value, Stream&& stream) {
    value.format(stream);
}

template<typename T>
auto call_free_to_string(const T& value) {
    return to_string(value);
}

} // namespace detail
} // namespace lusitano

template<typename T>
struct fmt::formatter<T, std::enable_if_t<lusitano::detail::has_custom_format<T>, char>> {

    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const T& value, FormatContext& ctx) const {
        constexpr auto mode = lusitano::EnableFormatMode<T>::value;
        if constexpr (mode == lusitano::FormatMode::MemberFormat) {
            lusitano::OutputIteratorStream stream(ctx.out());
            lusitano::detail::call_member_format(value, stream);
            return stream.out();
        } else {
            return fmt::format_to(ctx.out(), "{}", lusitano::detail::call_free_to_string(value));
        }
    }
};

#endif // LUSITANO_COMMON_FORMAT_HPP
