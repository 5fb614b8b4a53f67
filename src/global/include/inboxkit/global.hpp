#pragma once

#include <inboxkit/log.hpp>
#include <memory>
#include <system_error>
#include <tl/expected.hpp>
#include <type_traits>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Lets pretend we have "normal" language.
using std::map;
using std::optional;
using std::shared_ptr;
using std::string;
using std::variant;
using std::vector;

/////////////////////////////////////////////////////////////////////

template <class T>
using expected = tl::expected<T, std::error_code>;
using unexpected = tl::unexpected<std::error_code>;

using namespace std::literals;

template <typename... Ts>
struct overload : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

//////////////////////////////////////////////////////////////////////////////////////////

#include <fmt/core.h>
#include <fmt/ranges.h>

#define DEFINE_FMT_FORMATTER(Type, FmtString, ...)                                            \
    template <>                                                                               \
    struct fmt::formatter<Type> {                                                             \
        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator {   \
            return ctx.end();                                                                 \
        }                                                                                     \
        auto format(const Type& arg, format_context& ctx) const -> format_context::iterator { \
            return fmt::format_to(ctx.out(), FmtString, __VA_ARGS__);                         \
        }                                                                                     \
    };

DEFINE_FMT_FORMATTER(std::error_code, "{}:{}", arg.category().name(), arg.message());
