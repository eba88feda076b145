#pragma once

#include "CrossRefErrors.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace autocref {
    namespace detail {
        // Parses a run of ASCII digits as uint32. Throws ParseError on anything
        // else, including overflow. |what| names the field in the message.
        [[nodiscard]] inline std::uint32_t ParseUnsigned(const std::string_view digits, const char *what) {
            std::uint32_t value = 0;
            const char *first = digits.data();
            const char *last = digits.data() + digits.size();

            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (digits.empty() || ec != std::errc() || ptr != last) {
                const std::string reason = ec == std::errc::result_out_of_range
                                               ? "number too large"
                                               : "invalid digit found in string";
                throw ParseError("Error parsing " + std::string(what) + " \"" +
                                 std::string(digits) + "\": " + reason);
            }
            return value;
        }
    } // namespace detail
} // namespace autocref
