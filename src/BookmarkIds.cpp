#include "BookmarkIds.hpp"
#include "ParseNumber.hpp"

#include <boost/regex.hpp>

#include <algorithm>
#include <limits>
#include <string>

namespace autocref {
    std::uint32_t StartingBookmarkId(const std::string_view document, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Determining starting bookmark id...");

        // Unbounded digit run: an id too wide for uint32 must fail, not be clipped.
        static const boost::regex pattern(R"(<w:bookmarkStart w:id="([0-9]+))");

        if (document.empty()) {
            Emit(trace, TraceLevel::Debug, "Starting bookmark is 1");
            return 1;
        }

        const char *begin = document.data();
        const char *end = document.data() + document.size();

        bool found = false;
        std::uint32_t highest = 0;

        for (boost::cregex_iterator it(begin, end, pattern), last; it != last; ++it) {
            const auto &id = (*it)[1];
            const std::string_view digits(id.first, static_cast<std::size_t>(id.second - id.first));

            const std::uint32_t value = detail::ParseUnsigned(digits, "existing bookmark id in document.xml");
            highest = found ? std::max(highest, value) : value;
            found = true;
        }

        if (!found) {
            Emit(trace, TraceLevel::Debug, "Starting bookmark is 1");
            return 1;
        }

        if (highest == std::numeric_limits<std::uint32_t>::max())
            throw ParseError("Error parsing existing bookmarks in document.xml: bookmark id " +
                             std::to_string(highest) + " leaves no free id");

        Emit(trace, TraceLevel::Debug, "Starting bookmark is " + std::to_string(highest + 1));
        return highest + 1;
    }
} // namespace autocref
