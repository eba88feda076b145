#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace autocref {
    enum class TraceLevel {
        Trace,
        Debug,
        Info,
        Warning
    };

    // Diagnostic sink handed to every pipeline stage.
    //   level   : severity of the message
    //   message : UTF-8 text, no trailing newline
    // An empty sink discards everything.
    using TraceSink = std::function<void(TraceLevel level, const std::string &message)>;

    inline void Emit(const TraceSink &sink, const TraceLevel level, const std::string &message) {
        if (sink)
            sink(level, message);
    }

    // Shortens long segment text for trace output.
    [[nodiscard]] inline std::string Excerpt(const std::string_view text, const std::size_t maxBytes = 60) {
        if (text.size() <= maxBytes)
            return std::string(text);

        std::size_t cut = maxBytes;
        // do not split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0b11000000) == 0b10000000)
            --cut;
        return std::string(text.substr(0, cut)) + "...";
    }
} // namespace autocref
